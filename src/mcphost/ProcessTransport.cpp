//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessTransport.cpp
// Purpose: Child-process transport implementation (fork/exec, epoll reader, writer queue, timeouts)
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <csignal>
#include <cstring>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <format>
#include <future>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcphost/JSONRPCTypes.h"
#include "mcphost/ProcessTransport.hpp"
#include "mcphost/Protocol.h"
#include "mcphost/errors/Errors.h"

namespace mcphost {

namespace {
std::once_flag gSigpipeOnce;

void ignoreSigpipe() {
    // A server that dies mid-write must surface as EPIPE, not terminate the host
    std::call_once(gSigpipeOnce, []() { ::signal(SIGPIPE, SIG_IGN); });
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool setNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

std::string describeCommand(const CommandSpec& cmd) {
    std::string out = cmd.program;
    for (const auto& a : cmd.args) {
        out += ' ';
        out += a;
    }
    return out;
}
} // namespace

class ProcessTransport::Impl {
public:
    struct Pending {
        std::promise<std::unique_ptr<JSONRPCResponse>> promise;
        std::chrono::steady_clock::time_point deadline;
        bool terminateOnTimeout{false};
    };

    CommandSpec command;
    std::map<std::string, std::string> environment;
    Options options;
    std::unique_ptr<IContentFramer> framer;

    std::atomic<bool> started{false};
    std::atomic<bool> connected{false};
    std::atomic<bool> closing{false};
    std::atomic<bool> writerRunning{false};
    std::atomic<bool> timeoutRunning{false};
    std::atomic<bool> disconnectFired{false};
    std::string sessionId;

    pid_t pid{-1};
    int stdinFd{-1};
    int stdoutFd{-1};
    int stderrFd{-1};
    int wakeEventFd{-1};

    std::thread readerThread;
    std::thread writerThread;
    std::thread timeoutThread;

    mutable std::mutex handlerMutex;
    ITransport::NotificationHandler notificationHandler;
    ITransport::ErrorHandler errorHandler;
    ITransport::DisconnectHandler disconnectHandler;

    std::mutex requestMutex;
    std::condition_variable cvTimeout;
    std::unordered_map<std::string, Pending> pendingRequests;
    std::atomic<unsigned int> requestCounter{0u};

    std::mutex writeMutex; // protects writeQueue and queuedBytes
    std::condition_variable cvWrite;
    std::deque<std::string> writeQueue;
    std::size_t queuedBytes{0};

    mutable std::mutex diagMutex;
    std::string stderrRing;

    std::mutex reapMutex;
    bool reaped{false};
    std::optional<int> exitCode;
    std::optional<int> exitSignal;

    std::mutex closeMutex;

    Impl(CommandSpec cmd, std::map<std::string, std::string> env, Options opts)
        : command(std::move(cmd)), environment(std::move(env)), options(std::move(opts)) {
        framer = MakeFramer(options.framing, options.maxMessageBytes);
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "process-" + std::to_string(dis(gen));
    }

    ~Impl() {
        closeFd(stdinFd);
        closeFd(stdoutFd);
        closeFd(stderrFd);
        closeFd(wakeEventFd);
    }

    //////////////////////////////////////////// Spawn ////////////////////////////////////////////
    void spawn() {
        ignoreSigpipe();

        int inPipe[2]{-1, -1};
        int outPipe[2]{-1, -1};
        int errPipe[2]{-1, -1};
        int statusPipe[2]{-1, -1};
        auto closeAll = [&]() {
            for (int* p : {inPipe, outPipe, errPipe, statusPipe}) {
                closeFd(p[0]);
                closeFd(p[1]);
            }
        };
        if (::pipe2(inPipe, O_CLOEXEC) != 0 || ::pipe2(outPipe, O_CLOEXEC) != 0 ||
            ::pipe2(errPipe, O_CLOEXEC) != 0 || ::pipe2(statusPipe, O_CLOEXEC) != 0) {
            const int err = errno;
            closeAll();
            throw HostError(ErrorKind::SpawnFailed, std::format("Failed to create pipes: {}", std::strerror(err)));
        }

        // Everything the child touches is allocated before fork
        std::vector<std::string> envStrings = BuildChildEnvironment(environment);
        std::vector<char*> envp;
        envp.reserve(envStrings.size() + 1);
        for (auto& e : envStrings) envp.push_back(e.data());
        envp.push_back(nullptr);

        std::vector<std::string> argStrings;
        argStrings.reserve(command.args.size() + 1);
        argStrings.push_back(command.program);
        argStrings.insert(argStrings.end(), command.args.begin(), command.args.end());
        std::vector<char*> argv;
        argv.reserve(argStrings.size() + 1);
        for (auto& a : argStrings) argv.push_back(a.data());
        argv.push_back(nullptr);

        const char* workDir = options.workingDirectory ? options.workingDirectory->c_str() : nullptr;

        pid_t child = ::fork();
        if (child < 0) {
            const int err = errno;
            closeAll();
            throw HostError(ErrorKind::SpawnFailed, std::format("fork failed: {}", std::strerror(err)));
        }
        if (child == 0) {
            ::setsid();
            ::dup2(inPipe[0], STDIN_FILENO);
            ::dup2(outPipe[1], STDOUT_FILENO);
            ::dup2(errPipe[1], STDERR_FILENO);
            ::signal(SIGPIPE, SIG_DFL);
            if (workDir && ::chdir(workDir) != 0) {
                int err = errno;
                ssize_t w = ::write(statusPipe[1], &err, sizeof(err));
                (void)w;
                ::_exit(127);
            }
            ::execvpe(argv[0], argv.data(), envp.data());
            int err = errno;
            ssize_t w = ::write(statusPipe[1], &err, sizeof(err));
            (void)w;
            ::_exit(127);
        }

        // Parent
        closeFd(inPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[1]);
        closeFd(statusPipe[1]);

        int childErr = 0;
        ssize_t n;
        do {
            n = ::read(statusPipe[0], &childErr, sizeof(childErr));
        } while (n < 0 && errno == EINTR);
        closeFd(statusPipe[0]);
        if (n == static_cast<ssize_t>(sizeof(childErr))) {
            int st = 0;
            while (::waitpid(child, &st, 0) < 0 && errno == EINTR) {}
            closeAll();
            throw HostError(ErrorKind::SpawnFailed,
                            std::format("Failed to spawn '{}': {}", command.program, std::strerror(childErr)));
        }

        pid = child;
        stdinFd = inPipe[1];
        stdoutFd = outPipe[0];
        stderrFd = errPipe[0];
        if (!setNonBlocking(stdinFd) || !setNonBlocking(stdoutFd) || !setNonBlocking(stderrFd)) {
            LOG_WARN("ProcessTransport: failed to make pipes non-blocking (errno={} msg={})", errno, ::strerror(errno));
        }
        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            LOG_ERROR("ProcessTransport: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
        }
        LOG_INFO("ProcessTransport: spawned pid {} for '{}'", static_cast<int>(pid), describeCommand(command));
    }

    void wakeReader() {
        if (wakeEventFd < 0) return;
        uint64_t one = 1;
        for (;;) {
            ssize_t w = ::write(wakeEventFd, &one, sizeof(one));
            if (w >= 0) break;
            if (errno == EINTR) continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                LOG_WARN("ProcessTransport: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
            }
            break;
        }
    }

    //////////////////////////////////////////// Diagnostics ////////////////////////////////////////////
    void appendStderr(const char* data, std::size_t len) {
        std::lock_guard<std::mutex> lk(diagMutex);
        stderrRing.append(data, len);
        if (stderrRing.size() > options.stderrCapacity) {
            stderrRing.erase(0, stderrRing.size() - options.stderrCapacity);
        }
    }

    std::string diagnostics() const {
        std::lock_guard<std::mutex> lk(diagMutex);
        return stderrRing;
    }

    // Returns false on EOF or a fatal read error.
    bool drainStderr() {
        char tmp[4096];
        for (;;) {
            ssize_t n = ::read(stderrFd, tmp, sizeof(tmp));
            if (n > 0) { appendStderr(tmp, static_cast<std::size_t>(n)); continue; }
            if (n == 0) return false;
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
            return false;
        }
    }

    //////////////////////////////////////////// Reader ////////////////////////////////////////////
    void startReader() {
        readerThread = std::thread([this]() {
            std::string buffer;
            constexpr int waitTimeoutMs = 100;
            bool stdoutOpen = true;
            bool stderrOpen = true;
            std::string reason = "tool server closed its output stream";

            int ep = ::epoll_create1(EPOLL_CLOEXEC);
            if (ep < 0) {
                LOG_ERROR("ProcessTransport: epoll_create1 failed (errno={} msg={})", errno, ::strerror(errno));
                reason = "epoll_create1 failed";
                stdoutOpen = false;
            } else {
                epoll_event evOut{}; evOut.events = EPOLLIN | EPOLLRDHUP; evOut.data.fd = stdoutFd;
                epoll_event evErr{}; evErr.events = EPOLLIN | EPOLLRDHUP; evErr.data.fd = stderrFd;
                if (::epoll_ctl(ep, EPOLL_CTL_ADD, stdoutFd, &evOut) != 0 ||
                    ::epoll_ctl(ep, EPOLL_CTL_ADD, stderrFd, &evErr) != 0) {
                    LOG_ERROR("ProcessTransport: epoll_ctl failed (errno={} msg={})", errno, ::strerror(errno));
                    reason = "epoll_ctl failed";
                    stdoutOpen = false;
                }
                if (wakeEventFd >= 0) {
                    epoll_event evWake{}; evWake.events = EPOLLIN; evWake.data.fd = wakeEventFd;
                    if (::epoll_ctl(ep, EPOLL_CTL_ADD, wakeEventFd, &evWake) != 0) {
                        LOG_WARN("ProcessTransport: cannot watch wake eventfd (errno={})", errno);
                    }
                }
            }

            std::vector<char> tmp(8192);
            while (stdoutOpen && !closing.load()) {
                epoll_event events[3];
                int rc = ::epoll_wait(ep, events, 3, waitTimeoutMs);
                if (rc < 0) {
                    if (errno == EINTR) continue;
                    LOG_ERROR("ProcessTransport: epoll_wait failed (errno={} msg={})", errno, ::strerror(errno));
                    reason = "epoll_wait failed";
                    break;
                }
                bool woke = false;
                for (int i = 0; i < rc; ++i) {
                    const int fd = events[i].data.fd;
                    if (fd == wakeEventFd) {
                        uint64_t v = 0;
                        ssize_t r;
                        do { r = ::read(wakeEventFd, &v, sizeof(v)); } while (r < 0 && errno == EINTR);
                        woke = true;
                    } else if (fd == stderrFd) {
                        if (!drainStderr()) {
                            stderrOpen = false;
                            if (::epoll_ctl(ep, EPOLL_CTL_DEL, stderrFd, nullptr) != 0) {
                                LOG_DEBUG("ProcessTransport: epoll_ctl DEL stderr failed (errno={})", errno);
                            }
                        }
                    } else if (fd == stdoutFd) {
                        for (;;) {
                            ssize_t n = ::read(stdoutFd, tmp.data(), tmp.size());
                            if (n > 0) {
                                buffer.append(tmp.data(), static_cast<std::size_t>(n));
                                continue;
                            }
                            if (n == 0) { stdoutOpen = false; break; }
                            if (errno == EINTR) continue;
                            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                                LOG_ERROR("ProcessTransport: read failed (errno={} msg={})", errno, ::strerror(errno));
                                stdoutOpen = false;
                            }
                            break;
                        }
                        drainFrames(buffer);
                    }
                }
                if (woke && closing.load()) break;
            }
            if (ep >= 0) ::close(ep);
            if (stderrOpen) {
                drainStderr();
            }
            onDisconnected(reason);
        });
    }

    void drainFrames(std::string& buffer) {
        while (!buffer.empty()) {
            auto r = framer->tryDecodeEx(buffer);
            if (r.bytesConsumed > 0 && r.bytesConsumed <= buffer.size()) {
                buffer.erase(0, r.bytesConsumed);
            }
            if (r.status == IContentFramer::DecodeStatus::Incomplete) {
                break;
            }
            if (r.status != IContentFramer::DecodeStatus::Ok) {
                reportError("ProcessTransport: dropped malformed or oversized frame");
                if (r.bytesConsumed == 0) {
                    buffer.clear();
                }
                continue;
            }
            if (r.payload) {
                processMessage(*r.payload);
            }
        }
    }

    void reportError(const std::string& msg) {
        ITransport::ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            handler = errorHandler;
        }
        if (handler) handler(msg);
    }

    void processMessage(const std::string& message) {
        LOG_DEBUG("ProcessTransport: received {} bytes", message.size());
        JSONValue value;
        try {
            value = parseJSONValue(message);
        } catch (const std::exception& e) {
            // Servers sometimes print banners on stdout; skip anything that is not JSON
            LOG_WARN("ProcessTransport: ignoring non-JSON output line: {}", e.what());
            return;
        }
        switch (classifyMessage(value)) {
            case JSONRPCMessageKind::Response: {
                JSONRPCResponse response;
                if (response.FromValue(value)) handleResponse(std::move(response));
                break;
            }
            case JSONRPCMessageKind::Request: {
                JSONRPCRequest request;
                if (request.FromValue(value)) handleServerRequest(request);
                break;
            }
            case JSONRPCMessageKind::Notification: {
                auto note = std::make_unique<JSONRPCNotification>();
                if (!note->FromValue(value)) break;
                ITransport::NotificationHandler handler;
                {
                    std::lock_guard<std::mutex> lk(handlerMutex);
                    handler = notificationHandler;
                }
                if (handler) {
                    try {
                        handler(std::move(note));
                    } catch (const std::exception& e) {
                        LOG_ERROR("ProcessTransport: notification handler threw: {}", e.what());
                    }
                }
                break;
            }
            case JSONRPCMessageKind::Invalid:
                LOG_WARN("ProcessTransport: ignoring message that is not JSON-RPC");
                break;
        }
    }

    // Host-side answers to server-initiated requests: ping only.
    void handleServerRequest(const JSONRPCRequest& request) {
        std::unique_ptr<JSONRPCResponse> resp;
        if (request.method == Methods::Ping) {
            resp = std::make_unique<JSONRPCResponse>(request.id, JSONValue(JSONValue::Object{}));
        } else {
            resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound,
                                       "Method not supported by host: " + request.method);
        }
        if (!enqueueFrame(resp->Serialize())) {
            LOG_WARN("ProcessTransport: could not answer server request {}", request.method);
        }
    }

    void handleResponse(JSONRPCResponse response) {
        const std::string idStr = idToString(response.id);
        std::lock_guard<std::mutex> lock(requestMutex);
        auto it = pendingRequests.find(idStr);
        if (it == pendingRequests.end()) {
            LOG_DEBUG("ProcessTransport: dropping response for unknown or cancelled id {}", idStr);
            return;
        }
        it->second.promise.set_value(std::make_unique<JSONRPCResponse>(std::move(response)));
        pendingRequests.erase(it);
    }

    //////////////////////////////////////////// Writer ////////////////////////////////////////////
    bool enqueueFrame(const std::string& payload) {
        if (!connected.load()) return false;
        std::string frame = framer->encode(payload);
        {
            std::lock_guard<std::mutex> lk(writeMutex);
            if (queuedBytes + frame.size() > options.writeQueueMaxBytes) {
                LOG_ERROR("ProcessTransport: write queue overflow (queued={} add={} max={})",
                          queuedBytes, frame.size(), options.writeQueueMaxBytes);
                return false;
            }
            queuedBytes += frame.size();
            writeQueue.emplace_back(std::move(frame));
        }
        cvWrite.notify_one();
        return true;
    }

    void startWriter() {
        writerRunning = true;
        writerThread = std::thread([this]() {
            while (true) {
                std::string frame;
                {
                    std::unique_lock<std::mutex> lk(writeMutex);
                    cvWrite.wait_for(lk, std::chrono::milliseconds(50), [&]{ return !writerRunning.load() || !writeQueue.empty(); });
                    if (writeQueue.empty()) {
                        if (!writerRunning.load()) break;
                        continue;
                    }
                    frame = std::move(writeQueue.front());
                    writeQueue.pop_front();
                }
                std::size_t total = 0;
                bool failed = false;
                while (total < frame.size()) {
                    ssize_t w = ::write(stdinFd, frame.data() + total, frame.size() - total);
                    if (w > 0) {
                        total += static_cast<std::size_t>(w);
                    } else if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                        if (!writerRunning.load() && closing.load()) { failed = true; break; }
                        std::this_thread::sleep_for(std::chrono::milliseconds(2));
                    } else if (w < 0 && errno == EINTR) {
                        continue;
                    } else {
                        LOG_WARN("ProcessTransport: write to child failed (errno={} msg={})", errno, ::strerror(errno));
                        failed = true;
                        break;
                    }
                }
                {
                    std::lock_guard<std::mutex> lk(writeMutex);
                    queuedBytes = queuedBytes >= frame.size() ? queuedBytes - frame.size() : 0;
                    if (failed) {
                        writeQueue.clear();
                        queuedBytes = 0;
                    }
                }
                if (failed) {
                    // The reader observes EOF once the child is gone and fails pending requests
                    reportError("ProcessTransport: write to child failed");
                    break;
                }
            }
        });
    }

    //////////////////////////////////////////// Timeouts ////////////////////////////////////////////
    void startTimeouts() {
        timeoutRunning = true;
        timeoutThread = std::thread([this]() {
            using clock = std::chrono::steady_clock;
            std::unique_lock<std::mutex> lock(requestMutex);
            while (timeoutRunning.load()) {
                cvTimeout.wait_for(lock, std::chrono::milliseconds(20));
                const auto now = clock::now();
                bool terminate = false;
                for (auto it = pendingRequests.begin(); it != pendingRequests.end();) {
                    if (it->second.deadline <= now) {
                        LOG_WARN("ProcessTransport: request {} timed out", it->first);
                        it->second.promise.set_exception(std::make_exception_ptr(
                            HostError(ErrorKind::CallTimeout, "Request " + it->first + " timed out")));
                        terminate = terminate || it->second.terminateOnTimeout;
                        it = pendingRequests.erase(it);
                    } else {
                        ++it;
                    }
                }
                if (terminate && pid > 0) {
                    // A busy reapMutex means the child is already being reaped; once reaped its pid may be reused.
                    std::unique_lock<std::mutex> reapLock(reapMutex, std::try_to_lock);
                    if (reapLock.owns_lock() && !reaped) {
                        LOG_WARN("ProcessTransport: terminating pid {} after request timeout", static_cast<int>(pid));
                        ::kill(-pid, SIGTERM);
                    }
                }
            }
        });
    }

    //////////////////////////////////////////// Exit handling ////////////////////////////////////////////
    void failPending(const std::string& reason) {
        std::string tail = diagnostics();
        std::string message = "Tool server disconnected: " + reason;
        if (!tail.empty()) {
            message += "\nstderr:\n" + tail;
        }
        std::lock_guard<std::mutex> lock(requestMutex);
        for (auto& [idStr, pending] : pendingRequests) {
            pending.promise.set_exception(std::make_exception_ptr(
                HostError(ErrorKind::TransportDisconnected, message, JSONValue(tail))));
        }
        pendingRequests.clear();
    }

    void recordStatus(int st) {
        if (WIFEXITED(st)) {
            exitCode = WEXITSTATUS(st);
        } else if (WIFSIGNALED(st)) {
            exitSignal = WTERMSIG(st);
        }
        reaped = true;
    }

    // Polls for the child until the deadline. Caller holds reapMutex.
    bool pollExit(std::chrono::steady_clock::time_point deadline) {
        while (true) {
            int st = 0;
            pid_t r = ::waitpid(pid, &st, WNOHANG);
            if (r == pid) { recordStatus(st); return true; }
            if (r < 0 && errno != EINTR) { reaped = true; return true; }
            if (std::chrono::steady_clock::now() >= deadline) return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    //==========================================================================================================
    // terminateAndReap
    // Purpose: Waits initialWait for a voluntary exit, then SIGTERM to the group, the grace period, SIGKILL.
    //==========================================================================================================
    void terminateAndReap(std::chrono::milliseconds initialWait) {
        std::lock_guard<std::mutex> lk(reapMutex);
        if (reaped || pid <= 0) return;
        using clock = std::chrono::steady_clock;
        if (pollExit(clock::now() + initialWait)) return;
        ::kill(-pid, SIGTERM);
        if (pollExit(clock::now() + options.shutdownGrace)) return;
        LOG_WARN("ProcessTransport: pid {} ignored SIGTERM for {} ms; sending SIGKILL",
                 static_cast<int>(pid), static_cast<long long>(options.shutdownGrace.count()));
        ::kill(-pid, SIGKILL);
        int st = 0;
        pid_t r;
        do { r = ::waitpid(pid, &st, 0); } while (r < 0 && errno == EINTR);
        if (r == pid) {
            recordStatus(st);
        } else {
            reaped = true;
        }
    }

    void onDisconnected(const std::string& reason) {
        connected = false;
        const bool local = closing.load();
        if (!local) {
            LOG_WARN("ProcessTransport: {} (pid {})", reason, static_cast<int>(pid));
        }
        failPending(local ? "transport closed" : reason);
        if (!local) {
            terminateAndReap(std::chrono::milliseconds(500));
        }
        if (local) {
            return;  // Close() reaps and fires the handler after the child is gone
        }
        fireDisconnect(reason, false);
    }

    void fireDisconnect(const std::string& reason, bool local) {
        if (disconnectFired.exchange(true)) return;
        DisconnectInfo info;
        info.reason = reason;
        info.diagnostics = diagnostics();
        info.locallyInitiated = local;
        {
            std::lock_guard<std::mutex> lk(reapMutex);
            info.exitCode = exitCode;
            info.signal = exitSignal;
        }
        ITransport::DisconnectHandler handler;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            handler = disconnectHandler;
        }
        if (handler) {
            try {
                handler(info);
            } catch (const std::exception& e) {
                LOG_ERROR("ProcessTransport: disconnect handler threw: {}", e.what());
            }
        }
    }

    void shutdown() {
        std::lock_guard<std::mutex> closeLock(closeMutex);
        if (!started.load()) return;
        closing = true;

        writerRunning = false;
        cvWrite.notify_all();
        if (writerThread.joinable() && writerThread.get_id() != std::this_thread::get_id()) {
            writerThread.join();
        }
        closeFd(stdinFd);

        terminateAndReap(std::chrono::milliseconds(0));

        wakeReader();
        if (readerThread.joinable()) {
            if (readerThread.get_id() == std::this_thread::get_id()) {
                readerThread.detach();
            } else {
                readerThread.join();
            }
        }
        timeoutRunning = false;
        cvTimeout.notify_all();
        if (timeoutThread.joinable() && timeoutThread.get_id() != std::this_thread::get_id()) {
            timeoutThread.join();
        }
        connected = false;
        failPending("transport closed");
        fireDisconnect("transport closed", true);
        closeFd(stdoutFd);
        closeFd(stderrFd);
        started = false;
        LOG_INFO("ProcessTransport: closed pid {} (exit={} signal={})", static_cast<int>(pid),
                 exitCode ? std::to_string(*exitCode) : std::string("-"),
                 exitSignal ? std::to_string(*exitSignal) : std::string("-"));
    }

    std::string generateRequestId() { return "req-" + std::to_string(++requestCounter); }
};

ProcessTransport::ProcessTransport(CommandSpec command, std::map<std::string, std::string> environment)
    : ProcessTransport(std::move(command), std::move(environment), Options{}) {}

ProcessTransport::ProcessTransport(CommandSpec command, std::map<std::string, std::string> environment,
                                   Options options)
    : pImpl(std::make_unique<Impl>(std::move(command), std::move(environment), std::move(options))) {
    FUNC_SCOPE();
}

ProcessTransport::~ProcessTransport() {
    FUNC_SCOPE();
    try {
        pImpl->shutdown();
    } catch (const std::exception& e) {
        LOG_ERROR("ProcessTransport: shutdown during destruction failed: {}", e.what());
    }
}

std::future<void> ProcessTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> promise;
    if (pImpl->started.load()) {
        promise.set_value();
        return promise.get_future();
    }
    try {
        pImpl->spawn();
    } catch (const HostError& e) {
        LOG_ERROR("ProcessTransport: {}", e.what());
        promise.set_exception(std::current_exception());
        return promise.get_future();
    }
    pImpl->started = true;
    pImpl->connected = true;
    pImpl->startReader();
    pImpl->startWriter();
    pImpl->startTimeouts();
    promise.set_value();
    return promise.get_future();
}

std::future<void> ProcessTransport::Close() {
    FUNC_SCOPE();
    pImpl->shutdown();
    std::promise<void> promise;
    promise.set_value();
    return promise.get_future();
}

bool ProcessTransport::IsConnected() const {
    return pImpl->connected.load();
}

std::string ProcessTransport::GetSessionId() const {
    return pImpl->sessionId;
}

std::future<std::unique_ptr<JSONRPCResponse>> ProcessTransport::SendRequest(
    std::unique_ptr<JSONRPCRequest> request, const RequestOptions& options) {
    FUNC_SCOPE();
    std::promise<std::unique_ptr<JSONRPCResponse>> promise;
    auto future = promise.get_future();
    if (!pImpl->connected.load()) {
        promise.set_exception(std::make_exception_ptr(HostError(
            ErrorKind::TransportDisconnected, "Tool server is not connected\nstderr:\n" + pImpl->diagnostics())));
        return future;
    }
    if (!idIsSet(request->id)) {
        request->id = pImpl->generateRequestId();
    }
    const std::string idStr = idToString(request->id);
    {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        Impl::Pending pending;
        pending.promise = std::move(promise);
        pending.deadline = std::chrono::steady_clock::now() + options.timeout;
        pending.terminateOnTimeout = options.terminateOnTimeout;
        pImpl->pendingRequests[idStr] = std::move(pending);
    }
    if (!pImpl->enqueueFrame(request->Serialize())) {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        auto it = pImpl->pendingRequests.find(idStr);
        if (it != pImpl->pendingRequests.end()) {
            it->second.promise.set_exception(std::make_exception_ptr(
                HostError(ErrorKind::TransportDisconnected, "Failed to queue request " + request->method)));
            pImpl->pendingRequests.erase(it);
        }
    }
    return future;
}

std::future<void> ProcessTransport::SendNotification(std::unique_ptr<JSONRPCNotification> notification) {
    FUNC_SCOPE();
    std::promise<void> promise;
    if (pImpl->enqueueFrame(notification->Serialize())) {
        promise.set_value();
    } else {
        promise.set_exception(std::make_exception_ptr(
            HostError(ErrorKind::TransportDisconnected, "Failed to queue notification " + notification->method)));
    }
    return promise.get_future();
}

bool ProcessTransport::CancelRequest(const std::string& requestId) {
    std::lock_guard<std::mutex> lock(pImpl->requestMutex);
    auto it = pImpl->pendingRequests.find(requestId);
    if (it == pImpl->pendingRequests.end()) {
        return false;
    }
    it->second.promise.set_exception(std::make_exception_ptr(
        HostError(ErrorKind::CallTimeout, "Request " + requestId + " was cancelled")));
    pImpl->pendingRequests.erase(it);
    return true;
}

void ProcessTransport::SetNotificationHandler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->notificationHandler = std::move(handler);
}

void ProcessTransport::SetErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->errorHandler = std::move(handler);
}

void ProcessTransport::SetDisconnectHandler(DisconnectHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->disconnectHandler = std::move(handler);
}

std::string ProcessTransport::GetDiagnostics() const {
    return pImpl->diagnostics();
}

std::optional<int> ProcessTransport::GetProcessId() const {
    if (pImpl->pid <= 0 || pImpl->reaped) {
        return std::nullopt;
    }
    return static_cast<int>(pImpl->pid);
}

} // namespace mcphost
