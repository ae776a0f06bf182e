//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CredentialStore.cpp
// Purpose: Per-instance secret storage with owner-only file permissions
//==========================================================================================================

#include "mcphost/credentials/CredentialStore.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>

#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcphost/JSONRPCTypes.h"
#include "mcphost/errors/Errors.h"

namespace mcphost {

namespace {
constexpr const char* kSecretPrefix = "env_";
constexpr const char* kSecretSuffix = ".secret";
constexpr const char* kOAuthTokenFile = "oauth_token.json";

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    const auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return std::string();
    const auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

CredentialErrorCode codeFromErrno(int err) {
    switch (err) {
        case ENOENT:
        case ENOTDIR: return CredentialErrorCode::NotFound;
        case EACCES:
        case EPERM: return CredentialErrorCode::PermissionDenied;
        default: return CredentialErrorCode::Io;
    }
}

// Reads a whole file through POSIX calls so errno is available for mapping.
std::string readFileOrThrow(const std::string& path, const std::string& what) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        const int err = errno;
        throw CredentialError(codeFromErrno(err), std::format("{}: {}", what, std::strerror(err)));
    }
    std::string content;
    char buf[4096];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) { content.append(buf, static_cast<std::size_t>(n)); continue; }
        if (n == 0) break;
        if (errno == EINTR) continue;
        const int err = errno;
        ::close(fd);
        throw CredentialError(codeFromErrno(err), std::format("{}: {}", what, std::strerror(err)));
    }
    ::close(fd);
    return content;
}

void ensureDir(const std::string& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw CredentialError(codeFromErrno(ec.value()),
                              std::format("cannot create credential directory {}: {}", dir, ec.message()));
    }
    if (::chmod(dir.c_str(), 0700) != 0) {
        const int err = errno;
        throw CredentialError(codeFromErrno(err),
                              std::format("cannot restrict credential directory {}: {}", dir, std::strerror(err)));
    }
}

JSONValue encodeToken(const OAuthTokenRecord& r) {
    JSONValue::Object o;
    json::set(o, "access_token", r.accessToken);
    json::set(o, "token_type", r.tokenType);
    if (r.refreshToken) json::set(o, "refresh_token", *r.refreshToken);
    if (r.expiresAt) json::set(o, "expires_at", *r.expiresAt);
    if (r.scope) json::set(o, "scope", *r.scope);
    if (r.identity) json::set(o, "identity", *r.identity);
    return JSONValue(std::move(o));
}
} // namespace

bool OAuthTokenRecord::IsExpired(std::chrono::system_clock::time_point now, std::chrono::seconds skew) const {
    if (!expiresAt.has_value()) {
        return false;
    }
    const auto nowSecs = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    return nowSecs + skew.count() >= *expiresAt;
}

CredentialStore::CredentialStore(std::string rootDir) : root_(std::move(rootDir)) {}

std::string CredentialStore::DefaultRoot() {
    const std::string overrideDir = GetEnvOrDefault("MCPHOST_SECRETS_DIR", "");
    if (!overrideDir.empty()) {
        return overrideDir;
    }
    const std::string xdg = GetEnvOrDefault("XDG_CONFIG_HOME", "");
    if (!xdg.empty()) {
        return xdg + "/mcphost/secrets";
    }
    const std::string home = GetEnvOrDefault("HOME", "/tmp");
    return home + "/.config/mcphost/secrets";
}

bool CredentialStore::IsValidComponent(const std::string& s) {
    if (s.empty() || s == "." || s == "..") return false;
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '.' || c == '_' || c == '-';
    });
}

std::string CredentialStore::Sanitize(const std::string& secret) {
    std::string out;
    out.reserve(secret.size());
    for (char c : trim(secret)) {
        if (c != '\r' && c != '\n') out.push_back(c);
    }
    return out;
}

std::string CredentialStore::instanceDir(const std::string& instanceId) const {
    if (!IsValidComponent(instanceId)) {
        throw CredentialError(CredentialErrorCode::InvalidName, "invalid instance id for credential storage");
    }
    return root_ + "/" + instanceId;
}

std::string CredentialStore::secretPath(const std::string& instanceId, const std::string& name) const {
    if (!IsValidComponent(name)) {
        throw CredentialError(CredentialErrorCode::InvalidName,
                              std::format("invalid variable name '{}' for instance {}", name, instanceId));
    }
    return instanceDir(instanceId) + "/" + kSecretPrefix + name + kSecretSuffix;
}

void CredentialStore::writeFileAtomic(const std::string& dir, const std::string& path, const std::string& content) {
    ensureDir(root_);
    ensureDir(dir);
    const std::string tmp = path + ".tmp";
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
        const int err = errno;
        throw CredentialError(codeFromErrno(err), std::format("cannot write {}: {}", tmp, std::strerror(err)));
    }
    // umask may have narrowed the mode further but never widened it; force exactly 0600
    if (::fchmod(fd, 0600) != 0) {
        const int err = errno;
        ::close(fd);
        ::unlink(tmp.c_str());
        throw CredentialError(codeFromErrno(err), std::format("cannot restrict {}: {}", tmp, std::strerror(err)));
    }
    std::size_t off = 0;
    while (off < content.size()) {
        ssize_t n = ::write(fd, content.data() + off, content.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            ::close(fd);
            ::unlink(tmp.c_str());
            throw CredentialError(codeFromErrno(err), std::format("cannot write {}: {}", tmp, std::strerror(err)));
        }
        off += static_cast<std::size_t>(n);
    }
    if (::fsync(fd) != 0) {
        LOG_WARN("fsync failed for {}: {}", tmp, std::strerror(errno));
    }
    ::close(fd);
    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        const int err = errno;
        ::unlink(tmp.c_str());
        throw CredentialError(codeFromErrno(err), std::format("cannot replace {}: {}", path, std::strerror(err)));
    }
}

void CredentialStore::Store(const std::string& instanceId, const std::string& name, const std::string& secret) {
    const std::string path = secretPath(instanceId, name);
    const std::string clean = Sanitize(secret);
    std::lock_guard<std::mutex> lock(mutex_);
    writeFileAtomic(instanceDir(instanceId), path, clean);
    LOG_DEBUG("Stored secret {} for instance {} ({})", name, instanceId, Logger::redact(clean));
}

std::string CredentialStore::Load(const std::string& instanceId, const std::string& name) const {
    const std::string path = secretPath(instanceId, name);
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        return trim(readFileOrThrow(path, std::format("secret {} for instance {}", name, instanceId)));
    } catch (const CredentialError& e) {
        if (e.code() == CredentialErrorCode::NotFound) {
            throw CredentialError(CredentialErrorCode::NotFound,
                                  std::format("secret {} not found for instance {}", name, instanceId));
        }
        throw;
    }
}

void CredentialStore::Delete(const std::string& instanceId, const std::string& name) {
    const std::string path = secretPath(instanceId, name);
    std::lock_guard<std::mutex> lock(mutex_);
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
        const int err = errno;
        throw CredentialError(codeFromErrno(err),
                              std::format("cannot delete secret {} for instance {}: {}", name, instanceId, std::strerror(err)));
    }
}

bool CredentialStore::Exists(const std::string& instanceId, const std::string& name) const {
    const std::string path = secretPath(instanceId, name);
    std::lock_guard<std::mutex> lock(mutex_);
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

std::vector<std::string> CredentialStore::ListNames(const std::string& instanceId) const {
    const std::string dir = instanceDir(instanceId);
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return names;
    }
    const std::string prefix = kSecretPrefix;
    const std::string suffix = kSecretSuffix;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        const std::string file = entry.path().filename().string();
        if (file.size() > prefix.size() + suffix.size() &&
            file.compare(0, prefix.size(), prefix) == 0 &&
            file.compare(file.size() - suffix.size(), suffix.size(), suffix) == 0) {
            names.push_back(file.substr(prefix.size(), file.size() - prefix.size() - suffix.size()));
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

void CredentialStore::PurgeInstance(const std::string& instanceId) {
    const std::string dir = instanceDir(instanceId);
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    const auto removed = std::filesystem::remove_all(dir, ec);
    if (ec) {
        throw CredentialError(codeFromErrno(ec.value()),
                              std::format("cannot purge credentials for instance {}: {}", instanceId, ec.message()));
    }
    LOG_INFO("Purged credentials for instance {} ({} entries)", instanceId, static_cast<long long>(removed));
}

void CredentialStore::StoreOAuthToken(const std::string& instanceId, const OAuthTokenRecord& record) {
    const std::string dir = instanceDir(instanceId);
    OAuthTokenRecord clean = record;
    clean.accessToken = Sanitize(record.accessToken);
    if (clean.refreshToken) clean.refreshToken = Sanitize(*clean.refreshToken);
    std::lock_guard<std::mutex> lock(mutex_);
    writeFileAtomic(dir, dir + "/" + kOAuthTokenFile, serializeJSONValue(encodeToken(clean)));
    LOG_DEBUG("Stored OAuth token for instance {} ({})", instanceId, Logger::redact(clean.accessToken));
}

std::optional<OAuthTokenRecord> CredentialStore::LoadOAuthToken(const std::string& instanceId) const {
    const std::string path = instanceDir(instanceId) + "/" + kOAuthTokenFile;
    std::string content;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        try {
            content = readFileOrThrow(path, std::format("OAuth token for instance {}", instanceId));
        } catch (const CredentialError& e) {
            if (e.code() == CredentialErrorCode::NotFound) {
                return std::nullopt;
            }
            throw;
        }
    }
    JSONValue v;
    try {
        v = parseJSONValue(content);
    } catch (const std::exception&) {
        throw CredentialError(CredentialErrorCode::Io,
                              std::format("OAuth token file for instance {} is corrupt", instanceId));
    }
    auto access = json::getString(v, "access_token");
    if (!access) {
        throw CredentialError(CredentialErrorCode::Io,
                              std::format("OAuth token file for instance {} has no access token", instanceId));
    }
    OAuthTokenRecord r;
    r.accessToken = *access;
    r.tokenType = json::getString(v, "token_type").value_or("Bearer");
    r.refreshToken = json::getString(v, "refresh_token");
    r.expiresAt = json::getInt(v, "expires_at");
    r.scope = json::getString(v, "scope");
    r.identity = json::getString(v, "identity");
    return r;
}

void CredentialStore::DeleteOAuthToken(const std::string& instanceId) {
    const std::string path = instanceDir(instanceId) + "/" + kOAuthTokenFile;
    std::lock_guard<std::mutex> lock(mutex_);
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
        const int err = errno;
        throw CredentialError(codeFromErrno(err),
                              std::format("cannot delete OAuth token for instance {}: {}", instanceId, std::strerror(err)));
    }
}

std::string CredentialStore::ReadKeyFile(const std::string& path) {
    return trim(readFileOrThrow(path, "key file " + path));
}

} // namespace mcphost
