//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpClient.cpp
// Purpose: Blocking HTTP/HTTPS client built on Boost.Beast coroutines
//==========================================================================================================

#include <cctype>
#include <format>
#include <memory>
#include <stdexcept>
#include <string>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "mcphost/auth/HttpClient.hpp"

namespace mcphost::auth {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

UrlParts ParseUrl(const std::string& url) {
    UrlParts parts;
    std::size_t pos = 0;
    std::size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("URL has no scheme");
    }
    parts.scheme = url.substr(0, schemeEnd);
    for (auto& c : parts.scheme) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("Unsupported URL scheme: " + parts.scheme);
    }
    pos = schemeEnd + 3;

    std::size_t slash = url.find_first_of("/?", pos);
    std::string hostPort;
    if (slash == std::string::npos) {
        hostPort = url.substr(pos);
        parts.target = "/";
    } else {
        hostPort = url.substr(pos, slash - pos);
        parts.target = url.substr(slash);
        if (parts.target.front() == '?') {
            parts.target.insert(parts.target.begin(), '/');
        }
    }
    // Drop userinfo if present
    if (auto at = hostPort.rfind('@'); at != std::string::npos) {
        hostPort = hostPort.substr(at + 1);
    }

    std::size_t colon = hostPort.rfind(':');
    const bool bracketed = !hostPort.empty() && hostPort.front() == '[';
    if (colon == std::string::npos || (bracketed && hostPort.find(']') > colon)) {
        parts.host = hostPort;
        parts.port = parts.scheme == "https" ? "443" : "80";
    } else {
        parts.host = hostPort.substr(0, colon);
        parts.port = hostPort.substr(colon + 1);
    }
    if (!parts.host.empty() && parts.host.front() == '[' && parts.host.back() == ']') {
        parts.host = parts.host.substr(1, parts.host.size() - 2);
    }
    if (parts.host.empty()) {
        throw std::invalid_argument("URL has no host");
    }
    return parts;
}

std::string UrlEncode(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[(c >> 4) & 0xFu]);
            out.push_back(hex[c & 0xFu]);
        }
    }
    return out;
}

std::string UrlDecode(const std::string& s) {
    auto hexVal = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '+') {
            out.push_back(' ');
        } else if (s[i] == '%' && i + 2 < s.size() && hexVal(s[i + 1]) >= 0 && hexVal(s[i + 2]) >= 0) {
            out.push_back(static_cast<char>(hexVal(s[i + 1]) * 16 + hexVal(s[i + 2])));
            i += 2;
        } else {
            out.push_back(s[i]);
        }
    }
    return out;
}

std::optional<std::string> HttpResponse::Header(const std::string& name) const {
    auto eq = [](const std::string& a, const std::string& b) {
        if (a.size() != b.size()) return false;
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
                return false;
            }
        }
        return true;
    };
    for (const auto& kv : headers) {
        if (eq(kv.first, name)) {
            return kv.second;
        }
    }
    return std::nullopt;
}

std::unique_ptr<ssl::context> MakeTlsContext(const HttpClientOptions& opts) {
    auto ctx = std::make_unique<ssl::context>(ssl::context::tls_client);
    ::SSL_CTX_set_min_proto_version(ctx->native_handle(), TLS1_2_VERSION);
    if (!opts.caFile.empty() || !opts.caPath.empty()) {
        if (!opts.caFile.empty()) { ctx->load_verify_file(opts.caFile); }
        if (!opts.caPath.empty()) { ctx->add_verify_path(opts.caPath); }
    } else {
        boost::system::error_code ec;
        ctx->set_default_verify_paths(ec);
        if (ec) {
            LOG_WARN("HttpClient: set_default_verify_paths failed: {}", ec.message());
        }
    }
    ctx->set_verify_mode(ssl::verify_peer);
    return ctx;
}

namespace {

http::verb toVerb(const std::string& method) {
    if (method == "GET") return http::verb::get;
    if (method == "POST") return http::verb::post;
    if (method == "DELETE") return http::verb::delete_;
    if (method == "PUT") return http::verb::put;
    throw std::invalid_argument("Unsupported HTTP method: " + method);
}

http::request<http::string_body> buildRequest(const UrlParts& u, const HttpRequest& request,
                                              const HttpClientOptions& opts) {
    http::request<http::string_body> req{toVerb(request.method), u.target, 11};
    const bool defaultPort = (u.scheme == "https" && u.port == "443") || (u.scheme == "http" && u.port == "80");
    req.set(http::field::host, defaultPort ? u.host : u.host + ":" + u.port);
    req.set(http::field::user_agent, opts.userAgent);
    req.set(http::field::connection, "close");
    for (const auto& kv : request.headers) {
        req.set(kv.first, kv.second);
    }
    if (!request.body.empty() || request.method == "POST") {
        req.body() = request.body;
        req.prepare_payload();
    }
    return req;
}

HttpResponse toResponse(http::response<http::string_body>& res) {
    HttpResponse out;
    out.status = static_cast<int>(res.result_int());
    for (const auto& field : res) {
        out.headers.emplace_back(std::string(field.name_string()), std::string(field.value()));
    }
    out.body = std::move(res.body());
    return out;
}

} // namespace

// Parameters are taken by value so they live in the coroutine frame.
net::awaitable<HttpResponse> coSendHttp(UrlParts u, HttpRequest request, HttpClientOptions opts, ssl::context* sslCtx) {
    auto executor = co_await net::this_coro::executor;
    tcp::resolver resolver(executor);
    auto results = co_await resolver.async_resolve(u.host, u.port, net::use_awaitable);
    auto req = buildRequest(u, request, opts);
    boost::beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(32 * 1024 * 1024);

    if (u.scheme == "https") {
        if (!sslCtx) {
            throw std::invalid_argument("https request without TLS context");
        }
        boost::beast::ssl_stream<boost::beast::tcp_stream> stream(executor, *sslCtx);
        if (!::SSL_set_tlsext_host_name(stream.native_handle(), u.host.c_str())) {
            LOG_WARN("HttpClient: failed to set SNI host {}", u.host);
        }
        if (::SSL_set1_host(stream.native_handle(), u.host.c_str()) != 1) {
            LOG_WARN("HttpClient: failed to set verification host {}", u.host);
        }
        stream.next_layer().expires_after(opts.connectTimeout);
        co_await stream.next_layer().async_connect(results, net::use_awaitable);
        co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
        stream.next_layer().expires_after(opts.readTimeout);
        co_await http::async_write(stream, req, net::use_awaitable);
        co_await http::async_read(stream, buffer, parser, net::use_awaitable);
        boost::system::error_code ec;
        stream.shutdown(ec);
        auto res = parser.release();
        co_return toResponse(res);
    }

    boost::beast::tcp_stream stream(executor);
    stream.expires_after(opts.connectTimeout);
    co_await stream.async_connect(results, net::use_awaitable);
    stream.expires_after(opts.readTimeout);
    co_await http::async_write(stream, req, net::use_awaitable);
    co_await http::async_read(stream, buffer, parser, net::use_awaitable);
    boost::system::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    auto res = parser.release();
    co_return toResponse(res);
}

BeastHttpClient::BeastHttpClient(HttpClientOptions options) : opts(std::move(options)) {}

HttpResponse BeastHttpClient::Send(const HttpRequest& request) {
    FUNC_SCOPE();
    UrlParts u = ParseUrl(request.url);
    const std::string where = std::format("{} {}://{}:{}", request.method, u.scheme, u.host, u.port);
    try {
        std::unique_ptr<ssl::context> sslCtx;
        if (u.scheme == "https") {
            sslCtx = MakeTlsContext(opts);
        }
        net::io_context ioc;
        auto fut = net::co_spawn(ioc, coSendHttp(u, request, opts, sslCtx.get()), net::use_future);
        ioc.run();
        HttpResponse res = fut.get();
        LOG_DEBUG("HttpClient: {} -> {} ({} bytes)", where, res.status, res.body.size());
        return res;
    } catch (const boost::system::system_error& e) {
        throw std::runtime_error(std::format("HTTP {} failed: {}", where, e.code().message()));
    }
}

} // namespace mcphost::auth
