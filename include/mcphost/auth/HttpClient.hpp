//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpClient.hpp
// Purpose: Small blocking HTTP/HTTPS client (Boost.Beast coroutines) used for catalogs and token endpoints
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>

#include "mcphost/version.h"

namespace mcphost::auth {

using HeaderKV = std::pair<std::string, std::string>;

//==========================================================================================================
// UrlParts / ParseUrl
// Purpose: Splits http(s)://host[:port]/path?query. The target keeps the query string.
// Notes:
//   Throws std::invalid_argument for schemes other than http/https or an empty host.
//==========================================================================================================
struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
};
UrlParts ParseUrl(const std::string& url);

// Percent-encodes everything outside the RFC 3986 unreserved set.
std::string UrlEncode(const std::string& s);

// Decodes %XX escapes and '+' as space.
std::string UrlDecode(const std::string& s);

//==========================================================================================================
// HttpClientOptions
// Fields:
//   connectTimeout/readTimeout: Per-phase deadlines.
//   caFile/caPath: Optional trust store overrides; system defaults otherwise.
//   userAgent: Sent as User-Agent.
//==========================================================================================================
struct HttpClientOptions {
    std::chrono::milliseconds connectTimeout{std::chrono::seconds(10)};
    std::chrono::milliseconds readTimeout{std::chrono::seconds(30)};
    std::string caFile;
    std::string caPath;
    std::string userAgent{getUserAgent()};
};

struct HttpRequest {
    std::string method{"GET"};
    std::string url;
    std::vector<HeaderKV> headers;
    std::string body;
};

struct HttpResponse {
    int status{0};
    std::vector<HeaderKV> headers;
    std::string body;

    // Case-insensitive header lookup; first match wins.
    std::optional<std::string> Header(const std::string& name) const;
    bool Ok() const { return status >= 200 && status < 300; }
};

// TLS client context: TLS 1.2 minimum, peer verification, system or configured trust store.
std::unique_ptr<boost::asio::ssl::context> MakeTlsContext(const HttpClientOptions& options);

//==========================================================================================================
// coSendHttp
// Purpose: Coroutine performing one request on the caller's executor.
// Args:
//   url: Parsed request URL.
//   request: Method, headers and body.
//   options: Deadlines.
//   sslCtx: Required for https URLs; unused for http.
// Returns:
//   The response. Network failures propagate as boost::system::system_error.
//==========================================================================================================
boost::asio::awaitable<HttpResponse> coSendHttp(UrlParts url, HttpRequest request, HttpClientOptions options,
                                                boost::asio::ssl::context* sslCtx);

//==========================================================================================================
// IHttpClient
// Purpose: Seam for catalog and token endpoint code; tests substitute canned responses.
//==========================================================================================================
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    //==========================================================================================================
    // Send
    // Purpose: Performs one request and returns the full response (any status code).
    // Notes:
    //   Throws std::runtime_error on resolve/connect/TLS/read failures and deadline expiry.
    //==========================================================================================================
    virtual HttpResponse Send(const HttpRequest& request) = 0;
};

//==========================================================================================================
// BeastHttpClient
// Purpose: IHttpClient over Boost.Beast. HTTPS uses TLS 1.2+ with peer verification, SNI and host name
//          checks. Each Send runs on its own io_context so callers on any thread may use it.
//==========================================================================================================
class BeastHttpClient : public IHttpClient {
public:
    explicit BeastHttpClient(HttpClientOptions options = HttpClientOptions{});
    HttpResponse Send(const HttpRequest& request) override;

private:
    HttpClientOptions opts;
};

} // namespace mcphost::auth
