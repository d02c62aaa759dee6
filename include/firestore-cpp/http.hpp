/// @file http.hpp
/// @brief The transport boundary: a synchronous HTTP request/response client.

#pragma once

#include <firestore-cpp/error.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace firestore_cpp {

/// A single HTTP request.
struct HttpRequest {
    std::string method;                                      ///< "GET", "POST", "PATCH", "DELETE".
    std::string url;                                         ///< Absolute URL including query.
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;                                        ///< Empty for GET/DELETE.
};

/// A complete HTTP response. Status codes are not interpreted here.
struct HttpResponse {
    long status{0};
    std::string body;
};

/// Synchronous HTTP transport.
///
/// Implementations perform one round trip per call, keep no connection
/// state between calls, and must be safe to call from several threads.
/// Network-level failures are reported as ErrorKind::transport; any
/// response the server sends, whatever its status, is a success here.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual auto send(const HttpRequest& request) -> Result<HttpResponse> = 0;
};

/// Percent-encode a URL path segment or query value (RFC 3986 unreserved
/// characters pass through).
auto url_encode(std::string_view s) -> std::string;

}  // namespace firestore_cpp
