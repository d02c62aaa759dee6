/// @file curl_http_client.hpp
/// @brief libcurl-backed HttpClient.

#pragma once

#include <firestore-cpp/http.hpp>

namespace firestore_cpp {

/// HttpClient that performs each request on a fresh libcurl easy handle.
///
/// @code
/// auto http = std::make_shared<CurlHttpClient>(6010, 60000);
/// @endcode
class CurlHttpClient : public HttpClient {
public:
    /// @param connect_timeout_ms Connection establishment timeout.
    /// @param request_timeout_ms Whole-request timeout (0 = none).
    CurlHttpClient(long connect_timeout_ms, long request_timeout_ms);

    auto send(const HttpRequest& request) -> Result<HttpResponse> override;

private:
    long connect_timeout_ms_;
    long request_timeout_ms_;
};

}  // namespace firestore_cpp
