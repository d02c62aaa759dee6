#include <firestore-cpp/curl_http_client.hpp>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

namespace firestore_cpp {

namespace {

struct EasyDeleter {
    void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

auto write_callback(char* data, std::size_t size, std::size_t nmemb, void* userp) -> std::size_t {
    auto* out = static_cast<std::string*>(userp);
    out->append(data, size * nmemb);
    return size * nmemb;
}

auto global_init() -> CURLcode {
    static std::once_flag once;
    static CURLcode code = CURLE_OK;
    std::call_once(once, [] { code = curl_global_init(CURL_GLOBAL_DEFAULT); });
    return code;
}

}  // anonymous namespace

CurlHttpClient::CurlHttpClient(long connect_timeout_ms, long request_timeout_ms)
    : connect_timeout_ms_{connect_timeout_ms},
      request_timeout_ms_{request_timeout_ms} {}

auto CurlHttpClient::send(const HttpRequest& request) -> Result<HttpResponse> {
    if (auto code = global_init(); code != CURLE_OK) {
        return Error{ErrorKind::transport,
                     std::string{"curl_global_init failed: "} + curl_easy_strerror(code)};
    }

    auto handle = EasyHandle{curl_easy_init()};
    if (!handle) {
        return Error{ErrorKind::transport, "curl_easy_init failed"};
    }

    auto headers = HeaderList{};
    for (const auto& [name, value] : request.headers) {
        auto line = name + ": " + value;
        auto* appended = curl_slist_append(headers.get(), line.c_str());
        if (!appended) return Error{ErrorKind::transport, "curl_slist_append failed"};
        if (!headers) headers.reset(appended);
    }

    auto response = HttpResponse{};
    auto* curl = handle.get();
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, connect_timeout_ms_);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, request_timeout_ms_);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    if (!request.body.empty()) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(request.body.size()));
    }

    SPDLOG_DEBUG("http {} {}", request.method, request.url.substr(0, request.url.find('?')));

    if (auto code = curl_easy_perform(curl); code != CURLE_OK) {
        SPDLOG_WARN("http {} failed: {}", request.method, curl_easy_strerror(code));
        return Error{ErrorKind::transport, curl_easy_strerror(code)};
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);

    SPDLOG_DEBUG("http {} -> {} ({} bytes)", request.method, response.status, response.body.size());
    return response;
}

}  // namespace firestore_cpp
