#include "rest.hpp"

#include <spdlog/spdlog.h>

namespace firestore_cpp::detail {

namespace {

auto error_field(const nlohmann::json& body, const char* field) -> std::string {
    if (!body.is_object()) return {};
    auto err = body.find("error");
    if (err == body.end() || !err->is_object()) return {};
    auto it = err->find(field);
    if (it == err->end() || !it->is_string()) return {};
    return it->get<std::string>();
}

auto mentions_limit(std::string_view message) -> bool {
    return message.find("exceeds the maximum") != std::string_view::npos ||
           message.find("too many index entries") != std::string_view::npos ||
           message.find("maximum allowed size") != std::string_view::npos;
}

}  // anonymous namespace

auto dump_body(const nlohmann::json& body) -> Result<std::string> {
    try {
        return body.dump();
    } catch (const nlohmann::json::type_error& e) {
        return Error{ErrorKind::unsupported_type, e.what()};
    }
}

auto parse_body(const HttpResponse& response) -> Result<nlohmann::json> {
    if (response.body.empty()) return nlohmann::json::object();
    auto j = nlohmann::json::parse(response.body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return Error{ErrorKind::invalid_response,
                     "HTTP " + std::to_string(response.status) + ": body is not a JSON object"};
    }
    return j;
}

auto server_message(const HttpResponse& response) -> std::string {
    auto j = nlohmann::json::parse(response.body, nullptr, false);
    if (auto message = error_field(j, "message"); !message.empty()) return message;
    return response.body;
}

auto document_error(const HttpResponse& response) -> Error {
    const auto j = nlohmann::json::parse(response.body, nullptr, false);
    const auto status = error_field(j, "status");
    auto message = error_field(j, "message");
    if (message.empty()) message = response.body;

    auto kind = ErrorKind::transport;
    if (status == "NOT_FOUND" || response.status == 404) {
        kind = ErrorKind::not_found;
    } else if (status == "FAILED_PRECONDITION" || status == "ABORTED" ||
               status == "ALREADY_EXISTS" || response.status == 409) {
        kind = ErrorKind::conflict;
    } else if (status == "RESOURCE_EXHAUSTED" || response.status == 413 ||
               (status == "INVALID_ARGUMENT" && mentions_limit(message))) {
        kind = ErrorKind::quota_exceeded;
    } else if (status == "UNAUTHENTICATED" || response.status == 401) {
        kind = ErrorKind::authentication;
    }

    SPDLOG_DEBUG("server responded {} {} -> {}", response.status, status, to_string_view(kind));
    if (kind == ErrorKind::transport) {
        return Error{kind, "HTTP " + std::to_string(response.status) + ": " + message};
    }
    return Error{kind, message};
}

auto identity_error(const HttpResponse& response) -> Error {
    auto message = server_message(response);
    if (response.status >= 400 && response.status < 500) {
        return Error{ErrorKind::authentication, message};
    }
    return Error{ErrorKind::transport, "HTTP " + std::to_string(response.status) + ": " + message};
}

}  // namespace firestore_cpp::detail
