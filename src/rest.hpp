#pragma once

// Internal header — not installed.
// Shared helpers for talking to the identity and document REST endpoints.

#include <firestore-cpp/error.hpp>
#include <firestore-cpp/http.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace firestore_cpp::detail {

inline constexpr std::string_view json_content_type = "application/json; charset=UTF-8";

/// Serialize a request body; strings that are not valid UTF-8 are rejected.
auto dump_body(const nlohmann::json& body) -> Result<std::string>;

/// Parse a response body. An empty body parses to an empty object.
auto parse_body(const HttpResponse& response) -> Result<nlohmann::json>;

/// The server's `error.message`, or the raw body when there is none.
auto server_message(const HttpResponse& response) -> std::string;

/// Map a non-200 response from the document endpoint to an Error.
auto document_error(const HttpResponse& response) -> Error;

/// Map a non-200 response from the identity/token endpoints to an Error.
/// Client errors (4xx) are authentication failures; the rest are transport.
auto identity_error(const HttpResponse& response) -> Error;

}  // namespace firestore_cpp::detail
