/// @file config.hpp
/// @brief Client configuration and its JSON form.

#pragma once

#include <firestore-cpp/error.hpp>
#include <firestore-cpp/patch.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace firestore_cpp {

/// Endpoints, credentials and policies for a Client and its Auth.
///
/// JSON form (all keys except `api_key` and `project_id` are optional):
///
/// @code{.json}
/// {
///   "api_key": "AIza...",
///   "project_id": "my-project",
///   "database": "(default)",
///   "connect_timeout_ms": 6010,
///   "request_timeout_ms": 60000,
///   "mask_policy": "conservative"
/// }
/// @endcode
struct ClientConfig {
    std::string api_key;
    std::string project_id;
    std::string database{"(default)"};
    std::string firestore_endpoint{"https://firestore.googleapis.com/v1/"};
    std::string identity_endpoint{"https://identitytoolkit.googleapis.com/v1/"};
    std::string token_endpoint{"https://securetoken.googleapis.com/v1/"};
    long connect_timeout_ms{6010};
    long request_timeout_ms{60000};
    MaskPolicy mask_policy{MaskPolicy::conservative};

    auto operator==(const ClientConfig&) const -> bool = default;
};

void to_json(nlohmann::json& j, const ClientConfig& config);

/// Throws nlohmann::json::exception on malformed input; prefer parse_config.
void from_json(const nlohmann::json& j, ClientConfig& config);

/// Build a config from JSON. Fails with ErrorKind::invalid_config when
/// `api_key` or `project_id` is missing or empty, a key has the wrong type,
/// or `mask_policy` is unknown.
auto parse_config(const nlohmann::json& j) -> Result<ClientConfig>;

/// Read and parse a JSON config file.
auto load_config(const std::string& path) -> Result<ClientConfig>;

}  // namespace firestore_cpp
