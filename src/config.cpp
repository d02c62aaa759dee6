#include <firestore-cpp/config.hpp>

#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>
#include <string>

namespace firestore_cpp {

namespace {

auto parse_mask_policy(const std::string& s) -> MaskPolicy {
    if (s == to_string_view(MaskPolicy::conservative)) return MaskPolicy::conservative;
    if (s == to_string_view(MaskPolicy::diff)) return MaskPolicy::diff;
    throw std::invalid_argument{"unknown mask_policy '" + s + "'"};
}

template <typename T>
void read_optional(const nlohmann::json& j, const char* key, T& out) {
    if (auto it = j.find(key); it != j.end()) {
        out = it->template get<T>();
    }
}

}  // anonymous namespace

void to_json(nlohmann::json& j, const ClientConfig& config) {
    j = nlohmann::json{
        {"api_key", config.api_key},
        {"project_id", config.project_id},
        {"database", config.database},
        {"firestore_endpoint", config.firestore_endpoint},
        {"identity_endpoint", config.identity_endpoint},
        {"token_endpoint", config.token_endpoint},
        {"connect_timeout_ms", config.connect_timeout_ms},
        {"request_timeout_ms", config.request_timeout_ms},
        {"mask_policy", std::string{to_string_view(config.mask_policy)}},
    };
}

void from_json(const nlohmann::json& j, ClientConfig& config) {
    j.at("api_key").get_to(config.api_key);
    j.at("project_id").get_to(config.project_id);
    read_optional(j, "database", config.database);
    read_optional(j, "firestore_endpoint", config.firestore_endpoint);
    read_optional(j, "identity_endpoint", config.identity_endpoint);
    read_optional(j, "token_endpoint", config.token_endpoint);
    read_optional(j, "connect_timeout_ms", config.connect_timeout_ms);
    read_optional(j, "request_timeout_ms", config.request_timeout_ms);
    if (auto it = j.find("mask_policy"); it != j.end()) {
        config.mask_policy = parse_mask_policy(it->get<std::string>());
    }
}

auto parse_config(const nlohmann::json& j) -> Result<ClientConfig> {
    if (!j.is_object()) {
        return Error{ErrorKind::invalid_config, "config must be a JSON object"};
    }
    auto config = ClientConfig{};
    try {
        from_json(j, config);
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorKind::invalid_config, e.what()};
    } catch (const std::invalid_argument& e) {
        return Error{ErrorKind::invalid_config, e.what()};
    }
    if (config.api_key.empty()) {
        return Error{ErrorKind::invalid_config, "api_key must not be empty"};
    }
    if (config.project_id.empty()) {
        return Error{ErrorKind::invalid_config, "project_id must not be empty"};
    }
    return config;
}

auto load_config(const std::string& path) -> Result<ClientConfig> {
    auto in = std::ifstream{path};
    if (!in) {
        return Error{ErrorKind::invalid_config, "cannot open config file " + path};
    }
    auto j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        return Error{ErrorKind::invalid_config, "config file " + path + " is not valid JSON"};
    }
    auto config = parse_config(j);
    if (config) {
        SPDLOG_INFO("loaded config for project {} from {}", config->project_id, path);
    }
    return config;
}

}  // namespace firestore_cpp
