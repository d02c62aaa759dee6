#include <firestore-cpp/client.hpp>
#include <firestore-cpp/codec.hpp>

#include "rest.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace firestore_cpp {

namespace {

auto is_simple_identifier(std::string_view key) -> bool {
    if (key.empty()) return false;
    auto alpha = [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
    };
    if (!alpha(key.front())) return false;
    for (char c : key) {
        if (!alpha(c) && !(c >= '0' && c <= '9')) return false;
    }
    return true;
}

// Collections may name a subcollection path ("users/u1/posts"); each
// segment is encoded on its own.
auto encode_segments(std::string_view path) -> std::string {
    auto out = std::string{};
    std::size_t start = 0;
    while (true) {
        auto slash = path.find('/', start);
        out += url_encode(path.substr(start, slash - start));
        if (slash == std::string_view::npos) break;
        out += '/';
        start = slash + 1;
    }
    return out;
}

auto string_field(const nlohmann::json& j, const char* key) -> std::string {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

auto parse_document(const nlohmann::json& j) -> Result<DocumentSnapshot> {
    auto fields = Map{};
    if (auto it = j.find("fields"); it != j.end()) {
        auto decoded = decode_fields(*it);
        if (!decoded) return decoded.error();
        fields = std::move(*decoded);
    }
    auto snapshot = DocumentSnapshot{
        string_field(j, "name"),
        std::move(fields),
        string_field(j, "updateTime"),
        string_field(j, "createTime"),
    };
    if (snapshot.update_time.empty()) {
        return Error{ErrorKind::invalid_response, "document response has no updateTime"};
    }
    return snapshot;
}

auto mask_query(const std::set<std::string>& keys) -> std::string {
    auto query = std::string{};
    for (const auto& key : keys) {
        if (!query.empty()) query += '&';
        query += "updateMask.fieldPaths=";
        query += url_encode(field_path(key));
    }
    return query;
}

}  // anonymous namespace

auto field_path(std::string_view key) -> std::string {
    if (is_simple_identifier(key)) return std::string{key};
    auto quoted = std::string{"`"};
    for (char c : key) {
        if (c == '`' || c == '\\') quoted += '\\';
        quoted += c;
    }
    quoted += '`';
    return quoted;
}

Client::Client(ClientConfig config, std::shared_ptr<Auth> auth, std::shared_ptr<HttpClient> http)
    : config_{std::move(config)},
      auth_{std::move(auth)},
      http_{std::move(http)} {}

// -- Single-document calls ----------------------------------------------------

auto Client::create(const Name& collection, const Name& document, const Map& fields)
    -> Result<DocumentSnapshot> {
    auto target = resolve(collection, document);
    if (!target) return target.error();

    auto wire = encode_fields(fields);
    if (!wire) return wire.error();

    auto url = documents_url() + "/" + encode_segments(target->collection) +
               "?documentId=" + url_encode(target->document);
    auto response = request("POST", url, nlohmann::json{{"fields", std::move(*wire)}});
    if (!response) return response.error();

    auto created = parse_document(*response);
    if (!created) return created.error();
    // The server echoes what it stored; keep the caller's values verbatim.
    created->fields = fields;
    SPDLOG_DEBUG("created {}/{}", target->collection, target->document);
    return created;
}

auto Client::read(const Name& collection, const Name& document) -> Result<DocumentSnapshot> {
    auto target = resolve(collection, document);
    if (!target) return target.error();
    return fetch(*target);
}

auto Client::remove(const Name& collection, const Name& document) -> Result<void> {
    auto target = resolve(collection, document);
    if (!target) return target.error();

    auto response = request("DELETE", document_url(*target), std::nullopt);
    if (!response) return response.error();
    SPDLOG_DEBUG("deleted {}/{}", target->collection, target->document);
    return {};
}

// -- Read-modify-write --------------------------------------------------------

auto Client::update(const Name& collection, const Name& document, const PatchSpec& spec)
    -> Result<DocumentSnapshot> {
    auto target = resolve(collection, document);
    if (!target) return target.error();

    auto current = fetch(*target);
    if (!current) return current.error();

    auto patched = apply_patch(current->fields, spec, config_.mask_policy);
    if (!patched) return patched.error();

    if (patched->modified_keys.empty()) {
        SPDLOG_DEBUG("update of {}/{} changed nothing; not writing",
                     target->collection, target->document);
        return current;
    }

    // Masked keys missing from the body are deleted by the server.
    auto fields = nlohmann::json::object();
    for (const auto& key : patched->modified_keys) {
        auto it = patched->document.find(key);
        if (it == patched->document.end()) continue;
        auto wire = encode(it->second);
        if (!wire) {
            return Error{wire.error().kind, "field '" + key + "': " + wire.error().message};
        }
        fields[key] = std::move(*wire);
    }

    auto url = document_url(*target) + "?" + mask_query(patched->modified_keys) +
               "&currentDocument.updateTime=" + url_encode(current->update_time);
    auto response = request("PATCH", url, nlohmann::json{{"fields", std::move(fields)}});
    if (!response) {
        if (response.error().kind == ErrorKind::conflict) {
            SPDLOG_INFO("update of {}/{} lost a write race at version {}",
                        target->collection, target->document, current->update_time);
        }
        return response.error();
    }

    auto written = parse_document(*response);
    if (!written) return written.error();

    SPDLOG_DEBUG("updated {}/{} ({} fields) -> version {}", target->collection,
                 target->document, patched->modified_keys.size(), written->update_time);
    return DocumentSnapshot{
        std::move(written->name),
        std::move(patched->document),
        std::move(written->update_time),
        std::move(written->create_time),
    };
}

// -- Helpers ------------------------------------------------------------------

auto Client::document_name(std::string_view collection, std::string_view document) const
    -> std::string {
    return "projects/" + config_.project_id + "/databases/" + config_.database +
           "/documents/" + std::string{collection} + "/" + std::string{document};
}

auto Client::resolve(const Name& collection, const Name& document) const -> Result<Target> {
    const bool own_collection = !collection || collection->empty();
    const bool own_document = !document || document->empty();
    if (!own_collection && !own_document) return Target{*collection, *document};

    auto user = auth_->local_id();
    if (!user) {
        return Error{ErrorKind::authentication,
                     "private document access requires a signed-in user"};
    }
    return Target{own_collection ? *user : *collection, own_document ? *user : *document};
}

auto Client::fetch(const Target& target) -> Result<DocumentSnapshot> {
    auto response = request("GET", document_url(target), std::nullopt);
    if (!response) return response.error();
    return parse_document(*response);
}

auto Client::request(const std::string& method, const std::string& url,
                     const std::optional<nlohmann::json>& body) -> Result<nlohmann::json> {
    auto credential = auth_->current_credential();
    if (!credential) return credential.error();

    auto req = HttpRequest{method, url, {}, {}};
    req.headers.emplace_back("Authorization", "Bearer " + credential->id_token);
    if (body) {
        auto payload = detail::dump_body(*body);
        if (!payload) return payload.error();
        req.headers.emplace_back("Content-Type", std::string{detail::json_content_type});
        req.body = std::move(*payload);
    }

    auto response = http_->send(req);
    if (!response) return response.error();
    if (response->status != 200) {
        auto error = detail::document_error(*response);
        if (error.kind != ErrorKind::not_found && error.kind != ErrorKind::conflict) {
            SPDLOG_WARN("{} {} failed: {}", method, url.substr(0, url.find('?')), error.message);
        }
        return error;
    }
    return detail::parse_body(*response);
}

auto Client::documents_url() const -> std::string {
    return config_.firestore_endpoint + "projects/" + url_encode(config_.project_id) +
           "/databases/" + url_encode(config_.database) + "/documents";
}

auto Client::document_url(const Target& target) const -> std::string {
    return documents_url() + "/" + encode_segments(target.collection) + "/" +
           url_encode(target.document);
}

}  // namespace firestore_cpp
