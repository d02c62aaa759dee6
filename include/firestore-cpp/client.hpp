/// @file client.hpp
/// @brief Document operations against the Firestore REST API, including the
/// conflict-aware read-modify-write update.

#pragma once

#include <firestore-cpp/auth.hpp>
#include <firestore-cpp/config.hpp>
#include <firestore-cpp/error.hpp>
#include <firestore-cpp/http.hpp>
#include <firestore-cpp/patch.hpp>
#include <firestore-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace firestore_cpp {

/// Opaque server marker of a document's last write (its `updateTime`).
using VersionToken = std::string;

/// A document as last seen on the server.
struct DocumentSnapshot {
    std::string name;           ///< Full resource name.
    Map fields;                 ///< The document's root map.
    VersionToken update_time;   ///< Version token for optimistic concurrency.
    std::string create_time;

    auto operator==(const DocumentSnapshot&) const -> bool = default;
};

/// Quote a root key for use in an update mask: simple identifiers pass
/// through, anything else is wrapped in backticks with `\` and `` ` ``
/// escaped.
auto field_path(std::string_view key) -> std::string;

/// Reads and writes documents on behalf of the user signed in to an Auth.
///
/// A collection or document name given as std::nullopt or as an empty string
/// is replaced by the signed-in user's id, so `update(std::nullopt, std::nullopt, spec)` edits
/// that user's private document.
///
/// Every call blocks for its network round trips and returns a Result; no
/// call retries on its own. Thread-safe.
///
/// @code
/// auto client = Client{config, auth, http};
/// auto spec = PatchSpec{.replace = {{"visits", 1}}};
/// auto snap = client.update("counters", "home", spec);
/// if (!snap && snap.error().kind == ErrorKind::conflict) {
///     // someone else wrote first: re-run or give up
/// }
/// @endcode
class Client {
public:
    using Name = std::optional<std::string>;

    Client(ClientConfig config, std::shared_ptr<Auth> auth, std::shared_ptr<HttpClient> http);

    /// Create a document. Fails with ErrorKind::conflict if it exists.
    auto create(const Name& collection, const Name& document, const Map& fields)
        -> Result<DocumentSnapshot>;

    /// Read a document. Fails with ErrorKind::not_found if it is absent.
    auto read(const Name& collection, const Name& document) -> Result<DocumentSnapshot>;

    /// Fetch, patch and write back a document.
    ///
    /// Only the root keys the patch modified are written, conditioned on
    /// the document's update time being unchanged since the fetch. Returns
    /// the merged map and the new version token. If the document changed in
    /// between, fails with ErrorKind::conflict and writes nothing.
    auto update(const Name& collection, const Name& document, const PatchSpec& spec)
        -> Result<DocumentSnapshot>;

    /// Delete a document. Deleting an absent document succeeds.
    auto remove(const Name& collection, const Name& document) -> Result<void>;

    /// The fully qualified resource name of a document, suitable for a
    /// Reference value.
    auto document_name(std::string_view collection, std::string_view document) const
        -> std::string;

    auto config() const noexcept -> const ClientConfig& { return config_; }

private:
    struct Target {
        std::string collection;
        std::string document;
    };

    auto resolve(const Name& collection, const Name& document) const -> Result<Target>;
    auto fetch(const Target& target) -> Result<DocumentSnapshot>;
    auto request(const std::string& method, const std::string& url,
                 const std::optional<nlohmann::json>& body) -> Result<nlohmann::json>;
    auto documents_url() const -> std::string;
    auto document_url(const Target& target) const -> std::string;

    ClientConfig config_;
    std::shared_ptr<Auth> auth_;
    std::shared_ptr<HttpClient> http_;
};

}  // namespace firestore_cpp
