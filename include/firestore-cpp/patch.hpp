/// @file patch.hpp
/// @brief Hierarchical replace/delete/transform descriptions and the engine
/// that applies them to a document tree.

#pragma once

#include <firestore-cpp/error.hpp>
#include <firestore-cpp/value.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace firestore_cpp {

/// A path element: either a map key or a list index.
using PathElement = std::variant<std::string, std::size_t>;

/// A path into the document tree (e.g. "config" / "items" / 0).
using Path = std::vector<PathElement>;

/// Render a path as "config.items[0]".
auto to_string(const Path& path) -> std::string;

// -- Replace spec -------------------------------------------------------------

class ReplaceNode;

/// Replace entries keyed by map key, mirroring the document hierarchy.
using ReplaceMap = std::map<std::string, ReplaceNode, std::less<>>;

/// Element edits on a list: `(index, value)` sets the element when
/// `index < length`, appends when `index == length`, and is ignored when
/// `index > length`. Pairs are applied in the order listed.
struct ListReplace {
    std::vector<std::pair<std::size_t, Value>> elements;

    ListReplace() = default;
    ListReplace(std::initializer_list<std::pair<std::size_t, Value>> e)
        : elements(e) {}
};

/// One replace entry: set the key to a Value, descend into a nested map
/// (created when absent), or edit list elements.
class ReplaceNode {
public:
    using Variant = std::variant<Value, ReplaceMap, ListReplace>;

    template <typename T>
        requires std::constructible_from<Value, T>
    ReplaceNode(T&& value) : node_{std::in_place_index<0>, std::forward<T>(value)} {}

    ReplaceNode(ReplaceMap children) : node_{std::move(children)} {}
    ReplaceNode(ListReplace elements) : node_{std::move(elements)} {}

    auto variant() const noexcept -> const Variant& { return node_; }
    auto variant() noexcept -> Variant& { return node_; }

private:
    Variant node_;
};

// -- Delete spec --------------------------------------------------------------

/// Marks a key or list element for removal.
struct Remove {
    auto operator==(const Remove&) const -> bool = default;
};

class DeleteNode;

/// Delete entries keyed by map key, mirroring the document hierarchy.
using DeleteMap = std::map<std::string, DeleteNode, std::less<>>;

/// Element deletions on a list. `(index, Remove{})` removes the element;
/// `(index, DeleteMap{...})` descends into the map stored at that index.
/// All indices refer to the list as it was before any removal.
struct ListDelete {
    std::vector<std::pair<std::size_t, DeleteNode>> elements;

    ListDelete() = default;
    ListDelete(std::initializer_list<std::pair<std::size_t, DeleteNode>> e);
};

/// One delete entry: remove the key, descend into a nested map, or delete
/// list elements. Absent intermediates make the entry a no-op.
class DeleteNode {
public:
    using Variant = std::variant<Remove, DeleteMap, ListDelete>;

    DeleteNode(Remove r) : node_{r} {}
    DeleteNode(DeleteMap children) : node_{std::move(children)} {}
    DeleteNode(ListDelete elements) : node_{std::move(elements)} {}

    auto variant() const noexcept -> const Variant& { return node_; }
    auto variant() noexcept -> Variant& { return node_; }

private:
    Variant node_;
};

inline ListDelete::ListDelete(std::initializer_list<std::pair<std::size_t, DeleteNode>> e)
    : elements(e) {}

// -- PatchSpec ----------------------------------------------------------------

/// A caller-supplied function run after the replace and delete passes.
/// It receives the patched map and returns the final map.
using Transform = std::function<Map(Map)>;

/// A declarative mutation: replace, then delete, then transform.
///
/// @code
/// auto spec = PatchSpec{
///     .replace = {{"new", true}, {"a", ListReplace{{1, "negative"}, {5, "new"}}}},
///     .remove  = {{"f", Remove{}}, {"d", DeleteMap{{"aa", Remove{}}}}},
/// };
/// @endcode
struct PatchSpec {
    ReplaceMap replace;
    DeleteMap remove;
    Transform transform;
};

/// Which root keys are reported modified when a transform ran.
enum class MaskPolicy : std::uint8_t {
    conservative,  ///< Every root key present before or after the transform.
    diff,          ///< Only root keys whose value the transform changed.
};

/// Convert a MaskPolicy to its string representation.
constexpr auto to_string_view(MaskPolicy policy) noexcept -> std::string_view {
    switch (policy) {
        case MaskPolicy::conservative: return "conservative";
        case MaskPolicy::diff:         return "diff";
    }
    return "unknown";
}

/// The outcome of applying a PatchSpec.
struct PatchResult {
    Map document;                          ///< The patched tree.
    std::set<std::string> modified_keys;   ///< Root keys to write back.
};

/// Check a PatchSpec for ambiguous entries: a list index listed twice in one
/// ListReplace or ListDelete, or a ListDelete nested directly in a
/// ListDelete. Fails with ErrorKind::patch_spec.
auto validate_patch(const PatchSpec& spec) -> Result<void>;

/// Apply a PatchSpec to a copy of `current`.
///
/// Runs validation, the replace pass, the delete pass and the transform
/// pass, in that order. `current` is never modified; on failure no partial
/// result is returned.
auto apply_patch(const Map& current, const PatchSpec& spec,
                 MaskPolicy policy = MaskPolicy::conservative) -> Result<PatchResult>;

/// Builds a PatchSpec from flat paths.
///
/// A path may not be both a leaf and the prefix of another path, and may
/// not address the same key or index twice; build() rejects such specs with
/// ErrorKind::patch_spec.
///
/// @code
/// auto spec = PatchBuilder{}
///     .replace({"profile", "name"}, "Alice")
///     .replace({"scores", std::size_t{3}}, 17)
///     .remove({"items", std::size_t{0}})
///     .build();
/// @endcode
class PatchBuilder {
public:
    /// Set the value at `path`. The path starts with a key; an index may
    /// only appear as the last element.
    auto replace(Path path, Value value) -> PatchBuilder&;

    /// Remove the key or list element at `path`. An index may be followed
    /// by keys that descend into a map stored in the list.
    auto remove(Path path) -> PatchBuilder&;

    /// Set the transform function.
    auto transform(Transform fn) -> PatchBuilder&;

    auto build() const -> Result<PatchSpec>;

private:
    std::vector<std::pair<Path, Value>> replaces_;
    std::vector<Path> removes_;
    Transform transform_;
};

}  // namespace firestore_cpp
