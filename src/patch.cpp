#include <firestore-cpp/patch.hpp>

#include <algorithm>
#include <exception>
#include <iterator>
#include <set>
#include <string>
#include <utility>

namespace firestore_cpp {

auto to_string(const Path& path) -> std::string {
    auto out = std::string{};
    for (const auto& element : path) {
        std::visit(overload{
            [&](const std::string& key) {
                if (!out.empty()) out += '.';
                out += key;
            },
            [&](std::size_t index) {
                out += '[';
                out += std::to_string(index);
                out += ']';
            },
        }, element);
    }
    return out;
}

namespace {

// =============================================================================
// Validation
// =============================================================================

auto validate_replace(const ReplaceMap& spec, const Path& at) -> Result<void>;
auto validate_delete(const DeleteMap& spec, const Path& at) -> Result<void>;

auto duplicate_index_error(const Path& at, std::size_t index) -> Error {
    auto p = at;
    p.emplace_back(index);
    return Error{ErrorKind::patch_spec,
                 "list index " + to_string(p) + " is specified more than once"};
}

auto validate_replace(const ReplaceMap& spec, const Path& at) -> Result<void> {
    for (const auto& [key, node] : spec) {
        auto here = at;
        here.emplace_back(key);
        if (const auto* children = std::get_if<ReplaceMap>(&node.variant())) {
            if (auto r = validate_replace(*children, here); !r) return r;
        } else if (const auto* list = std::get_if<ListReplace>(&node.variant())) {
            auto seen = std::set<std::size_t>{};
            for (const auto& [index, value] : list->elements) {
                if (!seen.insert(index).second) return duplicate_index_error(here, index);
            }
        }
    }
    return {};
}

auto validate_list_delete(const ListDelete& list, const Path& at) -> Result<void> {
    auto seen = std::set<std::size_t>{};
    for (const auto& [index, node] : list.elements) {
        if (!seen.insert(index).second) return duplicate_index_error(at, index);
        auto here = at;
        here.emplace_back(index);
        if (std::holds_alternative<ListDelete>(node.variant())) {
            return Error{ErrorKind::patch_spec,
                         "list element " + to_string(here) +
                         " cannot contain a list; lists do not nest directly"};
        }
        if (const auto* children = std::get_if<DeleteMap>(&node.variant())) {
            if (auto r = validate_delete(*children, here); !r) return r;
        }
    }
    return {};
}

auto validate_delete(const DeleteMap& spec, const Path& at) -> Result<void> {
    for (const auto& [key, node] : spec) {
        auto here = at;
        here.emplace_back(key);
        if (const auto* children = std::get_if<DeleteMap>(&node.variant())) {
            if (auto r = validate_delete(*children, here); !r) return r;
        } else if (const auto* list = std::get_if<ListDelete>(&node.variant())) {
            if (auto r = validate_list_delete(*list, here); !r) return r;
        }
    }
    return {};
}

// =============================================================================
// Replace pass
// =============================================================================
//
// Each helper returns true when it changed the tree.

auto replace_map(Map& target, const ReplaceMap& spec) -> bool;

auto replace_list(List& target, const ListReplace& spec) -> bool {
    auto changed = false;
    for (const auto& [index, value] : spec.elements) {
        if (index < target.size()) {
            if (target[index] != value) {
                target[index] = value;
                changed = true;
            }
        } else if (index == target.size()) {
            target.push_back(value);
            changed = true;
        }
    }
    return changed;
}

auto replace_entry(Map& target, const std::string& key, const ReplaceNode& node) -> bool {
    return std::visit(overload{
        [&](const Value& value) {
            auto it = target.find(key);
            if (it == target.end()) {
                target.emplace(key, value);
                return true;
            }
            if (it->second == value) return false;
            it->second = value;
            return true;
        },
        [&](const ReplaceMap& children) {
            auto it = target.find(key);
            if (it == target.end()) {
                auto fresh = Map{};
                replace_map(fresh, children);
                target.emplace(key, std::move(fresh));
                return true;
            }
            // A non-map value is not descended into.
            if (auto* m = it->second.get_if<Map>()) return replace_map(*m, children);
            return false;
        },
        [&](const ListReplace& elements) {
            auto it = target.find(key);
            if (it == target.end()) {
                auto fresh = List{};
                if (!replace_list(fresh, elements)) return false;
                target.emplace(key, std::move(fresh));
                return true;
            }
            if (auto* l = it->second.get_if<List>()) return replace_list(*l, elements);
            return false;
        },
    }, node.variant());
}

auto replace_map(Map& target, const ReplaceMap& spec) -> bool {
    auto changed = false;
    for (const auto& [key, node] : spec) {
        changed = replace_entry(target, key, node) || changed;
    }
    return changed;
}

// =============================================================================
// Delete pass
// =============================================================================

auto delete_map(Map& target, const DeleteMap& spec) -> bool;

auto delete_list(List& target, const ListDelete& spec) -> bool {
    auto changed = false;

    // Descend first, while every index still refers to the original list.
    auto removals = std::set<std::size_t>{};
    for (const auto& [index, node] : spec.elements) {
        if (index >= target.size()) continue;
        if (std::holds_alternative<Remove>(node.variant())) {
            removals.insert(index);
        } else if (const auto* children = std::get_if<DeleteMap>(&node.variant())) {
            if (auto* m = target[index].get_if<Map>()) {
                changed = delete_map(*m, *children) || changed;
            }
        }
    }

    for (auto it = removals.rbegin(); it != removals.rend(); ++it) {
        target.erase(target.begin() + static_cast<std::ptrdiff_t>(*it));
        changed = true;
    }
    return changed;
}

auto delete_entry(Map& target, const std::string& key, const DeleteNode& node) -> bool {
    auto it = target.find(key);
    if (it == target.end()) return false;

    return std::visit(overload{
        [&](Remove) {
            target.erase(it);
            return true;
        },
        [&](const DeleteMap& children) {
            if (auto* m = it->second.get_if<Map>()) return delete_map(*m, children);
            return false;
        },
        [&](const ListDelete& elements) {
            if (auto* l = it->second.get_if<List>()) return delete_list(*l, elements);
            return false;
        },
    }, node.variant());
}

auto delete_map(Map& target, const DeleteMap& spec) -> bool {
    auto changed = false;
    for (const auto& [key, node] : spec) {
        changed = delete_entry(target, key, node) || changed;
    }
    return changed;
}

// =============================================================================
// Transform pass
// =============================================================================

void mark_transformed(const Map& before, const Map& after, MaskPolicy policy,
                      std::set<std::string>& modified) {
    for (const auto& [key, value] : after) {
        if (policy == MaskPolicy::conservative) {
            modified.insert(key);
            continue;
        }
        auto it = before.find(key);
        if (it == before.end() || it->second != value) modified.insert(key);
    }
    // Keys the transform dropped are deletions either way.
    for (const auto& [key, value] : before) {
        if (policy == MaskPolicy::conservative || !after.contains(key)) {
            modified.insert(key);
        }
    }
}

}  // anonymous namespace

auto validate_patch(const PatchSpec& spec) -> Result<void> {
    if (auto r = validate_replace(spec.replace, Path{}); !r) return r;
    return validate_delete(spec.remove, Path{});
}

auto apply_patch(const Map& current, const PatchSpec& spec,
                 MaskPolicy policy) -> Result<PatchResult> {
    if (auto r = validate_patch(spec); !r) return r.error();

    auto result = PatchResult{current, {}};

    for (const auto& [key, node] : spec.replace) {
        if (replace_entry(result.document, key, node)) result.modified_keys.insert(key);
    }
    for (const auto& [key, node] : spec.remove) {
        if (delete_entry(result.document, key, node)) result.modified_keys.insert(key);
    }

    if (spec.transform) {
        auto before = result.document;
        try {
            result.document = spec.transform(std::move(result.document));
        } catch (const std::exception& e) {
            return Error{ErrorKind::transform_failed, e.what()};
        } catch (...) {
            return Error{ErrorKind::transform_failed, "transform threw a non-standard exception"};
        }
        mark_transformed(before, result.document, policy, result.modified_keys);
    }
    return result;
}

// =============================================================================
// PatchBuilder
// =============================================================================

namespace {

auto conflict_error(const Path& path) -> Error {
    return Error{ErrorKind::patch_spec,
                 "path " + to_string(path) +
                 " is specified both as a leaf and as a continuation, or twice"};
}

auto shape_error(const Path& path, std::string_view why) -> Error {
    return Error{ErrorKind::patch_spec, "path " + to_string(path) + ": " + std::string{why}};
}

auto insert_replace(ReplaceMap& root, const Path& path, const Value& value) -> Result<void> {
    if (path.empty() || !std::holds_alternative<std::string>(path.front())) {
        return shape_error(path, "must start with a map key");
    }

    auto* level = &root;
    for (std::size_t i = 0; i < path.size(); ++i) {
        const auto& key = std::get<std::string>(path[i]);
        const bool last = i + 1 == path.size();

        if (last) {
            if (level->contains(key)) return conflict_error(path);
            level->emplace(key, value);
            return {};
        }

        if (const auto* index = std::get_if<std::size_t>(&path[i + 1])) {
            if (i + 2 != path.size()) {
                return shape_error(path, "a replaced list element must be the last element");
            }
            auto it = level->find(key);
            if (it == level->end()) {
                it = level->emplace(key, ListReplace{}).first;
            }
            auto* list = std::get_if<ListReplace>(&it->second.variant());
            if (!list) return conflict_error(path);
            for (const auto& [existing, v] : list->elements) {
                if (existing == *index) return conflict_error(path);
            }
            list->elements.emplace_back(*index, value);
            return {};
        }

        auto it = level->find(key);
        if (it == level->end()) {
            it = level->emplace(key, ReplaceMap{}).first;
        }
        level = std::get_if<ReplaceMap>(&it->second.variant());
        if (!level) return conflict_error(path);
    }
    return {};
}

auto insert_delete_in_map(DeleteMap& level, const Path& path, std::size_t i) -> Result<void>;

auto insert_delete_in_list(ListDelete& list, const Path& path, std::size_t i) -> Result<void> {
    const auto index = std::get<std::size_t>(path[i]);
    auto it = std::find_if(list.elements.begin(), list.elements.end(),
                           [&](const auto& e) { return e.first == index; });

    if (i + 1 == path.size()) {
        if (it != list.elements.end()) return conflict_error(path);
        list.elements.emplace_back(index, Remove{});
        return {};
    }
    if (std::holds_alternative<std::size_t>(path[i + 1])) {
        return shape_error(path, "lists do not nest directly");
    }
    if (it == list.elements.end()) {
        list.elements.emplace_back(index, DeleteMap{});
        it = std::prev(list.elements.end());
    }
    auto* children = std::get_if<DeleteMap>(&it->second.variant());
    if (!children) return conflict_error(path);
    return insert_delete_in_map(*children, path, i + 1);
}

auto insert_delete_in_map(DeleteMap& level, const Path& path, std::size_t i) -> Result<void> {
    const auto& key = std::get<std::string>(path[i]);
    auto it = level.find(key);

    if (i + 1 == path.size()) {
        if (it != level.end()) return conflict_error(path);
        level.emplace(key, Remove{});
        return {};
    }

    if (std::holds_alternative<std::size_t>(path[i + 1])) {
        if (it == level.end()) it = level.emplace(key, ListDelete{}).first;
        auto* list = std::get_if<ListDelete>(&it->second.variant());
        if (!list) return conflict_error(path);
        return insert_delete_in_list(*list, path, i + 1);
    }

    if (it == level.end()) it = level.emplace(key, DeleteMap{}).first;
    auto* children = std::get_if<DeleteMap>(&it->second.variant());
    if (!children) return conflict_error(path);
    return insert_delete_in_map(*children, path, i + 1);
}

}  // anonymous namespace

auto PatchBuilder::replace(Path path, Value value) -> PatchBuilder& {
    replaces_.emplace_back(std::move(path), std::move(value));
    return *this;
}

auto PatchBuilder::remove(Path path) -> PatchBuilder& {
    removes_.push_back(std::move(path));
    return *this;
}

auto PatchBuilder::transform(Transform fn) -> PatchBuilder& {
    transform_ = std::move(fn);
    return *this;
}

auto PatchBuilder::build() const -> Result<PatchSpec> {
    auto spec = PatchSpec{};
    for (const auto& [path, value] : replaces_) {
        if (auto r = insert_replace(spec.replace, path, value); !r) return r.error();
    }
    for (const auto& path : removes_) {
        if (path.empty() || !std::holds_alternative<std::string>(path.front())) {
            return shape_error(path, "must start with a map key");
        }
        if (auto r = insert_delete_in_map(spec.remove, path, 0); !r) return r.error();
    }
    spec.transform = transform_;
    return spec;
}

}  // namespace firestore_cpp
