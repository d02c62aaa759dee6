// patch_test.cpp — Tests for the replace/delete/transform patch engine

#include <firestore-cpp/patch.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <set>
#include <stdexcept>
#include <string>

using namespace firestore_cpp;

namespace {

auto apply(const Map& doc, const PatchSpec& spec,
           MaskPolicy policy = MaskPolicy::conservative) -> PatchResult {
    auto r = apply_patch(doc, spec, policy);
    EXPECT_TRUE(r) << r.error().message;
    return *r;
}

auto keys(std::initializer_list<const char*> names) -> std::set<std::string> {
    return {names.begin(), names.end()};
}

auto scenario_document() -> Map {
    return Map{
        {"b", true},
        {"d", Map{{"c", -43}, {"e", List{-10, -20, -30}}}},
        {"a", List{1, 2, 3, 4, 5}},
    };
}

}  // namespace

// =============================================================================
// Scenarios
// =============================================================================

TEST(ApplyPatch, end_to_end_replace_scenario) {
    auto spec = PatchSpec{
        .replace = {{"new", true}, {"a", ListReplace{{1, "negative"}, {5, "new"}}}},
    };
    auto result = ::apply(scenario_document(), spec);

    auto expected = Map{
        {"b", true},
        {"d", Map{{"c", -43}, {"e", List{-10, -20, -30}}}},
        {"a", List{1, "negative", 3, 4, 5, "new"}},
        {"new", true},
    };
    EXPECT_EQ(result.document, expected);
    EXPECT_EQ(result.modified_keys, keys({"a", "new"}));
}

TEST(ApplyPatch, delete_scenario) {
    auto doc = Map{
        {"f", 1},
        {"d", Map{{"d", Map{{"aa", 2}}}}},
        {"a", List{10, 20, 30, Map{{"yes", 1}}}},
    };
    auto spec = PatchSpec{
        .remove = {
            {"f", Remove{}},
            {"d", DeleteMap{{"d", DeleteMap{{"aa", Remove{}}}}}},
            {"a", ListDelete{{0, Remove{}}, {3, DeleteMap{{"yes", Remove{}}}}}},
        },
    };
    auto result = ::apply(doc, spec);

    auto expected = Map{
        {"d", Map{{"d", Map{}}}},
        {"a", List{20, 30, Map{}}},
    };
    EXPECT_EQ(result.document, expected);
    EXPECT_EQ(result.modified_keys, keys({"a", "d", "f"}));
}

TEST(ApplyPatch, input_document_is_not_modified) {
    const auto doc = scenario_document();
    auto spec = PatchSpec{.replace = {{"b", false}}, .remove = {{"a", Remove{}}}};
    (void)::apply(doc, spec);
    EXPECT_EQ(doc, scenario_document());
}

// =============================================================================
// Replace pass
// =============================================================================

TEST(Replace, is_idempotent) {
    auto spec = PatchSpec{
        .replace = {
            {"new", true},
            {"d", ReplaceMap{{"c", 7}, {"z", ReplaceMap{{"deep", "x"}}}}},
            {"a", ListReplace{{0, 100}}},
        },
    };
    auto once = ::apply(scenario_document(), spec);
    auto twice = ::apply(once.document, spec);
    EXPECT_EQ(twice.document, once.document);
    EXPECT_TRUE(twice.modified_keys.empty());
}

TEST(Replace, append_at_length) {
    auto doc = Map{{"l", List{"x", "y"}}};
    auto result = ::apply(doc, PatchSpec{.replace = {{"l", ListReplace{{2, "z"}}}}});
    EXPECT_EQ(result.document, (Map{{"l", List{"x", "y", "z"}}}));
}

TEST(Replace, index_past_length_is_ignored) {
    auto doc = Map{{"l", List{"x", "y"}}};
    auto result = ::apply(doc, PatchSpec{.replace = {{"l", ListReplace{{5, "z"}}}}});
    EXPECT_EQ(result.document, doc);
    EXPECT_TRUE(result.modified_keys.empty());
}

TEST(Replace, elements_apply_in_listed_order) {
    auto doc = Map{{"l", List{"x"}}};
    auto result = ::apply(doc, PatchSpec{.replace = {{"l", ListReplace{{1, "y"}, {2, "z"}}}}});
    EXPECT_EQ(result.document, (Map{{"l", List{"x", "y", "z"}}}));
}

TEST(Replace, creates_missing_intermediate_maps) {
    auto result = ::apply(Map{}, PatchSpec{
        .replace = {{"profile", ReplaceMap{{"address", ReplaceMap{{"city", "Oslo"}}}}}},
    });
    EXPECT_EQ(result.document,
              (Map{{"profile", Map{{"address", Map{{"city", "Oslo"}}}}}}));
    EXPECT_EQ(result.modified_keys, keys({"profile"}));
}

TEST(Replace, list_replace_on_missing_key_creates_list_when_appending) {
    auto result = ::apply(Map{}, PatchSpec{.replace = {{"l", ListReplace{{0, 1}}}}});
    EXPECT_EQ(result.document, (Map{{"l", List{1}}}));

    auto ignored = ::apply(Map{}, PatchSpec{.replace = {{"l", ListReplace{{3, 1}}}}});
    EXPECT_TRUE(ignored.document.empty());
}

TEST(Replace, does_not_descend_into_scalars) {
    auto doc = Map{{"s", "scalar"}};
    auto result = ::apply(doc, PatchSpec{
        .replace = {{"s", ReplaceMap{{"k", 1}}}},
    });
    EXPECT_EQ(result.document, doc);
    EXPECT_TRUE(result.modified_keys.empty());
}

TEST(Replace, value_replaces_whole_subtree) {
    auto result = ::apply(scenario_document(), PatchSpec{.replace = {{"d", 5}}});
    EXPECT_EQ(result.document.at("d"), Value{5});
    EXPECT_EQ(result.modified_keys, keys({"d"}));
}

TEST(Replace, equal_value_is_not_a_modification) {
    auto result = ::apply(scenario_document(), PatchSpec{.replace = {{"b", true}}});
    EXPECT_TRUE(result.modified_keys.empty());
}

// =============================================================================
// Delete pass
// =============================================================================

TEST(Delete, list_removal_is_order_independent) {
    auto doc = Map{{"l", List{"a", "b", "c", "d"}}};
    auto forward = ::apply(doc, PatchSpec{.remove = {{"l", ListDelete{{0, Remove{}}, {2, Remove{}}}}}});
    auto backward = ::apply(doc, PatchSpec{.remove = {{"l", ListDelete{{2, Remove{}}, {0, Remove{}}}}}});

    EXPECT_EQ(forward.document, (Map{{"l", List{"b", "d"}}}));
    EXPECT_EQ(backward.document, forward.document);
}

TEST(Delete, descent_uses_original_indices) {
    auto doc = Map{{"l", List{"a", Map{{"x", 1}, {"y", 2}}}}};
    auto result = ::apply(doc, PatchSpec{
        .remove = {{"l", ListDelete{{0, Remove{}}, {1, DeleteMap{{"x", Remove{}}}}}}},
    });
    EXPECT_EQ(result.document, (Map{{"l", List{Map{{"y", 2}}}}}));
}

TEST(Delete, absent_paths_are_ignored) {
    auto doc = scenario_document();
    auto result = ::apply(doc, PatchSpec{
        .remove = {
            {"missing", Remove{}},
            {"nowhere", DeleteMap{{"x", Remove{}}}},
            {"d", DeleteMap{{"nope", Remove{}}}},
            {"a", ListDelete{{99, Remove{}}}},
            {"b", DeleteMap{{"x", Remove{}}}},
        },
    });
    EXPECT_EQ(result.document, doc);
    EXPECT_TRUE(result.modified_keys.empty());
}

TEST(Delete, runs_after_replace) {
    auto result = ::apply(Map{}, PatchSpec{
        .replace = {{"tmp", 1}},
        .remove = {{"tmp", Remove{}}},
    });
    EXPECT_TRUE(result.document.empty());
    EXPECT_EQ(result.modified_keys, keys({"tmp"}));
}

// =============================================================================
// Transform pass
// =============================================================================

TEST(Transform, sees_output_of_replace_and_delete) {
    auto seen = Map{};
    auto spec = PatchSpec{
        .replace = {{"x", 1}},
        .remove = {{"b", Remove{}}},
        .transform = [&](Map m) {
            seen = m;
            return m;
        },
    };
    (void)::apply(Map{{"b", true}}, spec);
    EXPECT_EQ(seen, (Map{{"x", 1}}));
}

TEST(Transform, conservative_policy_masks_every_key) {
    auto spec = PatchSpec{.transform = [](Map m) {
        m["counter"] = 1;
        return m;
    }};
    auto result = ::apply(Map{{"keep", "same"}, {"drop", 0}}, spec);
    EXPECT_EQ(result.modified_keys, keys({"counter", "drop", "keep"}));
}

TEST(Transform, diff_policy_masks_changed_added_and_dropped_keys) {
    auto spec = PatchSpec{.transform = [](Map m) {
        m.erase("drop");
        m["changed"] = 2;
        m["added"] = 3;
        return m;
    }};
    auto doc = Map{{"keep", "same"}, {"drop", 0}, {"changed", 1}};
    auto result = ::apply(doc, spec, MaskPolicy::diff);
    EXPECT_EQ(result.modified_keys, keys({"added", "changed", "drop"}));
    EXPECT_EQ(result.document, (Map{{"keep", "same"}, {"changed", 2}, {"added", 3}}));
}

TEST(Transform, diff_policy_keeps_keys_marked_by_replace) {
    auto spec = PatchSpec{
        .replace = {{"r", 1}},
        .transform = [](Map m) { return m; },
    };
    auto result = ::apply(Map{}, spec, MaskPolicy::diff);
    EXPECT_EQ(result.modified_keys, keys({"r"}));
}

TEST(Transform, may_keep_state_between_calls) {
    auto calls = 0;
    auto spec = PatchSpec{.transform = [&](Map m) {
        m["n"] = ++calls;
        return m;
    }};
    (void)::apply(Map{}, spec);
    auto second = ::apply(Map{}, spec);
    EXPECT_EQ(second.document.at("n"), Value{2});
}

TEST(Transform, throwing_transform_fails_without_partial_result) {
    auto spec = PatchSpec{
        .replace = {{"x", 1}},
        .transform = [](Map) -> Map { throw std::runtime_error{"boom"}; },
    };
    auto r = apply_patch(Map{}, spec);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::transform_failed);
    EXPECT_EQ(r.error().message, "boom");
}

TEST(Transform, non_standard_exception_is_reported) {
    auto spec = PatchSpec{
        .replace = {{"x", 1}},
        .transform = [](Map) -> Map { throw 42; },
    };
    auto r = apply_patch(Map{}, spec);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::transform_failed);
    EXPECT_EQ(r.error().message, "transform threw a non-standard exception");
}

// =============================================================================
// Validation
// =============================================================================

TEST(ValidatePatch, duplicate_replace_index_is_rejected) {
    auto spec = PatchSpec{.replace = {{"a", ListReplace{{1, "x"}, {1, "y"}}}}};
    auto r = apply_patch(scenario_document(), spec);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::patch_spec);
    EXPECT_NE(r.error().message.find("a[1]"), std::string::npos);
}

TEST(ValidatePatch, duplicate_delete_index_is_rejected) {
    auto spec = PatchSpec{.remove = {{"a", ListDelete{{0, Remove{}}, {0, Remove{}}}}}};
    auto r = validate_patch(spec);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::patch_spec);
}

TEST(ValidatePatch, nested_list_delete_is_rejected) {
    auto spec = PatchSpec{.remove = {{"a", ListDelete{{0, ListDelete{{0, Remove{}}}}}}}};
    auto r = validate_patch(spec);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::patch_spec);
}

TEST(ValidatePatch, well_formed_spec_passes) {
    EXPECT_TRUE(validate_patch(PatchSpec{
        .replace = {{"a", ListReplace{{0, 1}, {1, 2}}}},
        .remove = {{"a", ListDelete{{2, DeleteMap{{"k", Remove{}}}}}}},
    }));
}

// =============================================================================
// Paths
// =============================================================================

TEST(Path, to_string_renders_keys_and_indices) {
    EXPECT_EQ(to_string(Path{"config", "items", std::size_t{0}, "name"}), "config.items[0].name");
    EXPECT_EQ(to_string(Path{}), "");
}

TEST(MaskPolicy, to_string_view_names) {
    EXPECT_EQ(to_string_view(MaskPolicy::conservative), "conservative");
    EXPECT_EQ(to_string_view(MaskPolicy::diff), "diff");
}

// =============================================================================
// PatchBuilder
// =============================================================================

TEST(PatchBuilder, builds_the_replace_scenario) {
    auto spec = PatchBuilder{}
        .replace({"new"}, true)
        .replace({"a", std::size_t{1}}, "negative")
        .replace({"a", std::size_t{5}}, "new")
        .build();
    ASSERT_TRUE(spec) << spec.error().message;

    auto result = ::apply(scenario_document(), *spec);
    EXPECT_EQ(result.document.at("a"), (Value{List{1, "negative", 3, 4, 5, "new"}}));
    EXPECT_EQ(result.document.at("new"), Value{true});
}

TEST(PatchBuilder, builds_the_delete_scenario) {
    auto spec = PatchBuilder{}
        .remove({"f"})
        .remove({"d", "d", "aa"})
        .remove({"a", std::size_t{0}})
        .remove({"a", std::size_t{3}, "yes"})
        .build();
    ASSERT_TRUE(spec) << spec.error().message;

    auto doc = Map{
        {"f", 1},
        {"d", Map{{"d", Map{{"aa", 2}}}}},
        {"a", List{10, 20, 30, Map{{"yes", 1}}}},
    };
    auto result = ::apply(doc, *spec);
    EXPECT_EQ(result.document, (Map{{"d", Map{{"d", Map{}}}}, {"a", List{20, 30, Map{}}}}));
}

TEST(PatchBuilder, nested_keys_share_intermediate_maps) {
    auto spec = PatchBuilder{}
        .replace({"p", "x"}, 1)
        .replace({"p", "y"}, 2)
        .build();
    ASSERT_TRUE(spec);
    auto result = ::apply(Map{}, *spec);
    EXPECT_EQ(result.document, (Map{{"p", Map{{"x", 1}, {"y", 2}}}}));
}

TEST(PatchBuilder, carries_transform) {
    auto spec = PatchBuilder{}
        .transform([](Map m) {
            m["t"] = true;
            return m;
        })
        .build();
    ASSERT_TRUE(spec);
    EXPECT_EQ(::apply(Map{}, *spec).document, (Map{{"t", true}}));
}

TEST(PatchBuilder, leaf_and_continuation_conflict) {
    auto spec = PatchBuilder{}
        .replace({"p"}, 1)
        .replace({"p", "x"}, 2)
        .build();
    ASSERT_FALSE(spec);
    EXPECT_EQ(spec.error().kind, ErrorKind::patch_spec);

    auto reversed = PatchBuilder{}
        .replace({"p", "x"}, 2)
        .replace({"p"}, 1)
        .build();
    ASSERT_FALSE(reversed);
    EXPECT_EQ(reversed.error().kind, ErrorKind::patch_spec);
}

TEST(PatchBuilder, duplicate_paths_conflict) {
    EXPECT_FALSE(PatchBuilder{}.replace({"k"}, 1).replace({"k"}, 2).build());
    EXPECT_FALSE(PatchBuilder{}
        .replace({"l", std::size_t{0}}, 1)
        .replace({"l", std::size_t{0}}, 2)
        .build());
    EXPECT_FALSE(PatchBuilder{}.remove({"k"}).remove({"k", "x"}).build());
    EXPECT_FALSE(PatchBuilder{}
        .remove({"l", std::size_t{1}})
        .remove({"l", std::size_t{1}})
        .build());
}

TEST(PatchBuilder, map_and_list_at_same_key_conflict) {
    auto spec = PatchBuilder{}
        .replace({"k", "x"}, 1)
        .replace({"k", std::size_t{0}}, 2)
        .build();
    ASSERT_FALSE(spec);
    EXPECT_EQ(spec.error().kind, ErrorKind::patch_spec);
}

TEST(PatchBuilder, malformed_paths_are_rejected) {
    EXPECT_FALSE(PatchBuilder{}.replace({}, 1).build());
    EXPECT_FALSE(PatchBuilder{}.replace({std::size_t{0}}, 1).build());
    EXPECT_FALSE(PatchBuilder{}.replace({"l", std::size_t{0}, "x"}, 1).build());
    EXPECT_FALSE(PatchBuilder{}.remove({}).build());
    EXPECT_FALSE(PatchBuilder{}.remove({"l", std::size_t{0}, std::size_t{1}}).build());
}

TEST(PatchBuilder, replace_and_remove_same_key_is_allowed) {
    auto spec = PatchBuilder{}.replace({"k"}, 1).remove({"k"}).build();
    ASSERT_TRUE(spec);
    EXPECT_TRUE(::apply(Map{}, *spec).document.empty());
}
