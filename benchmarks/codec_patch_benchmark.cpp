// firestore-cpp benchmarks — measures throughput of the wire codec and the
// patch engine, the CPU-bound halves of every update.

#include <firestore-cpp/codec.hpp>
#include <firestore-cpp/patch.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>

using namespace firestore_cpp;

// A document with `n` root keys, each holding a small nested map and list.
static auto make_document(std::int64_t n) -> Map {
    auto doc = Map{};
    for (std::int64_t i = 0; i < n; ++i) {
        doc.emplace("key" + std::to_string(i), Map{
            {"id", i},
            {"name", "item " + std::to_string(i)},
            {"score", static_cast<double>(i) * 0.5},
            {"tags", List{"a", "b", "c"}},
            {"where", GeoPoint{12.5, 45.25}},
        });
    }
    return doc;
}

// =============================================================================
// Codec
// =============================================================================

static void bm_encode_fields(benchmark::State& state) {
    const auto doc = make_document(state.range(0));
    for (auto _ : state) {
        auto wire = encode_fields(doc);
        benchmark::DoNotOptimize(wire);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_encode_fields)->Range(8, 512);

static void bm_decode_fields(benchmark::State& state) {
    const auto wire = *encode_fields(make_document(state.range(0)));
    for (auto _ : state) {
        auto doc = decode_fields(wire);
        benchmark::DoNotOptimize(doc);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_decode_fields)->Range(8, 512);

static void bm_wire_text_round_trip(benchmark::State& state) {
    const auto doc = make_document(state.range(0));
    for (auto _ : state) {
        auto text = encode_fields(doc)->dump();
        auto back = decode_fields(nlohmann::json::parse(text));
        benchmark::DoNotOptimize(back);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_wire_text_round_trip)->Range(8, 512);

// =============================================================================
// Patch engine
// =============================================================================

static void bm_apply_replace(benchmark::State& state) {
    const auto doc = make_document(state.range(0));
    const auto spec = PatchSpec{
        .replace = {
            {"key0", ReplaceMap{{"name", "renamed"}, {"tags", ListReplace{{3, "d"}}}}},
            {"fresh", true},
        },
    };
    for (auto _ : state) {
        auto result = apply_patch(doc, spec);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(bm_apply_replace)->Range(8, 512);

static void bm_apply_list_delete(benchmark::State& state) {
    const auto n = state.range(0);
    auto items = List{};
    for (std::int64_t i = 0; i < n; ++i) items.emplace_back(i);
    const auto doc = Map{{"items", std::move(items)}};

    auto removals = ListDelete{};
    for (std::int64_t i = 0; i < n; i += 2) {
        removals.elements.emplace_back(static_cast<std::size_t>(i), Remove{});
    }
    const auto spec = PatchSpec{.remove = {{"items", std::move(removals)}}};

    for (auto _ : state) {
        auto result = apply_patch(doc, spec);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * n / 2);
}
BENCHMARK(bm_apply_list_delete)->Range(8, 4096);

static void bm_apply_transform_diff(benchmark::State& state) {
    const auto doc = make_document(state.range(0));
    const auto spec = PatchSpec{.transform = [](Map m) {
        m["key0"] = 0;
        return m;
    }};
    for (auto _ : state) {
        auto result = apply_patch(doc, spec, MaskPolicy::diff);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(bm_apply_transform_diff)->Range(8, 512);

static void bm_patch_builder(benchmark::State& state) {
    for (auto _ : state) {
        auto spec = PatchBuilder{}
            .replace({"profile", "name"}, "Alice")
            .replace({"profile", "address", "city"}, "Oslo")
            .replace({"scores", std::size_t{3}}, 17)
            .remove({"items", std::size_t{0}})
            .remove({"items", std::size_t{4}, "flag"})
            .build();
        benchmark::DoNotOptimize(spec);
    }
}
BENCHMARK(bm_patch_builder);
