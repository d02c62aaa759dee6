// Fuzz target for PatchBuilder and apply_patch() — turns the input into a
// sequence of replace/remove paths over a small fixed document. Building may
// fail; applying a built spec must never crash.

#include <firestore-cpp/patch.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace {

auto next(const uint8_t*& data, size_t& size) -> uint8_t {
    if (size == 0) return 0;
    --size;
    return *data++;
}

auto read_path(const uint8_t*& data, size_t& size) -> firestore_cpp::Path {
    auto path = firestore_cpp::Path{};
    auto length = next(data, size) % 5;
    for (uint8_t i = 0; i < length; ++i) {
        auto b = next(data, size);
        if (b & 0x80) {
            path.emplace_back(static_cast<std::size_t>(b & 0x07));
        } else {
            path.emplace_back(std::string(1, static_cast<char>('a' + b % 4)));
        }
    }
    return path;
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    using namespace firestore_cpp;

    const auto doc = Map{
        {"a", List{1, 2, Map{{"b", 3}}, 4}},
        {"b", Map{{"c", Map{{"d", true}}}, {"a", List{}}}},
        {"c", "text"},
    };

    auto builder = PatchBuilder{};
    while (size > 0) {
        auto op = next(data, size);
        auto path = read_path(data, size);
        if (op & 1) {
            builder.remove(std::move(path));
        } else {
            builder.replace(std::move(path), static_cast<std::int64_t>(op));
        }
    }

    auto spec = builder.build();
    if (spec) {
        auto conservative = apply_patch(doc, *spec);
        auto diff = apply_patch(doc, *spec, MaskPolicy::diff);
        (void)conservative;
        (void)diff;
    }
    return 0;
}
