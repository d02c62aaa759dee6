#include <firestore-cpp/value.hpp>

namespace firestore_cpp {

namespace {

auto count_entries(const Value& v) -> std::size_t {
    return std::visit(overload{
        [](const Map& m) { return count_index_entries(m); },
        [](const List& l) {
            auto n = std::size_t{0};
            for (const auto& e : l) n += count_entries(e);
            return n;
        },
        [](const auto&) { return std::size_t{1}; },
    }, v.variant());
}

}  // anonymous namespace

auto count_index_entries(const Map& m) -> std::size_t {
    auto n = std::size_t{0};
    for (const auto& [key, value] : m) {
        n += count_entries(value);
    }
    return n;
}

}  // namespace firestore_cpp
