/// @file value.hpp
/// @brief The document value model: Value, List, Map and the tag types.

#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace firestore_cpp {

/// Represents a null field value.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

/// A geographic coordinate.
///
/// Latitude is in [-90, 90] (positive is north), longitude in [-180, 180]
/// (positive is east). Encoding a point outside these ranges fails.
struct GeoPoint {
    double latitude{0.0};   ///< Degrees north.
    double longitude{0.0};  ///< Degrees east.

    /// Build a point, clamping out-of-range input to the poles and the
    /// antimeridian.
    static auto clamped(double latitude, double longitude) -> GeoPoint {
        return GeoPoint{std::clamp(latitude, -90.0, 90.0),
                        std::clamp(longitude, -180.0, 180.0)};
    }

    auto operator==(const GeoPoint&) const -> bool = default;
};

/// An ISO-8601 UTC timestamp, stored and sent verbatim.
struct Timestamp {
    std::string value{"2000-01-01T00:00:00Z"};  ///< e.g. "2024-05-01T12:00:00.000Z"

    auto operator==(const Timestamp&) const -> bool = default;
};

/// A reference to another document by its fully qualified resource name
/// ("projects/{p}/databases/{d}/documents/{collection}/{id}").
struct Reference {
    std::string path;

    auto operator==(const Reference&) const -> bool = default;
};

/// A byte array value.
using Bytes = std::vector<std::byte>;

class Value;

/// An ordered sequence of values. Must not directly contain another List.
using List = std::vector<Value>;

/// A map from string keys to values.
using Map = std::map<std::string, Value, std::less<>>;

/// The alternatives of Value, in variant index order.
enum class ValueType : std::uint8_t {
    null,
    boolean,
    integer,
    floating,
    string,
    bytes,
    list,
    map,
    geo_point,
    timestamp,
    reference,
};

/// Convert a ValueType to its string representation.
constexpr auto to_string_view(ValueType type) noexcept -> std::string_view {
    switch (type) {
        case ValueType::null:      return "null";
        case ValueType::boolean:   return "boolean";
        case ValueType::integer:   return "integer";
        case ValueType::floating:  return "floating";
        case ValueType::string:    return "string";
        case ValueType::bytes:     return "bytes";
        case ValueType::list:      return "list";
        case ValueType::map:       return "map";
        case ValueType::geo_point: return "geo_point";
        case ValueType::timestamp: return "timestamp";
        case ValueType::reference: return "reference";
    }
    return "unknown";
}

/// A field value: a closed tagged union over the types a document can hold.
///
/// Values convert implicitly from their alternatives, so documents can be
/// written with initializer lists:
///
/// @code
/// auto doc = Map{
///     {"name", "Alice"},
///     {"age", 31},
///     {"tags", List{"admin", "ops"}},
///     {"home", GeoPoint{51.5, -0.12}},
/// };
/// @endcode
class Value {
public:
    using Variant = std::variant<
        Null,
        bool,
        std::int64_t,
        double,
        std::string,
        Bytes,
        List,
        Map,
        GeoPoint,
        Timestamp,
        Reference
    >;

    Value() = default;
    Value(Null) {}
    Value(bool b) : data_{b} {}

    /// Any non-bool integer whose range fits a 64-bit signed integer.
    template <std::integral T>
        requires (!std::same_as<T, bool> && (std::is_signed_v<T> || sizeof(T) < sizeof(std::int64_t)))
    Value(T i) : data_{static_cast<std::int64_t>(i)} {}

    /// 64-bit unsigned integers may not fit; convert with from_unsigned().
    template <std::unsigned_integral T>
        requires (!std::same_as<T, bool> && sizeof(T) >= sizeof(std::int64_t))
    Value(T) = delete;

    /// Returns nullopt when `u` exceeds the largest 64-bit signed integer.
    static auto from_unsigned(std::uint64_t u) -> std::optional<Value> {
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::nullopt;
        }
        return Value{static_cast<std::int64_t>(u)};
    }

    Value(double d) : data_{d} {}
    Value(const char* s) : data_{std::string{s}} {}
    Value(std::string s) : data_{std::move(s)} {}
    Value(std::string_view s) : data_{std::string{s}} {}
    Value(Bytes b) : data_{std::move(b)} {}
    Value(List l) : data_{std::move(l)} {}
    Value(Map m) : data_{std::move(m)} {}
    Value(GeoPoint g) : data_{g} {}
    Value(Timestamp t) : data_{std::move(t)} {}
    Value(Reference r) : data_{std::move(r)} {}

    auto type() const noexcept -> ValueType {
        return static_cast<ValueType>(data_.index());
    }

    template <typename T>
    auto is() const noexcept -> bool {
        return std::holds_alternative<T>(data_);
    }

    template <typename T>
    auto get_if() noexcept -> T* { return std::get_if<T>(&data_); }

    template <typename T>
    auto get_if() const noexcept -> const T* { return std::get_if<T>(&data_); }

    auto variant() noexcept -> Variant& { return data_; }
    auto variant() const noexcept -> const Variant& { return data_; }

    auto operator==(const Value&) const -> bool = default;

private:
    Variant data_{Null{}};
};

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const std::string& s) { std::printf("%s\n", s.c_str()); },
///     [](std::int64_t i) { std::printf("%lld\n", static_cast<long long>(i)); },
///     [](const auto&) { std::printf("other\n"); },
/// }, value.variant());
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

// -- Typed extraction helpers -------------------------------------------------

/// Extract a typed alternative from a Value, or nullopt on type mismatch.
/// @code
/// auto name = get_value<std::string>(doc.at("name"));
/// @endcode
template <typename T>
auto get_value(const Value& v) -> std::optional<T> {
    if (const auto* t = v.get_if<T>()) {
        return *t;
    }
    return std::nullopt;
}

/// Look up a key in a Map and extract a typed alternative.
template <typename T>
auto get_value(const Map& m, std::string_view key) -> std::optional<T> {
    auto it = m.find(key);
    if (it == m.end()) return std::nullopt;
    return get_value<T>(it->second);
}

/// Count the leaf values and container entries a map contributes toward the
/// server's per-document index-entry limit. Diagnostic only; no limit is
/// enforced locally.
auto count_index_entries(const Map& m) -> std::size_t;

}  // namespace firestore_cpp
