#include <firestore-cpp/codec.hpp>

#include <array>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace firestore_cpp {

namespace {

// Thrown from the recursive helpers; converted to an Error at the public
// entry points.
class CodecError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

constexpr std::string_view base64_chars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

auto child_path(const std::string& parent, std::string_view key) -> std::string {
    if (parent.empty()) return std::string{key};
    auto p = parent;
    p += '.';
    p += key;
    return p;
}

auto index_path(const std::string& parent, std::size_t index) -> std::string {
    return parent + "[" + std::to_string(index) + "]";
}

auto describe(const std::string& path) -> std::string {
    return path.empty() ? std::string{"value"} : "'" + path + "'";
}

// -- Encoding -----------------------------------------------------------------

// NaN survives a round trip as NaN, but never compares equal to itself.
auto encode_double(double d) -> nlohmann::json {
    if (std::isnan(d)) return "NaN";
    if (std::isinf(d)) return d > 0 ? "Infinity" : "-Infinity";
    return d;
}

auto encode_map_fields(const Map& m, const std::string& path) -> nlohmann::json;

auto encode_value(const Value& v, const std::string& path, bool parent_is_list)
    -> nlohmann::json {
    return std::visit(overload{
        [](Null) -> nlohmann::json {
            return {{"nullValue", nullptr}};
        },
        [](bool b) -> nlohmann::json {
            return {{"booleanValue", b}};
        },
        [](std::int64_t i) -> nlohmann::json {
            return {{"integerValue", std::to_string(i)}};
        },
        [](double d) -> nlohmann::json {
            return {{"doubleValue", encode_double(d)}};
        },
        [](const std::string& s) -> nlohmann::json {
            return {{"stringValue", s}};
        },
        [](const Bytes& b) -> nlohmann::json {
            return {{"bytesValue", base64_encode(b)}};
        },
        [&](const List& l) -> nlohmann::json {
            if (parent_is_list) {
                throw CodecError{describe(path) +
                                 " is a list nested directly in a list"};
            }
            auto values = nlohmann::json::array();
            for (std::size_t i = 0; i < l.size(); ++i) {
                values.push_back(encode_value(l[i], index_path(path, i), true));
            }
            return {{"arrayValue", {{"values", std::move(values)}}}};
        },
        [&](const Map& m) -> nlohmann::json {
            return {{"mapValue", {{"fields", encode_map_fields(m, path)}}}};
        },
        [&](const GeoPoint& g) -> nlohmann::json {
            if (!(g.latitude >= -90.0 && g.latitude <= 90.0) ||
                !(g.longitude >= -180.0 && g.longitude <= 180.0)) {
                throw CodecError{describe(path) + " has geo point out of range"};
            }
            return {{"geoPointValue",
                     {{"latitude", g.latitude}, {"longitude", g.longitude}}}};
        },
        [](const Timestamp& t) -> nlohmann::json {
            return {{"timestampValue", t.value}};
        },
        [](const Reference& r) -> nlohmann::json {
            return {{"referenceValue", r.path}};
        },
    }, v.variant());
}

auto encode_map_fields(const Map& m, const std::string& path) -> nlohmann::json {
    auto fields = nlohmann::json::object();
    for (const auto& [key, value] : m) {
        fields[key] = encode_value(value, child_path(path, key), false);
    }
    return fields;
}

// -- Decoding -----------------------------------------------------------------

auto decode_map_fields(const nlohmann::json& fields, const std::string& path) -> Map;

auto decode_integer(const nlohmann::json& j, const std::string& path) -> std::int64_t {
    if (j.is_string()) {
        const auto& s = j.get_ref<const std::string&>();
        auto result = std::int64_t{0};
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), result);
        if (ec != std::errc{} || ptr != s.data() + s.size()) {
            throw CodecError{describe(path) + " has malformed integerValue"};
        }
        return result;
    }
    if (j.is_number_unsigned()) {
        auto u = j.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            throw CodecError{describe(path) + " integerValue out of range"};
        }
        return static_cast<std::int64_t>(u);
    }
    if (j.is_number_integer()) return j.get<std::int64_t>();
    throw CodecError{describe(path) + " has malformed integerValue"};
}

auto decode_double(const nlohmann::json& j, const std::string& path) -> double {
    if (j.is_number()) return j.get<double>();
    if (j.is_string()) {
        const auto& s = j.get_ref<const std::string&>();
        if (s == "NaN") return std::numeric_limits<double>::quiet_NaN();
        if (s == "Infinity") return std::numeric_limits<double>::infinity();
        if (s == "-Infinity") return -std::numeric_limits<double>::infinity();
    }
    throw CodecError{describe(path) + " has malformed doubleValue"};
}

auto require_string(const nlohmann::json& j, std::string_view tag,
                    const std::string& path) -> const std::string& {
    if (!j.is_string()) {
        throw CodecError{describe(path) + " has malformed " + std::string{tag}};
    }
    return j.get_ref<const std::string&>();
}

auto require_object(const nlohmann::json& j, std::string_view tag,
                    const std::string& path) -> const nlohmann::json& {
    if (!j.is_object()) {
        throw CodecError{describe(path) + " has malformed " + std::string{tag}};
    }
    return j;
}

auto decode_value(const nlohmann::json& wire, const std::string& path) -> Value {
    if (!wire.is_object() || wire.size() != 1) {
        throw CodecError{describe(path) + " is not a single-tag wire value"};
    }
    const auto entry = wire.begin();
    const auto& tag = entry.key();
    const auto& payload = entry.value();

    if (tag == "nullValue") {
        if (!payload.is_null() && payload != "NULL_VALUE") {
            throw CodecError{describe(path) + " has malformed nullValue"};
        }
        return Null{};
    }
    if (tag == "booleanValue") {
        if (!payload.is_boolean()) {
            throw CodecError{describe(path) + " has malformed booleanValue"};
        }
        return payload.get<bool>();
    }
    if (tag == "integerValue") return decode_integer(payload, path);
    if (tag == "doubleValue") return decode_double(payload, path);
    if (tag == "stringValue") return require_string(payload, tag, path);
    if (tag == "bytesValue") {
        auto bytes = base64_decode(require_string(payload, tag, path));
        if (!bytes) throw CodecError{describe(path) + " has malformed bytesValue"};
        return std::move(*bytes);
    }
    if (tag == "timestampValue") {
        return Timestamp{require_string(payload, tag, path)};
    }
    if (tag == "referenceValue") {
        return Reference{require_string(payload, tag, path)};
    }
    if (tag == "geoPointValue") {
        const auto& obj = require_object(payload, tag, path);
        // Zero coordinates are omitted by the server.
        auto g = GeoPoint{};
        if (auto it = obj.find("latitude"); it != obj.end()) {
            g.latitude = decode_double(*it, path);
        }
        if (auto it = obj.find("longitude"); it != obj.end()) {
            g.longitude = decode_double(*it, path);
        }
        return g;
    }
    if (tag == "arrayValue") {
        const auto& obj = require_object(payload, tag, path);
        auto list = List{};
        auto it = obj.find("values");
        if (it == obj.end() || it->is_null()) return list;
        if (!it->is_array()) {
            throw CodecError{describe(path) + " has malformed arrayValue"};
        }
        list.reserve(it->size());
        for (std::size_t i = 0; i < it->size(); ++i) {
            list.push_back(decode_value((*it)[i], index_path(path, i)));
        }
        return list;
    }
    if (tag == "mapValue") {
        const auto& obj = require_object(payload, tag, path);
        auto it = obj.find("fields");
        if (it == obj.end()) return Map{};
        return decode_map_fields(*it, path);
    }
    throw CodecError{describe(path) + " has unknown wire tag '" + tag + "'"};
}

auto decode_map_fields(const nlohmann::json& fields, const std::string& path) -> Map {
    auto m = Map{};
    if (fields.is_null()) return m;
    if (!fields.is_object()) {
        throw CodecError{describe(path) + " has malformed fields object"};
    }
    for (const auto& [key, value] : fields.items()) {
        m.emplace(key, decode_value(value, child_path(path, key)));
    }
    return m;
}

template <typename Fn>
auto run_codec(Fn&& fn) -> Result<std::invoke_result_t<Fn>> {
    try {
        return fn();
    } catch (const CodecError& e) {
        return Error{ErrorKind::unsupported_type, e.what()};
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorKind::unsupported_type, e.what()};
    }
}

}  // anonymous namespace

auto encode(const Value& value) -> Result<nlohmann::json> {
    return run_codec([&] { return encode_value(value, std::string{}, false); });
}

auto decode(const nlohmann::json& wire) -> Result<Value> {
    return run_codec([&] { return decode_value(wire, std::string{}); });
}

auto encode_fields(const Map& fields) -> Result<nlohmann::json> {
    return run_codec([&] { return encode_map_fields(fields, std::string{}); });
}

auto decode_fields(const nlohmann::json& fields) -> Result<Map> {
    return run_codec([&] { return decode_map_fields(fields, std::string{}); });
}

// -- Base64 -------------------------------------------------------------------

auto base64_encode(const Bytes& data) -> std::string {
    auto result = std::string{};
    auto n = data.size();
    result.reserve(((n + 2) / 3) * 4);
    for (std::size_t i = 0; i < n; i += 3) {
        auto b0 = static_cast<unsigned char>(data[i]);
        auto b1 = (i + 1 < n) ? static_cast<unsigned char>(data[i + 1]) : 0u;
        auto b2 = (i + 2 < n) ? static_cast<unsigned char>(data[i + 2]) : 0u;
        result.push_back(base64_chars[b0 >> 2]);
        result.push_back(base64_chars[((b0 & 0x03) << 4) | (b1 >> 4)]);
        result.push_back((i + 1 < n) ? base64_chars[((b1 & 0x0F) << 2) | (b2 >> 6)] : '=');
        result.push_back((i + 2 < n) ? base64_chars[b2 & 0x3F] : '=');
    }
    return result;
}

auto base64_decode(std::string_view encoded) -> std::optional<Bytes> {
    static const auto decode_table = []() {
        std::array<int, 256> t{};
        t.fill(-1);
        for (std::size_t i = 0; i < base64_chars.size(); ++i) {
            t[static_cast<unsigned char>(base64_chars[i])] = static_cast<int>(i);
        }
        return t;
    }();

    if (encoded.size() % 4 != 0) return std::nullopt;

    auto result = Bytes{};
    result.reserve((encoded.size() / 4) * 3);
    for (std::size_t i = 0; i < encoded.size(); i += 4) {
        const bool last = i + 4 == encoded.size();
        const bool pad2 = last && encoded[i + 2] == '=';
        const bool pad3 = last && encoded[i + 3] == '=';
        if (pad2 && !pad3) return std::nullopt;

        auto a = decode_table[static_cast<unsigned char>(encoded[i])];
        auto b = decode_table[static_cast<unsigned char>(encoded[i + 1])];
        auto c = pad2 ? 0 : decode_table[static_cast<unsigned char>(encoded[i + 2])];
        auto d = pad3 ? 0 : decode_table[static_cast<unsigned char>(encoded[i + 3])];
        if (a < 0 || b < 0 || c < 0 || d < 0) return std::nullopt;

        result.push_back(std::byte(static_cast<unsigned char>((a << 2) | (b >> 4))));
        if (!pad2) {
            result.push_back(std::byte(static_cast<unsigned char>(((b & 0x0F) << 4) | (c >> 2))));
        }
        if (!pad3) {
            result.push_back(std::byte(static_cast<unsigned char>(((c & 0x03) << 6) | d)));
        }
    }
    return result;
}

}  // namespace firestore_cpp
