// codec_test.cpp — Tests for the typed-value wire codec

#include <firestore-cpp/codec.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

using namespace firestore_cpp;
using json = nlohmann::json;

namespace {

auto round_trip(const Value& v) -> Value {
    auto wire = encode(v);
    EXPECT_TRUE(wire) << wire.error().message;
    auto back = decode(*wire);
    EXPECT_TRUE(back) << back.error().message;
    return *back;
}

auto bytes(std::initializer_list<unsigned char> raw) -> Bytes {
    auto out = Bytes{};
    for (auto c : raw) out.push_back(std::byte{c});
    return out;
}

}  // namespace

// =============================================================================
// Wire shapes
// =============================================================================

TEST(Encode, scalars_use_their_tags) {
    EXPECT_EQ(*encode(Null{}), json::parse(R"({"nullValue": null})"));
    EXPECT_EQ(*encode(true), json::parse(R"({"booleanValue": true})"));
    EXPECT_EQ(*encode(-43), json::parse(R"({"integerValue": "-43"})"));
    EXPECT_EQ(*encode(2.5), json::parse(R"({"doubleValue": 2.5})"));
    EXPECT_EQ(*encode("hi"), json::parse(R"({"stringValue": "hi"})"));
}

TEST(Encode, integers_are_sent_as_strings) {
    auto wire = encode(std::numeric_limits<std::int64_t>::max());
    ASSERT_TRUE(wire);
    EXPECT_EQ((*wire)["integerValue"], "9223372036854775807");
}

TEST(Encode, special_doubles_are_strings) {
    EXPECT_EQ((*encode(std::numeric_limits<double>::quiet_NaN()))["doubleValue"], "NaN");
    EXPECT_EQ((*encode(std::numeric_limits<double>::infinity()))["doubleValue"], "Infinity");
    EXPECT_EQ((*encode(-std::numeric_limits<double>::infinity()))["doubleValue"], "-Infinity");
}

TEST(Encode, bytes_are_base64) {
    EXPECT_EQ(*encode(bytes({'M', 'a', 'n'})), json::parse(R"({"bytesValue": "TWFu"})"));
}

TEST(Encode, dedicated_tags_for_geo_timestamp_reference) {
    EXPECT_EQ(*encode(GeoPoint{51.5, -0.125}),
              json::parse(R"({"geoPointValue": {"latitude": 51.5, "longitude": -0.125}})"));
    EXPECT_EQ(*encode(Timestamp{"2024-05-01T12:00:00Z"}),
              json::parse(R"({"timestampValue": "2024-05-01T12:00:00Z"})"));
    EXPECT_EQ(*encode(Reference{"projects/p/databases/(default)/documents/c/d"}),
              json::parse(R"({"referenceValue": "projects/p/databases/(default)/documents/c/d"})"));
}

TEST(Encode, containers_nest_under_values_and_fields) {
    auto v = Value{Map{{"xs", List{1, "a"}}}};
    auto expected = json::parse(R"({
        "mapValue": {"fields": {
            "xs": {"arrayValue": {"values": [
                {"integerValue": "1"},
                {"stringValue": "a"}
            ]}}
        }}
    })");
    EXPECT_EQ(*encode(v), expected);
}

TEST(Encode, empty_containers) {
    EXPECT_EQ(*encode(List{}), json::parse(R"({"arrayValue": {"values": []}})"));
    EXPECT_EQ(*encode(Map{}), json::parse(R"({"mapValue": {"fields": {}}})"));
}

TEST(EncodeFields, produces_bare_fields_object) {
    auto wire = encode_fields(Map{{"a", 1}, {"b", false}});
    ASSERT_TRUE(wire);
    EXPECT_EQ(*wire, json::parse(R"({"a": {"integerValue": "1"}, "b": {"booleanValue": false}})"));
}

// =============================================================================
// Encoding failures
// =============================================================================

TEST(Encode, list_directly_in_list_is_unsupported) {
    auto r = encode(Map{{"grid", List{Value{List{1, 2}}}}});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::unsupported_type);
    EXPECT_NE(r.error().message.find("grid[0]"), std::string::npos);
}

TEST(Encode, list_inside_map_inside_list_is_allowed) {
    auto r = encode(List{Map{{"inner", List{1, 2}}}});
    EXPECT_TRUE(r);
}

TEST(Encode, out_of_range_geo_point_is_unsupported) {
    auto r = encode_fields(Map{{"where", GeoPoint{91.0, 0.0}}});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::unsupported_type);
    EXPECT_NE(r.error().message.find("where"), std::string::npos);
}

TEST(Encode, nan_geo_point_is_unsupported) {
    auto r = encode(GeoPoint{std::numeric_limits<double>::quiet_NaN(), 0.0});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::unsupported_type);
}

// =============================================================================
// Decoding
// =============================================================================

TEST(Decode, accepts_server_null_spelling) {
    EXPECT_EQ(*decode(json::parse(R"({"nullValue": "NULL_VALUE"})")), Value{Null{}});
}

TEST(Decode, integer_as_number_or_string) {
    EXPECT_EQ(*decode(json::parse(R"({"integerValue": "12"})")), Value{12});
    EXPECT_EQ(*decode(json::parse(R"({"integerValue": 12})")), Value{12});
}

TEST(Decode, special_double_strings) {
    auto nan = decode(json::parse(R"({"doubleValue": "NaN"})"));
    ASSERT_TRUE(nan);
    ASSERT_TRUE(nan->is<double>());
    EXPECT_TRUE(std::isnan(*nan->get_if<double>()));
    EXPECT_EQ(*decode(json::parse(R"({"doubleValue": "-Infinity"})")),
              Value{-std::numeric_limits<double>::infinity()});
}

TEST(Decode, integral_double_stays_double) {
    EXPECT_EQ(*decode(json::parse(R"({"doubleValue": 3})")), Value{3.0});
}

TEST(Decode, geo_point_omitted_coordinates_are_zero) {
    EXPECT_EQ(*decode(json::parse(R"({"geoPointValue": {"latitude": 10}})")),
              (Value{GeoPoint{10.0, 0.0}}));
}

TEST(Decode, containers_without_members_are_empty) {
    EXPECT_EQ(*decode(json::parse(R"({"arrayValue": {}})")), Value{List{}});
    EXPECT_EQ(*decode(json::parse(R"({"mapValue": {}})")), Value{Map{}});
}

TEST(Decode, unknown_tag_is_unsupported) {
    auto r = decode(json::parse(R"({"vectorValue": {}})"));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::unsupported_type);
    EXPECT_NE(r.error().message.find("vectorValue"), std::string::npos);
}

TEST(Decode, unknown_tag_deep_in_tree_names_its_path) {
    auto r = decode_fields(json::parse(R"({
        "d": {"mapValue": {"fields": {"e": {"arrayValue": {"values": [
            {"integerValue": "1"}, {"mysteryValue": 1}
        ]}}}}}
    })"));
    ASSERT_FALSE(r);
    EXPECT_NE(r.error().message.find("d.e[1]"), std::string::npos);
}

TEST(Decode, malformed_payloads_are_unsupported) {
    const char* cases[] = {
        R"({"integerValue": "12x"})",
        R"({"integerValue": true})",
        R"({"booleanValue": "true"})",
        R"({"stringValue": 5})",
        R"({"bytesValue": "not base64!"})",
        R"({"doubleValue": "fast"})",
        R"({"arrayValue": {"values": 3}})",
        R"({"stringValue": "a", "integerValue": "1"})",
        R"("bare")",
        R"({})",
    };
    for (const auto* text : cases) {
        auto r = decode(json::parse(text));
        ASSERT_FALSE(r) << text;
        EXPECT_EQ(r.error().kind, ErrorKind::unsupported_type) << text;
    }
}

TEST(DecodeFields, null_fields_is_empty_map) {
    auto r = decode_fields(json{});
    ASSERT_TRUE(r);
    EXPECT_TRUE(r->empty());
}

// =============================================================================
// Round trip
// =============================================================================

TEST(RoundTrip, every_alternative) {
    const Value values[] = {
        Null{},
        true,
        false,
        0,
        std::numeric_limits<std::int64_t>::min(),
        -0.5,
        std::numeric_limits<double>::infinity(),
        "",
        "unicode \xc3\xa9",
        bytes({0x00, 0xff, 0x10, 0x20}),
        List{},
        List{1, "two", Map{{"three", List{3}}}},
        Map{},
        GeoPoint{-33.86, 151.2},
        Timestamp{"2024-05-01T12:00:00.123456Z"},
        Reference{"projects/p/databases/(default)/documents/users/u1"},
    };
    for (const auto& v : values) {
        EXPECT_EQ(round_trip(v), v) << to_string_view(v.type());
    }
}

TEST(RoundTrip, nan_stays_nan) {
    auto back = round_trip(std::numeric_limits<double>::quiet_NaN());
    ASSERT_TRUE(back.is<double>());
    EXPECT_TRUE(std::isnan(*back.get_if<double>()));

    auto nested = round_trip(Map{{"x", List{std::numeric_limits<double>::quiet_NaN()}}});
    const auto* list = std::get_if<List>(&std::get<Map>(nested.variant()).at("x").variant());
    ASSERT_NE(list, nullptr);
    ASSERT_EQ(list->size(), 1u);
    EXPECT_TRUE(std::isnan(*(*list)[0].get_if<double>()));
}

TEST(RoundTrip, document_from_end_to_end_scenario) {
    auto doc = Map{
        {"b", true},
        {"d", Map{{"c", -43}, {"e", List{-10, -20, -30}}}},
        {"a", List{1, 2, 3, 4, 5}},
    };
    auto wire = encode_fields(doc);
    ASSERT_TRUE(wire);
    auto back = decode_fields(*wire);
    ASSERT_TRUE(back);
    EXPECT_EQ(*back, doc);
}

// =============================================================================
// Base64
// =============================================================================

TEST(Base64, padding_variants) {
    EXPECT_EQ(base64_encode(bytes({'M'})), "TQ==");
    EXPECT_EQ(base64_encode(bytes({'M', 'a'})), "TWE=");
    EXPECT_EQ(base64_decode("TQ=="), bytes({'M'}));
    EXPECT_EQ(base64_decode("TWE="), bytes({'M', 'a'}));
    EXPECT_EQ(base64_decode(""), Bytes{});
}

TEST(Base64, rejects_malformed_input) {
    EXPECT_FALSE(base64_decode("TQ=").has_value());
    EXPECT_FALSE(base64_decode("T=Q=").has_value());
    EXPECT_FALSE(base64_decode("TQ==TQ==").has_value());
    EXPECT_FALSE(base64_decode("T*==").has_value());
}
