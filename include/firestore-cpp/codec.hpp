/// @file codec.hpp
/// @brief Mapping between Value and the Firestore REST tagged-value JSON form.
///
/// Every wire value is a single-key object naming its type:
///
/// | Value     | wire                                             |
/// |-----------|--------------------------------------------------|
/// | Null      | `{"nullValue": null}`                            |
/// | bool      | `{"booleanValue": true}`                         |
/// | int64_t   | `{"integerValue": "42"}`                         |
/// | double    | `{"doubleValue": 3.5}`                           |
/// | string    | `{"stringValue": "x"}`                           |
/// | Bytes     | `{"bytesValue": "<base64>"}`                     |
/// | List      | `{"arrayValue": {"values": [...]}}`              |
/// | Map       | `{"mapValue": {"fields": {...}}}`                |
/// | GeoPoint  | `{"geoPointValue": {"latitude": .., "longitude": ..}}` |
/// | Timestamp | `{"timestampValue": "2024-01-01T00:00:00Z"}`     |
/// | Reference | `{"referenceValue": "projects/.../documents/c/d"}` |

#pragma once

#include <firestore-cpp/error.hpp>
#include <firestore-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace firestore_cpp {

/// Encode a value to its tagged wire form.
///
/// Fails with ErrorKind::unsupported_type when a List directly contains a
/// List, or a GeoPoint is outside its coordinate ranges.
auto encode(const Value& value) -> Result<nlohmann::json>;

/// Decode a tagged wire value.
///
/// Fails with ErrorKind::unsupported_type for unknown tags and malformed
/// wrappers; nothing is dropped silently.
auto decode(const nlohmann::json& wire) -> Result<Value>;

/// Encode a document's root map as the `fields` object of a wire document.
auto encode_fields(const Map& fields) -> Result<nlohmann::json>;

/// Decode the `fields` object of a wire document. A null or absent
/// `fields` object decodes to an empty map.
auto decode_fields(const nlohmann::json& fields) -> Result<Map>;

/// Base64 helpers used for the `bytesValue` tag.
auto base64_encode(const Bytes& data) -> std::string;
auto base64_decode(std::string_view encoded) -> std::optional<Bytes>;

}  // namespace firestore_cpp
