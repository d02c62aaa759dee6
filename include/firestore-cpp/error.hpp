/// @file error.hpp
/// @brief Error types and the Result wrapper returned by every public call.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace firestore_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    authentication,    ///< Sign-in or refresh failed; the user must re-authenticate.
    not_found,         ///< The document does not exist.
    conflict,          ///< A write precondition failed (document changed or exists).
    quota_exceeded,    ///< The server reported a size or index-entry limit breach.
    unsupported_type,  ///< A value is outside the representable model.
    transport,         ///< Network or HTTP failure passed through from the server.
    patch_spec,        ///< A PatchSpec is ambiguous or malformed.
    transform_failed,  ///< The caller's transform function threw.
    invalid_config,    ///< Configuration is missing or malformed.
    invalid_response,  ///< The server answered with an unexpected body.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::authentication:   return "authentication";
        case ErrorKind::not_found:        return "not_found";
        case ErrorKind::conflict:         return "conflict";
        case ErrorKind::quota_exceeded:   return "quota_exceeded";
        case ErrorKind::unsupported_type: return "unsupported_type";
        case ErrorKind::transport:        return "transport";
        case ErrorKind::patch_spec:       return "patch_spec";
        case ErrorKind::transform_failed: return "transform_failed";
        case ErrorKind::invalid_config:   return "invalid_config";
        case ErrorKind::invalid_response: return "invalid_response";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Either a value of type T or an Error.
///
/// @code
/// auto snap = client.read("users", "alice");
/// if (!snap) {
///     std::printf("%s\n", snap.error().message.c_str());
/// }
/// @endcode
template <typename T>
class Result {
public:
    Result(T value) : data_{std::in_place_index<0>, std::move(value)} {}
    Result(Error error) : data_{std::in_place_index<1>, std::move(error)} {}

    auto has_value() const noexcept -> bool { return data_.index() == 0; }
    explicit operator bool() const noexcept { return has_value(); }

    /// The held value. Throws std::bad_variant_access if this holds an error.
    auto value() & -> T& { return std::get<0>(data_); }
    auto value() const& -> const T& { return std::get<0>(data_); }
    auto value() && -> T&& { return std::get<0>(std::move(data_)); }

    /// The held error. Throws std::bad_variant_access if this holds a value.
    auto error() const -> const Error& { return std::get<1>(data_); }

    auto operator*() & -> T& { return value(); }
    auto operator*() const& -> const T& { return value(); }
    auto operator*() && -> T&& { return std::move(*this).value(); }
    auto operator->() -> T* { return &value(); }
    auto operator->() const -> const T* { return &value(); }

private:
    std::variant<T, Error> data_;
};

/// Success or an Error, for operations with nothing to return.
template <>
class Result<void> {
public:
    Result() = default;
    Result(Error error) : error_{std::move(error)} {}

    auto has_value() const noexcept -> bool { return !error_.has_value(); }
    explicit operator bool() const noexcept { return has_value(); }

    /// The held error. Throws std::bad_optional_access on success.
    auto error() const -> const Error& { return error_.value(); }

private:
    std::optional<Error> error_;
};

}  // namespace firestore_cpp
