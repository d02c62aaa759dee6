/// @file auth.hpp
/// @brief Sign-in, token expiry tracking and refresh: the credential
/// lifecycle behind every document request.

#pragma once

#include <firestore-cpp/config.hpp>
#include <firestore-cpp/error.hpp>
#include <firestore-cpp/http.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace firestore_cpp {

/// The states of an Auth session.
enum class AuthState : std::uint8_t {
    signed_out,      ///< No credential.
    authenticating,  ///< A sign-in request is in flight.
    signed_in,       ///< Holding an unexpired credential.
    expired,         ///< Holding a refresh token but the id token has expired.
    refreshing,      ///< A refresh request is in flight.
};

/// Convert an AuthState to its string representation.
constexpr auto to_string_view(AuthState state) noexcept -> std::string_view {
    switch (state) {
        case AuthState::signed_out:     return "signed_out";
        case AuthState::authenticating: return "authenticating";
        case AuthState::signed_in:      return "signed_in";
        case AuthState::expired:        return "expired";
        case AuthState::refreshing:     return "refreshing";
    }
    return "unknown";
}

/// A bearer credential and the session it belongs to.
struct Credential {
    std::string id_token;       ///< Sent as "Authorization: Bearer <id_token>".
    std::string refresh_token;  ///< Durable; exchanged for a new id token.
    std::string local_id;       ///< The user's id; names private documents.
    std::chrono::system_clock::time_point expires_at;

    auto operator==(const Credential&) const -> bool = default;
};

/// Owns one user session and hands out a valid bearer credential on demand.
///
/// Thread-safe. Sign-in, refresh and account deletion are serialized: at
/// most one of them is in flight, and callers of current_credential() that
/// find the credential expired wait for a single refresh rather than
/// issuing their own.
///
/// @code
/// auto auth = std::make_shared<Auth>(config, http);
/// if (auto cred = auth->sign_in_with_password("a@example.com", "secret"); !cred) {
///     std::printf("%s\n", cred.error().message.c_str());
/// }
/// @endcode
class Auth {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /// Id token lifetime used when a response omits `expiresIn`.
    static constexpr auto default_lifetime = std::chrono::seconds{3600};

    Auth(ClientConfig config, std::shared_ptr<HttpClient> http,
         Clock clock = [] { return std::chrono::system_clock::now(); });

    Auth(const Auth&) = delete;
    auto operator=(const Auth&) -> Auth& = delete;

    /// Sign in with email and password, replacing any current session.
    auto sign_in_with_password(std::string_view email, std::string_view password)
        -> Result<Credential>;

    /// Create an account and sign in to it.
    auto sign_up_with_password(std::string_view email, std::string_view password)
        -> Result<Credential>;

    /// Sign in with a refresh token saved from an earlier session.
    auto sign_in_with_token(std::string_view refresh_token) -> Result<Credential>;

    /// The current credential, refreshed first if it has expired.
    ///
    /// A refresh the server rejects ends the session (ErrorKind::authentication);
    /// a refresh that fails in transit leaves it expired so a later call can
    /// try again. Never retried internally.
    auto current_credential() -> Result<Credential>;

    /// Delete the signed-in account. On success the session ends.
    auto delete_user() -> Result<void>;

    /// Forget the session locally.
    void sign_out();

    auto state() const -> AuthState;

    /// The signed-in user's id, if there is a session.
    auto local_id() const -> std::optional<std::string>;

private:
    enum class Shape : std::uint8_t { identity, token };

    auto sign_in(const std::string& url, const nlohmann::json& body, Shape shape)
        -> Result<Credential>;
    auto refresh_locked() -> Result<Credential>;
    auto post(const std::string& url, const nlohmann::json& body) -> Result<nlohmann::json>;
    auto parse_credential(const nlohmann::json& body, Shape shape) const -> Result<Credential>;
    auto identity_url(std::string_view method) const -> std::string;
    auto token_url() const -> std::string;

    ClientConfig config_;
    std::shared_ptr<HttpClient> http_;
    Clock clock_;

    std::mutex op_mutex_;             // serializes sign-in, refresh, delete
    mutable std::mutex state_mutex_;  // guards state_ and session_
    AuthState state_{AuthState::signed_out};
    std::optional<Credential> session_;
};

}  // namespace firestore_cpp
