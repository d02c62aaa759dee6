#include <firestore-cpp/auth.hpp>

#include "rest.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <utility>

namespace firestore_cpp {

namespace {

struct ResponseKeys {
    const char* id_token;
    const char* refresh_token;
    const char* expires_in;
    const char* local_id;
};

// Identity Toolkit answers in camelCase, the Secure Token service in
// snake_case.
constexpr auto identity_keys = ResponseKeys{"idToken", "refreshToken", "expiresIn", "localId"};
constexpr auto token_keys = ResponseKeys{"id_token", "refresh_token", "expires_in", "user_id"};

auto string_field(const nlohmann::json& j, const char* key) -> std::string {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

auto lifetime_field(const nlohmann::json& j, const char* key) -> std::optional<std::chrono::seconds> {
    auto it = j.find(key);
    if (it == j.end()) return Auth::default_lifetime;
    if (it->is_number_integer()) return std::chrono::seconds{it->get<std::int64_t>()};
    if (it->is_string()) {
        const auto& s = it->get_ref<const std::string&>();
        auto seconds = std::int64_t{0};
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), seconds);
        if (ec == std::errc{} && ptr == s.data() + s.size()) return std::chrono::seconds{seconds};
    }
    return std::nullopt;
}

}  // anonymous namespace

Auth::Auth(ClientConfig config, std::shared_ptr<HttpClient> http, Clock clock)
    : config_{std::move(config)},
      http_{std::move(http)},
      clock_{std::move(clock)} {}

// -- Sign-in ------------------------------------------------------------------

auto Auth::sign_in_with_password(std::string_view email, std::string_view password)
    -> Result<Credential> {
    return sign_in(identity_url("accounts:signInWithPassword"),
                   {{"email", email}, {"password", password}, {"returnSecureToken", true}},
                   Shape::identity);
}

auto Auth::sign_up_with_password(std::string_view email, std::string_view password)
    -> Result<Credential> {
    return sign_in(identity_url("accounts:signUp"),
                   {{"email", email}, {"password", password}, {"returnSecureToken", true}},
                   Shape::identity);
}

auto Auth::sign_in_with_token(std::string_view refresh_token) -> Result<Credential> {
    return sign_in(token_url(),
                   {{"grant_type", "refresh_token"}, {"refresh_token", refresh_token}},
                   Shape::token);
}

auto Auth::sign_in(const std::string& url, const nlohmann::json& body, Shape shape)
    -> Result<Credential> {
    auto op = std::scoped_lock{op_mutex_};
    {
        auto lock = std::scoped_lock{state_mutex_};
        state_ = AuthState::authenticating;
    }

    auto response = post(url, body);
    auto credential = response ? parse_credential(*response, shape)
                               : Result<Credential>{response.error()};

    auto lock = std::scoped_lock{state_mutex_};
    if (!credential) {
        SPDLOG_WARN("sign-in failed: {} ({})",
                    credential.error().message, to_string_view(credential.error().kind));
        session_.reset();
        state_ = AuthState::signed_out;
        return credential;
    }
    session_ = *credential;
    state_ = AuthState::signed_in;
    SPDLOG_INFO("signed in as {}", credential->local_id);
    return credential;
}

// -- Credential access --------------------------------------------------------

auto Auth::current_credential() -> Result<Credential> {
    {
        auto lock = std::scoped_lock{state_mutex_};
        if (!session_ && state_ == AuthState::signed_out) {
            return Error{ErrorKind::authentication, "not signed in"};
        }
        if (state_ == AuthState::signed_in && clock_() < session_->expires_at) {
            return *session_;
        }
    }
    // Expired, or another caller is mid sign-in/refresh: wait our turn and
    // re-check before refreshing.
    auto op = std::scoped_lock{op_mutex_};
    return refresh_locked();
}

auto Auth::refresh_locked() -> Result<Credential> {
    auto refresh_token = std::string{};
    {
        auto lock = std::scoped_lock{state_mutex_};
        if (!session_) {
            state_ = AuthState::signed_out;
            return Error{ErrorKind::authentication, "not signed in"};
        }
        if (clock_() < session_->expires_at) {
            state_ = AuthState::signed_in;
            return *session_;
        }
        state_ = AuthState::refreshing;
        refresh_token = session_->refresh_token;
    }

    SPDLOG_DEBUG("id token expired; refreshing");
    auto response = post(token_url(),
                         {{"grant_type", "refresh_token"}, {"refresh_token", refresh_token}});
    auto credential = response ? parse_credential(*response, Shape::token)
                               : Result<Credential>{response.error()};

    auto lock = std::scoped_lock{state_mutex_};
    if (!credential) {
        if (credential.error().kind == ErrorKind::authentication) {
            SPDLOG_WARN("refresh rejected: {}; re-authentication required",
                        credential.error().message);
            session_.reset();
            state_ = AuthState::signed_out;
        } else {
            SPDLOG_WARN("refresh failed: {}", credential.error().message);
            state_ = AuthState::expired;
        }
        return credential;
    }
    session_ = *credential;
    state_ = AuthState::signed_in;
    SPDLOG_DEBUG("refreshed credential for {}", credential->local_id);
    return credential;
}

// -- Account management -------------------------------------------------------

auto Auth::delete_user() -> Result<void> {
    auto op = std::scoped_lock{op_mutex_};
    auto credential = refresh_locked();
    if (!credential) return credential.error();

    auto response = post(identity_url("accounts:delete"), {{"idToken", credential->id_token}});
    if (!response) {
        SPDLOG_WARN("delete of user {} failed: {}", credential->local_id, response.error().message);
        return response.error();
    }

    auto lock = std::scoped_lock{state_mutex_};
    session_.reset();
    state_ = AuthState::signed_out;
    SPDLOG_INFO("deleted user {}", credential->local_id);
    return {};
}

void Auth::sign_out() {
    auto op = std::scoped_lock{op_mutex_};
    auto lock = std::scoped_lock{state_mutex_};
    session_.reset();
    state_ = AuthState::signed_out;
    SPDLOG_INFO("signed out");
}

auto Auth::state() const -> AuthState {
    auto lock = std::scoped_lock{state_mutex_};
    if (state_ == AuthState::signed_in && session_ && clock_() >= session_->expires_at) {
        return AuthState::expired;
    }
    return state_;
}

auto Auth::local_id() const -> std::optional<std::string> {
    auto lock = std::scoped_lock{state_mutex_};
    if (!session_) return std::nullopt;
    return session_->local_id;
}

// -- Wire helpers -------------------------------------------------------------

auto Auth::post(const std::string& url, const nlohmann::json& body) -> Result<nlohmann::json> {
    auto payload = detail::dump_body(body);
    if (!payload) return payload.error();

    auto response = http_->send(HttpRequest{
        "POST", url, {{"Content-Type", std::string{detail::json_content_type}}}, std::move(*payload)});
    if (!response) return response.error();
    if (response->status != 200) return detail::identity_error(*response);
    return detail::parse_body(*response);
}

auto Auth::parse_credential(const nlohmann::json& body, Shape shape) const -> Result<Credential> {
    const auto& keys = shape == Shape::identity ? identity_keys : token_keys;

    auto credential = Credential{};
    credential.id_token = string_field(body, keys.id_token);
    credential.refresh_token = string_field(body, keys.refresh_token);
    credential.local_id = string_field(body, keys.local_id);
    auto lifetime = lifetime_field(body, keys.expires_in);

    if (credential.id_token.empty() || credential.refresh_token.empty() ||
        credential.local_id.empty() || !lifetime) {
        return Error{ErrorKind::invalid_response, "sign-in response is missing credential fields"};
    }
    credential.expires_at = clock_() + *lifetime;
    return credential;
}

auto Auth::identity_url(std::string_view method) const -> std::string {
    return config_.identity_endpoint + std::string{method} + "?key=" + url_encode(config_.api_key);
}

auto Auth::token_url() const -> std::string {
    return config_.token_endpoint + "token?key=" + url_encode(config_.api_key);
}

}  // namespace firestore_cpp
