#ifndef MAILAUTH_AUTH_TYPES_HPP
#define MAILAUTH_AUTH_TYPES_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace MailAuth {

class AuthAttempt;
class Client;
class OpenPGPProvider;
struct ClientProof;
struct AuthInfoResponse;
struct AuthResponse;

enum class PasswordMode {
    SinglePassword = 1,
    TwoPasswords = 2
};

// SRP parameters of one login, as handed out by /auth/info. The raw protocol
// fields are only visible to the code that runs the handshake. Copies share
// one "consumed" flag: once any copy has been submitted, the server-side SRP
// session behind it is spent.
class AuthInfo {
public:
    AuthInfo() = default;

    int version() const { return version_; }
    // Second factor requirement as reported by the server (0 = none).
    int two_factor() const { return two_factor_; }

    bool consumed() const { return consumed_ && consumed_->load(); }

private:
    friend class AuthAttempt;
    friend AuthInfo to_auth_info(const AuthInfoResponse& response);
    friend ClientProof compute_proof(std::string_view password, const AuthInfo& info,
                                     OpenPGPProvider& pgp);

    // Marks the SRP session as used. Returns false if it already was.
    bool try_consume() const { return consumed_ && !consumed_->exchange(true); }

    int version_ = 0;
    int two_factor_ = 0;
    std::string modulus_;
    std::string server_ephemeral_;
    std::string salt_;
    std::string srp_session_;
    std::shared_ptr<std::atomic<bool>> consumed_ = std::make_shared<std::atomic<bool>>(false);
};

// Everything /auth returned after a verified handshake.
struct SessionCredentials {
    std::string access_token;
    std::string refresh_token;
    std::string token_type;
    std::string scope;
    std::string user_id;
    std::string event_id;
    std::chrono::seconds expires_in{0};
    std::string encrypted_private_key;   // armored
    std::string key_salt;                // base64
    PasswordMode password_mode = PasswordMode::SinglePassword;

    SessionCredentials() = default;
    SessionCredentials(const SessionCredentials&) = default;
    SessionCredentials& operator=(const SessionCredentials&) = default;
    SessionCredentials(SessionCredentials&&) noexcept = default;
    SessionCredentials& operator=(SessionCredentials&&) noexcept = default;
    // Wipes the tokens
    ~SessionCredentials();
};

// Result of Client::auth. Exposes what callers may show or store; the tokens
// and key material stay inside for Client::unlock.
class Auth {
public:
    const std::string& uid() const { return credentials_.user_id; }
    const std::string& scope() const { return credentials_.scope; }
    const std::string& event_id() const { return credentials_.event_id; }
    const std::string& refresh_token() const { return credentials_.refresh_token; }
    std::chrono::seconds expires_in() const { return credentials_.expires_in; }
    PasswordMode password_mode() const { return credentials_.password_mode; }

private:
    friend class Client;
    friend class AuthAttempt;
    explicit Auth(SessionCredentials credentials) : credentials_(std::move(credentials)) {}

    const SessionCredentials& credentials() const { return credentials_; }

    SessionCredentials credentials_;
};

} // namespace MailAuth

#endif // MAILAUTH_AUTH_TYPES_HPP
