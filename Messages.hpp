#pragma once

#include <string>
#include <nlohmann/json_fwd.hpp>
#include "AuthTypes.hpp"

namespace MailAuth {

// Response code the API uses for success
constexpr int kApiSuccessCode = 1000;

// --- Wire DTOs ---
// Field names follow the JSON keys of the API.

struct AuthInfoRequest {
    std::string ClientID;
    std::string ClientSecret;
    std::string Username;
};

struct AuthInfoResponse {
    int Code = 0;
    int Version = 0;
    std::string Modulus;
    std::string ServerEphemeral;
    std::string Salt;
    std::string SRPSession;
    int TwoFactor = 0;
};

struct AuthRequest {
    std::string ClientID;
    std::string ClientSecret;
    std::string Username;
    std::string SRPSession;
    std::string ClientEphemeral;   // base64
    std::string ClientProof;       // base64
    std::string TwoFactorCode;
};

struct AuthResponse {
    int Code = 0;
    std::string AccessToken;
    std::string TokenType;
    long long ExpiresIn = 0;
    std::string Scope;
    std::string Uid;
    std::string RefreshToken;
    std::string EventID;
    int PasswordMode = 1;
    std::string ServerProof;       // base64
    std::string PrivateKey;
    std::string KeySalt;

    ~AuthResponse();
};

void to_json(nlohmann::json& j, const AuthInfoRequest& request);
void from_json(const nlohmann::json& j, AuthInfoResponse& response);
void to_json(nlohmann::json& j, const AuthRequest& request);
void from_json(const nlohmann::json& j, AuthResponse& response);

// Throws AuthError(ApiError) with the server's "Error" text unless Code is 1000.
void check_api_code(const nlohmann::json& j);

// Parses `j` into T after check_api_code. Malformed bodies become
// AuthError(TransportError).
template <typename T>
T parse_response(const nlohmann::json& j);

extern template AuthInfoResponse parse_response<AuthInfoResponse>(const nlohmann::json&);
extern template AuthResponse parse_response<AuthResponse>(const nlohmann::json&);

// --- DTO -> domain mapping ---

AuthInfo to_auth_info(const AuthInfoResponse& response);
// Throws AuthError(TransportError) for a PasswordMode this client does not know.
SessionCredentials to_credentials(const AuthResponse& response);

} // namespace MailAuth
