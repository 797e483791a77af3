#include "Messages.hpp"
#include <format>
#include <nlohmann/json.hpp>
#include "AuthError.hpp"
#include "AuthUtils.hpp"
#include "logger.hpp"

namespace MailAuth {

AuthResponse::~AuthResponse() {
  Utils::secure_wipe(AccessToken);
  Utils::secure_wipe(RefreshToken);
}

void to_json(nlohmann::json& j, const AuthInfoRequest& request) {
  j = nlohmann::json{{"ClientID", request.ClientID},
                     {"ClientSecret", request.ClientSecret},
                     {"Username", request.Username}};
}

void from_json(const nlohmann::json& j, AuthInfoResponse& response) {
  response.Code = j.at("Code").get<int>();
  response.Version = j.at("Version").get<int>();
  response.Modulus = j.at("Modulus").get<std::string>();
  response.ServerEphemeral = j.at("ServerEphemeral").get<std::string>();
  response.Salt = j.at("Salt").get<std::string>();
  response.SRPSession = j.at("SRPSession").get<std::string>();
  response.TwoFactor = j.value("TwoFactor", 0);
}

void to_json(nlohmann::json& j, const AuthRequest& request) {
  j = nlohmann::json{{"ClientID", request.ClientID},
                     {"ClientSecret", request.ClientSecret},
                     {"Username", request.Username},
                     {"SRPSession", request.SRPSession},
                     {"ClientEphemeral", request.ClientEphemeral},
                     {"ClientProof", request.ClientProof}};
  if (!request.TwoFactorCode.empty()) {
    j["TwoFactorCode"] = request.TwoFactorCode;
  }
}

void from_json(const nlohmann::json& j, AuthResponse& response) {
  response.Code = j.at("Code").get<int>();
  response.AccessToken = j.at("AccessToken").get<std::string>();
  response.TokenType = j.value("TokenType", std::string());
  response.ExpiresIn = j.value("ExpiresIn", 0LL);
  response.Scope = j.value("Scope", std::string());
  response.Uid = j.at("Uid").get<std::string>();
  response.RefreshToken = j.value("RefreshToken", std::string());
  response.EventID = j.value("EventID", std::string());
  response.PasswordMode = j.value("PasswordMode", 1);
  response.ServerProof = j.at("ServerProof").get<std::string>();
  response.PrivateKey = j.value("PrivateKey", std::string());
  response.KeySalt = j.value("KeySalt", std::string());
}

void check_api_code(const nlohmann::json& j) {
  if (!j.is_object() || !j.contains("Code") || !j["Code"].is_number_integer()) {
    throw AuthError(AuthErrc::TransportError, "response has no Code field");
  }
  int code = j["Code"].get<int>();
  if (code != kApiSuccessCode) {
    std::string message = j.value("Error", std::string("unknown error"));
    LOG_WARN("API returned code {}: {}", code, message);
    throw AuthError(AuthErrc::ApiError, std::format("API error {}: {}", code, message));
  }
}

template <typename T>
T parse_response(const nlohmann::json& j) {
  check_api_code(j);
  try {
    return j.get<T>();
  } catch (const nlohmann::json::exception& e) {
    LOG_ERROR("Malformed API response: {}", e.what());
    throw AuthError(AuthErrc::TransportError, e.what());
  }
}

template AuthInfoResponse parse_response<AuthInfoResponse>(const nlohmann::json&);
template AuthResponse parse_response<AuthResponse>(const nlohmann::json&);

AuthInfo to_auth_info(const AuthInfoResponse& response) {
  AuthInfo info;
  info.version_ = response.Version;
  info.two_factor_ = response.TwoFactor;
  info.modulus_ = response.Modulus;
  info.server_ephemeral_ = response.ServerEphemeral;
  info.salt_ = response.Salt;
  info.srp_session_ = response.SRPSession;
  return info;
}

SessionCredentials to_credentials(const AuthResponse& response) {
  SessionCredentials credentials;
  switch (response.PasswordMode) {
    case 1: credentials.password_mode = PasswordMode::SinglePassword; break;
    case 2: credentials.password_mode = PasswordMode::TwoPasswords; break;
    default:
      throw AuthError(AuthErrc::TransportError,
                      std::format("unknown password mode {}", response.PasswordMode));
  }
  credentials.access_token = response.AccessToken;
  credentials.refresh_token = response.RefreshToken;
  credentials.token_type = response.TokenType;
  credentials.scope = response.Scope;
  credentials.user_id = response.Uid;
  credentials.event_id = response.EventID;
  credentials.expires_in = std::chrono::seconds(response.ExpiresIn);
  credentials.encrypted_private_key = response.PrivateKey;
  credentials.key_salt = response.KeySalt;
  return credentials;
}

} // namespace MailAuth
