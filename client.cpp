#include "client.hpp"

#include <curl/curl.h>
#include <format>
#include <sodium/core.h>
#include <stdexcept>

#include "KeyUnlock.hpp"
#include "Messages.hpp"
#include "SRPAuth.hpp"

namespace MailAuth {

void initialize_mailauth_library() {
  if (sodium_init() < 0) {
    throw std::runtime_error("sodium_init() failed");
  }
  CURLcode res = curl_global_init(CURL_GLOBAL_DEFAULT);
  if (res != CURLE_OK) {
    throw std::runtime_error(std::string("curl_global_init() failed: ") + curl_easy_strerror(res));
  }
  LOG_DEBUG("mailauth library initialized");
}

void finalize_mailauth_library() {
  curl_global_cleanup();
}

const char *to_string(AuthAttempt::State state) noexcept {
  switch (state) {
  case AuthAttempt::State::Idle: return "Idle";
  case AuthAttempt::State::AwaitingAuthParams: return "AwaitingAuthParams";
  case AuthAttempt::State::ProofComputed: return "ProofComputed";
  case AuthAttempt::State::Authenticated: return "Authenticated";
  case AuthAttempt::State::Unlocked: return "Unlocked";
  case AuthAttempt::State::Failed: return "Failed";
  }
  return "Unknown";
}

// --- AuthAttempt ---

AuthAttempt::AuthAttempt(const ClientConfig &config, Transport &transport, OpenPGPProvider &pgp)
    : config_(config), transport_(transport), pgp_(pgp) {}

void AuthAttempt::require(State expected, const char *operation) const {
  if (state_ != expected) {
    LOG_ERROR("{} called in state {}, expected {}", operation, to_string(state_), to_string(expected));
    throw AuthError(AuthErrc::InvalidState,
                    std::format("{} is not allowed in state {}", operation, to_string(state_)));
  }
}

// Any exception out of a step ends the attempt and drops the secrets held so
// far, except a rejected unlock: the attempt stays Authenticated.
template <typename Step> decltype(auto) AuthAttempt::run_step(Step &&step) {
  try {
    return step();
  } catch (const AuthError &e) {
    failure_ = e.errc();
    if (state_ == State::Authenticated && is_unlock_failure(e.errc())) {
      LOG_WARN("Unlock for {} failed, credentials kept: {}", username_, e.what());
      throw;
    }
    state_ = State::Failed;
    if (is_integrity_violation(e.errc())) {
      LOG_ERROR("Authentication of {} aborted, possible attack: {}", username_, e.what());
    } else {
      LOG_WARN("Authentication of {} failed: {}", username_, e.what());
    }
    proof_.reset();
    auth_.reset();
    throw;
  } catch (const std::exception &e) {
    state_ = State::Failed;
    LOG_ERROR("Authentication of {} failed: {}", username_, e.what());
    proof_.reset();
    auth_.reset();
    throw;
  }
}

void AuthAttempt::fetch_auth_info(std::string_view username) {
  require(State::Idle, "fetch_auth_info");
  username_ = username;
  run_step([&] {
    AuthInfoRequest request{config_.client_id, config_.client_secret, username_};
    LOG_INFO("Requesting auth parameters for {}", username_);
    nlohmann::json response = transport_.post_json("/auth/info", request);
    info_ = to_auth_info(parse_response<AuthInfoResponse>(response));
    LOG_DEBUG("Auth version {}, two factor {}", info_->version(), info_->two_factor());
    state_ = State::AwaitingAuthParams;
  });
}

void AuthAttempt::use_auth_info(std::string_view username, AuthInfo info) {
  require(State::Idle, "use_auth_info");
  username_ = username;
  info_ = std::move(info);
  state_ = State::AwaitingAuthParams;
}

void AuthAttempt::compute_proof(std::string_view password) {
  require(State::AwaitingAuthParams, "compute_proof");
  run_step([&] {
    if (!info_->try_consume()) {
      throw AuthError(AuthErrc::InvalidState, "auth parameters were already used");
    }
    proof_ = ::MailAuth::compute_proof(password, *info_, pgp_);
    state_ = State::ProofComputed;
  });
}

const Auth &AuthAttempt::submit(std::string_view two_factor_code) {
  require(State::ProofComputed, "submit");
  return run_step([&]() -> const Auth & {
    AuthRequest request;
    request.ClientID = config_.client_id;
    request.ClientSecret = config_.client_secret;
    request.Username = username_;
    request.SRPSession = info_->srp_session_;
    request.ClientEphemeral = Utils::base64_encode(proof_->client_ephemeral);
    request.ClientProof = Utils::base64_encode(proof_->client_proof);
    request.TwoFactorCode = two_factor_code;

    LOG_INFO("Submitting SRP proof for {}", username_);
    nlohmann::json response = transport_.post_json("/auth", request);
    AuthResponse dto = parse_response<AuthResponse>(response);

    // Nothing from the response is trusted before the server proof checks out
    auto server_proof = Utils::base64_decode(dto.ServerProof);
    if (!server_proof) {
      throw AuthError(AuthErrc::ServerProofMismatch, "server proof is not valid base64");
    }
    verify_server_proof(proof_->expected_server_proof, *server_proof);
    proof_.reset();

    auth_ = Auth(to_credentials(dto));
    state_ = State::Authenticated;
    LOG_INFO("Authenticated {} (uid {})", username_, auth_->uid());
    return *auth_;
  });
}

void AuthAttempt::unlock(Session &session, std::string_view password) {
  require(State::Authenticated, "unlock");
  run_step([&] {
    KeyUnlocker unlocker(pgp_);
    UnlockedIdentity identity = unlocker.unlock(auth_->credentials(), password);
    session.commit(auth_->credentials(), std::move(identity));
    failure_.reset();
    state_ = State::Unlocked;
  });
}

const AuthInfo &AuthAttempt::auth_info() const {
  if (!info_) {
    throw AuthError(AuthErrc::InvalidState, "no auth parameters fetched");
  }
  return *info_;
}

const Bytes &AuthAttempt::client_ephemeral() const {
  static const Bytes empty;
  return proof_ ? proof_->client_ephemeral : empty;
}

// --- Client ---

Client::Client(ClientConfig config, Transport &transport, OpenPGPProvider &pgp)
    : config_(std::move(config)), transport_(transport), pgp_(pgp) {}

AuthInfo Client::auth_info(std::string_view username) {
  AuthAttempt attempt(config_, transport_, pgp_);
  attempt.fetch_auth_info(username);
  return attempt.auth_info();
}

Auth Client::auth(std::string_view username, std::string_view password,
                  std::string_view two_factor_code, std::optional<AuthInfo> info) {
  AuthAttempt attempt(config_, transport_, pgp_);
  if (info && !info->consumed()) {
    attempt.use_auth_info(username, std::move(*info));
  } else {
    if (info) {
      LOG_INFO("Auth parameters for {} were already used, fetching new ones", username);
    }
    attempt.fetch_auth_info(username);
  }
  attempt.compute_proof(password);
  return attempt.submit(two_factor_code);
}

std::shared_ptr<KeyRing> Client::unlock(Session &session, const Auth &auth, std::string_view password) {
  std::lock_guard<std::mutex> lock(unlockMutex_);
  KeyUnlocker unlocker(pgp_);
  UnlockedIdentity identity = unlocker.unlock(auth.credentials(), password);
  std::shared_ptr<KeyRing> ring = identity.key_ring;
  session.commit(auth.credentials(), std::move(identity));
  return ring;
}

} // namespace MailAuth
