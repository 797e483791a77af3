#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "AuthError.hpp"
#include "AuthTypes.hpp"
#include "ClientConfig.hpp"
#include "OpenPGP.hpp"
#include "SRP.hpp"
#include "Session.hpp"
#include "Transport.hpp"
#include "logger.hpp"

namespace MailAuth {

// Process-wide setup of libsodium and libcurl. Call once before creating a
// Client or CurlTransport; throws std::runtime_error on failure.
void initialize_mailauth_library();
void finalize_mailauth_library();

// --- AuthAttempt ---
// One login of one user, driven step by step by one thread. A failed unlock
// leaves the attempt Authenticated so it can be retried with another
// password; any other failure is final and needs a new attempt with freshly
// fetched parameters.

class AuthAttempt {
public:
  enum class State {
    Idle,               // Nothing fetched yet
    AwaitingAuthParams, // AuthInfo available, no proof yet
    ProofComputed,      // A and M1 ready, expected M2 held
    Authenticated,      // Server proof verified, credentials held
    Unlocked,           // Key ring decrypted and committed to a Session
    Failed              // Terminal; see failure()
  };

  AuthAttempt(const ClientConfig &config, Transport &transport, OpenPGPProvider &pgp);

  AuthAttempt(const AuthAttempt &) = delete;
  AuthAttempt &operator=(const AuthAttempt &) = delete;

  // Idle -> AwaitingAuthParams through POST /auth/info.
  void fetch_auth_info(std::string_view username);
  // Idle -> AwaitingAuthParams with parameters fetched earlier.
  void use_auth_info(std::string_view username, AuthInfo info);
  // AwaitingAuthParams -> ProofComputed. Marks the AuthInfo as used.
  void compute_proof(std::string_view password);
  // ProofComputed -> Authenticated through POST /auth, only if the server's
  // proof matches. The code is sent as is; empty means none.
  const Auth &submit(std::string_view two_factor_code = {});
  // Authenticated -> Unlocked; commits the decrypted ring to `session`.
  // InvalidKeySalt, MalformedKeyRing and DecryptionFailed keep the attempt
  // Authenticated. Unlike Client::unlock this does not serialize against
  // other unlocks of the same Session; the caller must.
  void unlock(Session &session, std::string_view password);

  State state() const { return state_; }
  // Last AuthError of this attempt: the reason of Failed, or of a rejected
  // unlock. Cleared by a successful unlock.
  std::optional<AuthErrc> failure() const { return failure_; }

  const AuthInfo &auth_info() const;
  // nullptr unless Authenticated or Unlocked.
  const Auth *auth() const { return auth_ ? &*auth_ : nullptr; }
  // Client ephemeral A of this attempt, empty before ProofComputed.
  const Bytes &client_ephemeral() const;

private:
  void require(State expected, const char *operation) const;
  template <typename Step> decltype(auto) run_step(Step &&step);

  const ClientConfig &config_;
  Transport &transport_;
  OpenPGPProvider &pgp_;

  State state_ = State::Idle;
  std::optional<AuthErrc> failure_;
  std::string username_;
  std::optional<AuthInfo> info_;
  std::optional<ClientProof> proof_;
  std::optional<Auth> auth_;
};

const char *to_string(AuthAttempt::State state) noexcept;

// --- Client ---

class Client {
public:
  Client(ClientConfig config, Transport &transport, OpenPGPProvider &pgp);

  // POST /auth/info; the result may be passed back to auth().
  AuthInfo auth_info(std::string_view username);

  // Full handshake. A pre-fetched AuthInfo saves one round-trip unless its
  // SRP session was already used, in which case fresh parameters are fetched.
  Auth auth(std::string_view username, std::string_view password,
            std::string_view two_factor_code = {},
            std::optional<AuthInfo> info = std::nullopt);

  // Decrypts the key ring of `auth` and commits it to `session`. `password`
  // is the login password for single-password accounts and the mailbox
  // password otherwise. Unlocks on one Client run one at a time. Returns the
  // ring now held by the session.
  std::shared_ptr<KeyRing> unlock(Session &session, const Auth &auth, std::string_view password);

  const ClientConfig &config() const { return config_; }

private:
  ClientConfig config_;
  Transport &transport_;
  OpenPGPProvider &pgp_;
  std::mutex unlockMutex_;
};

} // namespace MailAuth
