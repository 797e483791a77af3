#include "KeyUnlock.hpp"
#include <format>
#include "AuthError.hpp"
#include "PasswordHash.hpp"
#include "logger.hpp"

namespace MailAuth {

std::string KeyUnlocker::derive_passphrase(const SessionCredentials& credentials,
                                           std::string_view password) const {
  if (credentials.password_mode == PasswordMode::TwoPasswords) {
    // Mailbox password is used as is
    return std::string(password);
  }
  auto salt = Utils::base64_decode(credentials.key_salt);
  if (!salt) {
    LOG_ERROR("Key salt of user {} is not valid base64", credentials.user_id);
    throw AuthError(AuthErrc::InvalidKeySalt, "key salt is not valid base64");
  }
  return PasswordHash::compute_key_password(password, *salt);
}

UnlockedIdentity KeyUnlocker::unlock(const SessionCredentials& credentials, std::string_view password) {
  std::string passphrase = derive_passphrase(credentials, password);
  Utils::ScopedWipe<std::string> wipe_passphrase(passphrase);

  std::unique_ptr<KeyRing> ring = pgp_.parse_armored_key_ring(credentials.encrypted_private_key);
  if (!ring) {
    throw AuthError(AuthErrc::MalformedKeyRing, "private key is not a parsable key ring");
  }
  const size_t count = ring->entry_count();
  if (count == 0) {
    throw AuthError(AuthErrc::MalformedKeyRing, "private key ring is empty");
  }

  for (size_t i = 0; i < count; ++i) {
    if (!ring->decrypt_entry(i, passphrase)) {
      LOG_WARN("Key {} of {} rejected the passphrase", i + 1, count);
      throw AuthError(AuthErrc::DecryptionFailed,
                      std::format("key {} of {} could not be decrypted", i + 1, count));
    }
  }
  LOG_INFO("Unlocked {} key(s) for user {}", count, credentials.user_id);
  return UnlockedIdentity{credentials.user_id, std::shared_ptr<KeyRing>(std::move(ring))};
}

} // namespace MailAuth
