#include "SRPAuth.hpp"
#include <format>
#include "AuthError.hpp"
#include "PasswordHash.hpp"
#include "logger.hpp"

namespace MailAuth {

namespace {
[[noreturn]] void reject_modulus(const std::string& why) {
  LOG_ERROR("Rejecting signed modulus, possible attack: {}", why);
  throw AuthError(AuthErrc::InvalidModulus, why);
}
} // namespace

Bytes read_signed_modulus(std::string_view signed_modulus, OpenPGPProvider& pgp) {
  auto message = ClearSignedMessage::parse(signed_modulus);
  if (!message) {
    reject_modulus("modulus is not a well-formed clear-signed message");
  }
  if (!pgp.verify_detached_signature(message->signed_text, message->armored_signature)) {
    reject_modulus("modulus signature does not verify");
  }

  // The body is a single base64 line; surrounding whitespace is not signed content
  std::string_view body = message->plaintext;
  while (!body.empty() && (body.back() == '\n' || body.back() == '\r' || body.back() == ' '))
    body.remove_suffix(1);
  while (!body.empty() && (body.front() == '\n' || body.front() == '\r' || body.front() == ' '))
    body.remove_prefix(1);

  auto modulus = Utils::base64_decode(body);
  if (!modulus || modulus->empty()) {
    reject_modulus("modulus body is not valid base64");
  }
  LOG_DEBUG("Signed modulus verified ({} bytes)", modulus->size());
  return std::move(*modulus);
}

ClientProof compute_proof(std::string_view password, const AuthInfo& info, OpenPGPProvider& pgp) {
  Bytes modulus = read_signed_modulus(info.modulus_, pgp);
  SRPParameters params = SRPParameters::from_modulus(modulus);

  auto server_ephemeral = Utils::base64_decode(info.server_ephemeral_);
  if (!server_ephemeral) {
    LOG_ERROR("Server ephemeral is not valid base64, possible attack");
    throw AuthError(AuthErrc::InvalidServerEphemeral, "server ephemeral is not valid base64");
  }
  auto salt = Utils::base64_decode(info.salt_);
  if (!salt) {
    throw AuthError(AuthErrc::TransportError, "SRP salt is not valid base64");
  }

  Bytes hashed_password = PasswordHash::hash_password(info.version_, password, *salt, params.N_bytes);
  Utils::ScopedWipe<Bytes> wipe_hashed(hashed_password);

  SRPClient client(std::move(params));
  return client.compute_proof(hashed_password, *server_ephemeral);
}

} // namespace MailAuth
