#include "SRP.hpp"
#include <format>
#include <stdexcept>
#include <openssl/crypto.h> // For CRYPTO_memcmp
#include "AuthError.hpp"

namespace MailAuth {

Hasher::Hasher(const EVP_MD* md) : md_(md) {
  if (!md_) throw std::invalid_argument("Hash algorithm cannot be null");
  md_ctx_ = EVP_MD_CTX_new();
  if (!md_ctx_)
    throw std::runtime_error("Failed to create EVP_MD_CTX: " +
                             get_openssl_error());
  if (!EVP_DigestInit_ex(md_ctx_, md_, nullptr)) {
    EVP_MD_CTX_free(md_ctx_);
    throw std::runtime_error("Failed to initialize digest context: " +
                             get_openssl_error());
  }
}

Hasher::~Hasher() {
  if (md_ctx_) EVP_MD_CTX_free(md_ctx_);
}

Hasher::Hasher(Hasher&& other) noexcept : md_ctx_(other.md_ctx_), md_(other.md_) {
  other.md_ctx_ = nullptr;
  other.md_ = nullptr;
}

Hasher& Hasher::operator=(Hasher&& other) noexcept {
  if (this != &other) {
    if (md_ctx_) EVP_MD_CTX_free(md_ctx_);
    md_ctx_ = other.md_ctx_;
    md_ = other.md_;
    other.md_ctx_ = nullptr;
    other.md_ = nullptr;
  }
  return *this;
}

void Hasher::reset() {
  if (!EVP_DigestInit_ex(md_ctx_, md_, nullptr)) {
    throw std::runtime_error("Failed to reset digest context: " +
                             get_openssl_error());
  }
}

void Hasher::update(std::span<const unsigned char> data) {
  if (!EVP_DigestUpdate(md_ctx_, data.data(), data.size())) {
    throw std::runtime_error("Failed to update digest: " + get_openssl_error());
  }
}

void Hasher::update(const std::string& str) {
  update(std::span<const unsigned char>(
      reinterpret_cast<const unsigned char*>(str.data()), str.size()));
}

std::vector<unsigned char> Hasher::finalize() {
  std::vector<unsigned char> digest(EVP_MD_CTX_get_size(md_ctx_));
  unsigned int digest_len = 0;
  if (!EVP_DigestFinal_ex(md_ctx_, digest.data(), &digest_len)) {
    throw std::runtime_error("Failed to finalize digest: " +
                             get_openssl_error());
  }
  digest.resize(digest_len);
  reset();
  return digest;
}

size_t Hasher::digest_size() const {
  int size = EVP_MD_get_size(md_);
  return (size > 0) ? static_cast<size_t>(size) : 0;
}

Bytes expand_hash(std::span<const uint8_t> data) {
  Hasher hasher(EVP_sha512());
  Bytes out;
  out.reserve(4 * hasher.digest_size());
  for (unsigned char i = 0; i < 4; ++i) {
    hasher.update(data);
    hasher.update(std::span<const unsigned char>(&i, 1));
    Bytes part = hasher.finalize();
    out.insert(out.end(), part.begin(), part.end());
  }
  return out;
}

// --- Parameters ---

SRPParameters SRPParameters::from_modulus(std::span<const uint8_t> modulus_le) {
  SRPParameters params{BigNum::from_bytes_le(modulus_le), BigNum(kSRPGenerator),
                       Bytes(modulus_le.begin(), modulus_le.end())};
  BnCtx ctx;
  params.validate(ctx);
  return params;
}

void SRPParameters::validate(BnCtx& ctx) const {
  auto reject = [](const std::string& why) {
    LOG_ERROR("Rejecting SRP modulus, possible attack: {}", why);
    throw AuthError(AuthErrc::InvalidModulus, why);
  };

  if (N_bytes.size() != kSRPByteLength || N.num_bits() != kSRPBitLength) {
    reject(std::format("modulus has {} bits, expected {}", N.num_bits(), kSRPBitLength));
  }
  BigNum N_minus_one = N - BigNum(1);
  if (g <= 1 || g >= N_minus_one) {
    reject(std::format("generator {} is out of bounds", g.to_hex()));
  }
  if (!N.is_probable_prime(ctx)) {
    reject("modulus is not prime");
  }
  if (!N.shifted_right(1).is_probable_prime(ctx)) {
    reject("modulus is not a safe prime");
  }
  LOG_DEBUG("SRP modulus accepted ({} bits)", N.num_bits());
}

namespace SRPCommon {

// k = H(pad(g) || N)
BigNum calculate_k(const SRPParameters& params) {
  Bytes input = params.g.to_bytes_le(kSRPByteLength);
  input.insert(input.end(), params.N_bytes.begin(), params.N_bytes.end());
  BigNum k = BigNum::from_bytes_le(expand_hash(input)) % params.N;
  BigNum N_minus_one = params.N - BigNum(1);
  if (k <= 1 || k >= N_minus_one) {
    LOG_ERROR("SRP multiplier out of bounds, possible attack");
    throw AuthError(AuthErrc::InvalidModulus, "SRP multiplier is out of bounds");
  }
  LOG_DEBUG("Calculated k = H(pad(g), N)");
  return k;
}

// u = H(pad(A) || B)
BigNum calculate_u(std::span<const uint8_t> A_bytes, std::span<const uint8_t> B_bytes) {
  Bytes input(A_bytes.begin(), A_bytes.end());
  input.insert(input.end(), B_bytes.begin(), B_bytes.end());
  BigNum u = BigNum::from_bytes_le(expand_hash(input));
  if (u.is_zero()) {
    LOG_ERROR("SRP scrambling parameter u is zero, possible attack");
    throw AuthError(AuthErrc::InvalidServerEphemeral, "SRP scrambling parameter is zero");
  }
  return u;
}

// K = H(pad(S))
Bytes calculate_K(const BigNum& S) {
  Bytes S_bytes = S.to_bytes_le(kSRPByteLength);
  Utils::ScopedWipe<Bytes> wipe_S(S_bytes);
  return expand_hash(S_bytes);
}

// M1 = H(pad(A) || pad(B) || K)
Bytes calculate_M1(std::span<const uint8_t> A_bytes, std::span<const uint8_t> B_bytes,
                   std::span<const uint8_t> K) {
  Bytes input(A_bytes.begin(), A_bytes.end());
  Utils::ScopedWipe<Bytes> wipe_input(input);
  input.insert(input.end(), B_bytes.begin(), B_bytes.end());
  input.insert(input.end(), K.begin(), K.end());
  return expand_hash(input);
}

// M2 = H(pad(A) || M1 || K)
Bytes calculate_M2(std::span<const uint8_t> A_bytes, std::span<const uint8_t> M1,
                   std::span<const uint8_t> K) {
  Bytes input(A_bytes.begin(), A_bytes.end());
  Utils::ScopedWipe<Bytes> wipe_input(input);
  input.insert(input.end(), M1.begin(), M1.end());
  input.insert(input.end(), K.begin(), K.end());
  return expand_hash(input);
}

BigNum generate_secret(const BigNum& N) {
  BigNum bound = N - BigNum(1);
  BigNum minimum(2 * kSRPBitLength);
  for (;;) {
    BigNum secret = BigNum::random_below(bound);
    if (secret > minimum) return secret;
  }
}

} // namespace SRPCommon

void verify_server_proof(std::span<const uint8_t> expected, std::span<const uint8_t> received) {
  // Lengths are public; the contents are compared without early exit
  bool success = !expected.empty() && expected.size() == received.size() &&
                 CRYPTO_memcmp(expected.data(), received.data(), expected.size()) == 0;
  if (!success) {
    LOG_ERROR("Server proof M2 verification failed!");
    throw AuthError(AuthErrc::ServerProofMismatch, "invalid server proof");
  }
  LOG_INFO("Server proof M2 verified successfully.");
}


SRPClient::SRPClient(SRPParameters params, bool use_mod_accel)
    : params_(std::move(params)),
      ctx_(),
      use_mod_accel_(use_mod_accel)
{
  if (use_mod_accel_) {
    try {
      accel_ = ModAccel(params_.N, ctx_);
    } catch (const std::exception& e) {
      LOG_WARN("Failed to initialize modular accelerator: {}", e.what());
      use_mod_accel_ = false;
    }
  }
  k_ = SRPCommon::calculate_k(params_);
}

ClientProof SRPClient::compute_proof(std::span<const uint8_t> hashed_password,
                                     std::span<const uint8_t> server_ephemeral) {
  if (state_ != State::INITIALIZED)
    throw std::logic_error("SRPClient already produced a proof; start a new attempt.");
  state_ = State::PROOF_COMPUTED;

  const BigNum& N = params_.N;
  ModAccel* accel = use_mod_accel_ ? &accel_ : nullptr;

  if (server_ephemeral.size() != kSRPByteLength) {
    LOG_ERROR("Server ephemeral has {} bytes, expected {}", server_ephemeral.size(), kSRPByteLength);
    throw AuthError(AuthErrc::InvalidServerEphemeral, "server ephemeral has wrong size");
  }
  BigNum B = BigNum::from_bytes_le(server_ephemeral);

  // Safety check: B % N != 0
  if ((B % N).is_zero()) {
    LOG_ERROR("Server public key B is congruent to 0 mod N, possible attack");
    throw AuthError(AuthErrc::InvalidServerEphemeral,
                    "server public key B is congruent to 0 mod N");
  }
  BigNum N_minus_one = N - BigNum(1);
  if (B <= 1 || B >= N_minus_one) {
    LOG_ERROR("Server public key B is out of bounds, possible attack");
    throw AuthError(AuthErrc::InvalidServerEphemeral, "server public key B is out of bounds");
  }

  LOG_INFO("Generating client ephemeral public key A...");
  BigNum a = SRPCommon::generate_secret(N);
  BigNum A = params_.g.mod_exp(a, N, ctx_, accel);
  Bytes A_bytes = A.to_bytes_le(kSRPByteLength);
  LOG_DEBUG("Client public key A: {:L16}", A_bytes);

  BigNum u = SRPCommon::calculate_u(A_bytes, server_ephemeral);
  BigNum x = BigNum::from_bytes_le(hashed_password);

  // S = (B - k*g^x)^(a + u*x) mod N, exponent reduced mod N-1
  BigNum g_x = params_.g.mod_exp(x, N, ctx_, accel);
  BigNum k_g_x = k_.mod_mul(g_x, N, ctx_);
  BigNum base = B.mod_sub(k_g_x, N, ctx_);
  BigNum exponent = u.mod_mul(x, N_minus_one, ctx_).mod_add(a, N_minus_one, ctx_);
  BigNum S = base.mod_exp(exponent, N, ctx_, accel);

  Bytes K = SRPCommon::calculate_K(S);
  Utils::ScopedWipe<Bytes> wipe_K(K);

  Bytes B_bytes(server_ephemeral.begin(), server_ephemeral.end());
  ClientProof proof;
  proof.client_proof = SRPCommon::calculate_M1(A_bytes, B_bytes, K);
  proof.expected_server_proof = SRPCommon::calculate_M2(A_bytes, proof.client_proof, K);
  proof.client_ephemeral = std::move(A_bytes);
  LOG_INFO("Client proof M1 computed.");
  return proof;
}


SRPServer::SRPServer(SRPParameters params)
    : params_(std::move(params)),
      ctx_()
{
  k_ = SRPCommon::calculate_k(params_);
}

Bytes SRPServer::compute_verifier(const SRPParameters& params, std::span<const uint8_t> hashed_password) {
  BnCtx ctx;
  BigNum x = BigNum::from_bytes_le(hashed_password);
  return params.g.mod_exp(x, params.N, ctx).to_bytes_le(kSRPByteLength);
}

void SRPServer::set_verifier(std::span<const uint8_t> verifier) {
  if (state_ != State::INITIALIZED) throw std::logic_error("Verifier already set.");
  v_ = BigNum::from_bytes_le(verifier);
  if (v_->is_zero()) throw std::invalid_argument("Provided verifier is invalid.");
  state_ = State::VERIFIER_SET;
}

Bytes SRPServer::generate_public_key() {
  if (state_ < State::VERIFIER_SET)
    throw std::logic_error("Verifier not set.");
  if (state_ >= State::PUBLIC_KEY_GENERATED)
    return B_bytes_;  // Idempotent

  const BigNum& N = params_.N;
  BigNum N_minus_one = N - BigNum(1);
  do {
    b_ = SRPCommon::generate_secret(N);
    BigNum g_b = params_.g.mod_exp(*b_, N, ctx_);
    BigNum k_v = k_.mod_mul(*v_, N, ctx_);
    BigNum B = k_v.mod_add(g_b, N, ctx_);
    if (B > 1 && B < N_minus_one) {
      B_bytes_ = B.to_bytes_le(kSRPByteLength);
    }
  } while (B_bytes_.empty());

  state_ = State::PUBLIC_KEY_GENERATED;
  return B_bytes_;
}

bool SRPServer::verify_client_proof(std::span<const uint8_t> client_A_bytes,
                                    std::span<const uint8_t> client_M1_bytes) {
  if (state_ < State::PUBLIC_KEY_GENERATED)
    throw std::logic_error("Server public key not generated.");

  const BigNum& N = params_.N;
  BigNum A = BigNum::from_bytes_le(client_A_bytes);
  if ((A % N).is_zero()) {
    LOG_ERROR("Client public key A is congruent to 0 mod N.");
    return false;
  }
  Bytes A_bytes = A.to_bytes_le(kSRPByteLength);

  BigNum u = SRPCommon::calculate_u(A_bytes, B_bytes_);
  // S = (A * v^u)^b mod N
  BigNum v_u = v_->mod_exp(u, N, ctx_);
  BigNum A_vu = A.mod_mul(v_u, N, ctx_);
  BigNum S = A_vu.mod_exp(*b_, N, ctx_);

  Bytes K = SRPCommon::calculate_K(S);
  Utils::ScopedWipe<Bytes> wipe_K(K);
  Bytes M1 = SRPCommon::calculate_M1(A_bytes, B_bytes_, K);

  bool success = (client_M1_bytes.size() == M1.size()) &&
                 (CRYPTO_memcmp(client_M1_bytes.data(), M1.data(), M1.size()) == 0);
  if (!success) {
    LOG_WARN("Client proof M1 verification failed!");
    return false;
  }
  M2_ = SRPCommon::calculate_M2(A_bytes, M1, K);
  state_ = State::CLIENT_VERIFIED;
  return true;
}

Bytes SRPServer::generate_server_proof() const {
  if (state_ < State::CLIENT_VERIFIED)
    throw std::logic_error("Client not verified yet.");
  return M2_;
}

} // namespace MailAuth
