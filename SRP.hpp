#pragma once
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <openssl/evp.h>
#include "AuthUtils.hpp"
#include "BigNum.hpp"
#include "logger.hpp"

namespace MailAuth {

// --- Hasher Class ---

class Hasher {
    EVP_MD_CTX* md_ctx_ = nullptr;
    const EVP_MD* md_ = nullptr;

   public:
    explicit Hasher(const EVP_MD* md);
    ~Hasher();

    Hasher(const Hasher&) = delete;
    Hasher& operator=(const Hasher&) = delete;
    Hasher(Hasher&& other) noexcept;
    Hasher& operator=(Hasher&& other) noexcept;

    void reset();
    void update(std::span<const unsigned char> data);
    void update(const std::string& str);
    std::vector<unsigned char> finalize();
    size_t digest_size() const;
};

// The service's 2048-bit hash:
//   SHA512(data || 0) || SHA512(data || 1) || SHA512(data || 2) || SHA512(data || 3)
Bytes expand_hash(std::span<const uint8_t> data);

// --- SRP Definitions ---

constexpr int kSRPBitLength = 2048;
constexpr size_t kSRPByteLength = kSRPBitLength / 8;
constexpr unsigned int kSRPGenerator = 2;

struct SRPParameters {
    BigNum N;        // Modulus
    BigNum g;        // Generator
    Bytes N_bytes;   // Modulus exactly as received (little-endian)

    // Builds parameters from the raw little-endian modulus and validates
    // them. Throws AuthError(InvalidModulus) if N is not a 2048-bit safe prime.
    static SRPParameters from_modulus(std::span<const uint8_t> modulus_le);

    void validate(BnCtx& ctx) const;
};

// Result of one client-side handshake computation. Never reused.
struct ClientProof {
    Bytes client_ephemeral;       // A, little-endian, 256 bytes
    Bytes client_proof;           // M1
    Bytes expected_server_proof;  // M2

    ClientProof() = default;
    ClientProof(const ClientProof&) = delete;
    ClientProof& operator=(const ClientProof&) = delete;
    ClientProof(ClientProof&&) noexcept = default;
    ClientProof& operator=(ClientProof&&) noexcept = default;
    ~ClientProof() { Utils::secure_wipe(expected_server_proof); }
};

// Constant-time; throws AuthError(ServerProofMismatch) on any difference.
void verify_server_proof(std::span<const uint8_t> expected, std::span<const uint8_t> received);

namespace SRPCommon {
BigNum calculate_k(const SRPParameters& params);
BigNum calculate_u(std::span<const uint8_t> A_bytes, std::span<const uint8_t> B_bytes);
Bytes calculate_K(const BigNum& S);
Bytes calculate_M1(std::span<const uint8_t> A_bytes, std::span<const uint8_t> B_bytes,
                   std::span<const uint8_t> K);
Bytes calculate_M2(std::span<const uint8_t> A_bytes, std::span<const uint8_t> M1,
                   std::span<const uint8_t> K);
// Secret exponent in (2 * bits, N - 1)
BigNum generate_secret(const BigNum& N);
} // namespace SRPCommon


// --- SRPClient Class ---
// One instance per authentication attempt; compute_proof may run once.
class SRPClient {
public:
    explicit SRPClient(SRPParameters params, bool use_mod_accel = true);

    // hashed_password is x from PasswordHash::hash_password, server_ephemeral
    // is B as received (little-endian, 256 bytes).
    ClientProof compute_proof(std::span<const uint8_t> hashed_password,
                              std::span<const uint8_t> server_ephemeral);

private:
    enum class State {
    INITIALIZED,
    PROOF_COMPUTED
    };

    SRPParameters params_;
    BnCtx ctx_;
    ModAccel accel_;
    bool use_mod_accel_;
    BigNum k_;
    State state_ = State::INITIALIZED;
};


// --- SRPServer Class ---
// Verifier side of the exchange: computes password verifiers for signup and
// password change, and answers a handshake the way the service does.
class SRPServer {
public:
    explicit SRPServer(SRPParameters params);

    // v = g^x mod N, little-endian, 256 bytes
    static Bytes compute_verifier(const SRPParameters& params, std::span<const uint8_t> hashed_password);

    void set_verifier(std::span<const uint8_t> verifier);

    // B = (k*v + g^b) mod N, little-endian, 256 bytes
    Bytes generate_public_key();

    bool verify_client_proof(std::span<const uint8_t> client_A_bytes,
                             std::span<const uint8_t> client_M1_bytes);

    // Call after a successful verify_client_proof
    Bytes generate_server_proof() const;

private:
    enum class State {
    INITIALIZED,
    VERIFIER_SET,
    PUBLIC_KEY_GENERATED,
    CLIENT_VERIFIED
    };

    SRPParameters params_;
    BnCtx ctx_;
    BigNum k_;
    std::optional<BigNum> v_;
    std::optional<BigNum> b_;
    Bytes B_bytes_;
    Bytes M2_;
    State state_ = State::INITIALIZED;
};

} // namespace MailAuth
