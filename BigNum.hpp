#pragma once

#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <compare>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "logger.hpp"

namespace MailAuth {

class BnCtx;
class ModAccel;
class BigNum;

// Helper to get OpenSSL error string
inline std::string get_openssl_error() {
    unsigned long err_code = ERR_get_error();
    if (err_code == 0) {
        return "No OpenSSL error";
    }
    char err_buf[256];
    ERR_error_string_n(err_code, err_buf, sizeof(err_buf));
    return std::string(err_buf);
}

struct BnCtxDeleter {
    void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
};

struct MontCtxDeleter {
    void operator()(BN_MONT_CTX* ctx) const { BN_MONT_CTX_free(ctx); }
};

// Scratch space for BIGNUM operations, taken from OpenSSL's secure heap.
class BnCtx {
public:
    BnCtx();
    BN_CTX* get() const noexcept { return ctx_.get(); }

private:
    std::unique_ptr<BN_CTX, BnCtxDeleter> ctx_;
};

// Montgomery form of one modulus, reused by every exponentiation mod N of
// a handshake.
class ModAccel {
public:
    ModAccel() = default;
    ModAccel(const BigNum& modulus, BnCtx& bn_ctx);

    BN_MONT_CTX* get() const noexcept { return mont_ctx_.get(); }
    bool is_valid() const noexcept { return mont_ctx_ != nullptr; }

private:
    std::unique_ptr<BN_MONT_CTX, MontCtxDeleter> mont_ctx_;
};

// Owning BIGNUM. Storage is cleared on destruction, so secrets held in a
// BigNum do not outlive it.
class BigNum {
    BIGNUM* bn_ = nullptr;

    explicit BigNum(BIGNUM* bn) noexcept : bn_(bn) {}

public:
    BigNum();
    explicit BigNum(unsigned int val);
    ~BigNum() { BN_clear_free(bn_); }

    BigNum(const BigNum& other);
    BigNum& operator=(const BigNum& other);
    BigNum(BigNum&& other) noexcept : bn_(std::exchange(other.bn_, nullptr)) {}
    BigNum& operator=(BigNum&& other) noexcept;

    // Little-endian, the byte order the mail service uses on the wire
    static BigNum from_bytes_le(std::span<const unsigned char> bytes);
    std::vector<unsigned char> to_bytes_le(size_t target_len) const;

    // Uniform in [0, bound)
    static BigNum random_below(const BigNum& bound);

    BIGNUM* get() const noexcept { return bn_; }

    // --- Arithmetic Operations ---
    BigNum operator+(const BigNum& rhs) const;
    BigNum operator-(const BigNum& rhs) const;
    BigNum operator%(const BigNum& rhs) const;

    // Modular Arithmetic, results in [0, modulus)
    BigNum mod_add(const BigNum& rhs, const BigNum& modulus, BnCtx& ctx) const;
    BigNum mod_sub(const BigNum& rhs, const BigNum& modulus, BnCtx& ctx) const;
    BigNum mod_mul(const BigNum& rhs, const BigNum& modulus, BnCtx& ctx) const;
    BigNum mod_exp(const BigNum& exponent, const BigNum& modulus, BnCtx& ctx, ModAccel* accel = nullptr) const;

    BigNum shifted_right(int bits) const;
    bool is_probable_prime(BnCtx& ctx) const;

    // Comparisons follow BN_cmp, so sign is taken into account.
    std::strong_ordering operator<=>(const BigNum& rhs) const noexcept {
        return BN_cmp(bn_, rhs.bn_) <=> 0;
    }
    bool operator==(const BigNum& rhs) const noexcept { return BN_cmp(bn_, rhs.bn_) == 0; }

    std::strong_ordering operator<=>(unsigned int rhs) const;
    bool operator==(unsigned int rhs) const;

    int num_bits() const noexcept { return BN_num_bits(bn_); }
    bool is_zero() const noexcept { return BN_is_zero(bn_); }
    bool is_one() const noexcept { return BN_is_one(bn_); }

    std::string to_hex() const;
};

} // namespace MailAuth
