#include "BigNum.hpp"

namespace MailAuth {

BnCtx::BnCtx() : ctx_(BN_CTX_secure_new()) {
    if (!ctx_) throw std::runtime_error("Failed to create BN_CTX: " + get_openssl_error());
}

BigNum::BigNum() : bn_(BN_new()) {
    if (!bn_) throw std::runtime_error("Failed to create BIGNUM: " + get_openssl_error());
}

BigNum::BigNum(unsigned int val) : BigNum() {
    if (!BN_set_word(bn_, static_cast<BN_ULONG>(val))) {
        throw std::runtime_error("BN_set_word failed: " + get_openssl_error());
    }
}

BigNum::BigNum(const BigNum& other) : bn_(BN_dup(other.bn_)) {
    if (!bn_) throw std::runtime_error("BN_dup failed: " + get_openssl_error());
}

BigNum& BigNum::operator=(const BigNum& other) {
    if (this != &other) {
        BigNum copy(other);
        std::swap(bn_, copy.bn_);
    }
    return *this;
}

BigNum& BigNum::operator=(BigNum&& other) noexcept {
    if (this != &other) {
        BN_clear_free(bn_);
        bn_ = std::exchange(other.bn_, nullptr);
    }
    return *this;
}

BigNum BigNum::from_bytes_le(std::span<const unsigned char> bytes) {
    BIGNUM* bn = BN_lebin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr);
    if (!bn) throw std::runtime_error("Failed to create BIGNUM from LE bytes: " + get_openssl_error());
    return BigNum(bn);
}

std::vector<unsigned char> BigNum::to_bytes_le(size_t target_len) const {
    if (static_cast<size_t>(BN_num_bytes(bn_)) > target_len) {
        throw std::runtime_error("BIGNUM too large for target padding length");
    }
    std::vector<unsigned char> bytes(target_len);
    if (BN_bn2lebinpad(bn_, bytes.data(), static_cast<int>(target_len)) < 0) {
        throw std::runtime_error("Failed to convert BIGNUM to LE bytes: " + get_openssl_error());
    }
    return bytes;
}

BigNum BigNum::random_below(const BigNum& bound) {
    BigNum result;
    if (!BN_priv_rand_range(result.bn_, bound.bn_)) {
        throw std::runtime_error("BN_priv_rand_range failed: " + get_openssl_error());
    }
    return result;
}

BigNum BigNum::operator+(const BigNum& rhs) const {
    BigNum result;
    if (!BN_add(result.bn_, bn_, rhs.bn_)) {
        throw std::runtime_error("BN_add failed: " + get_openssl_error());
    }
    return result;
}

BigNum BigNum::operator-(const BigNum& rhs) const {
    BigNum result;
    if (!BN_sub(result.bn_, bn_, rhs.bn_)) {
        throw std::runtime_error("BN_sub failed: " + get_openssl_error());
    }
    return result;
}

// Modulo needs a context; result is non-negative
BigNum BigNum::operator%(const BigNum& rhs) const {
    BnCtx ctx;
    BigNum result;
    if (!BN_nnmod(result.bn_, bn_, rhs.bn_, ctx.get())) {
        throw std::runtime_error("BN_nnmod failed: " + get_openssl_error());
    }
    return result;
}

BigNum BigNum::mod_add(const BigNum& rhs, const BigNum& modulus, BnCtx& ctx) const {
    BigNum result;
    if (!BN_mod_add(result.bn_, bn_, rhs.bn_, modulus.bn_, ctx.get())) {
        throw std::runtime_error("BN_mod_add failed: " + get_openssl_error());
    }
    return result;
}

BigNum BigNum::mod_sub(const BigNum& rhs, const BigNum& modulus, BnCtx& ctx) const {
    BigNum result;
    if (!BN_mod_sub(result.bn_, bn_, rhs.bn_, modulus.bn_, ctx.get())) {
        throw std::runtime_error("BN_mod_sub failed: " + get_openssl_error());
    }
    return result;
}

BigNum BigNum::mod_mul(const BigNum& rhs, const BigNum& modulus, BnCtx& ctx) const {
    BigNum result;
    if (!BN_mod_mul(result.bn_, bn_, rhs.bn_, modulus.bn_, ctx.get())) {
        throw std::runtime_error("BN_mod_mul failed: " + get_openssl_error());
    }
    return result;
}

BigNum BigNum::mod_exp(const BigNum& exponent, const BigNum& modulus, BnCtx& ctx, ModAccel* accel) const {
    BigNum result;
    BN_MONT_CTX* mont_ctx = accel ? accel->get() : nullptr;

    // Secret exponents go through the constant-time path
    BN_set_flags(exponent.bn_, BN_FLG_CONSTTIME);
    if (mont_ctx) {
        if (!BN_mod_exp_mont(result.bn_, bn_, exponent.bn_, modulus.bn_, ctx.get(), mont_ctx)) {
            throw std::runtime_error("BN_mod_exp_mont failed: " + get_openssl_error());
        }
    } else {
        if (!BN_mod_exp(result.bn_, bn_, exponent.bn_, modulus.bn_, ctx.get())) {
            throw std::runtime_error("BN_mod_exp failed: " + get_openssl_error());
        }
    }
    return result;
}

BigNum BigNum::shifted_right(int bits) const {
    BigNum result;
    if (!BN_rshift(result.bn_, bn_, bits)) {
        throw std::runtime_error("BN_rshift failed: " + get_openssl_error());
    }
    return result;
}

bool BigNum::is_probable_prime(BnCtx& ctx) const {
    int ret = BN_check_prime(bn_, ctx.get(), nullptr);
    if (ret < 0) {
        throw std::runtime_error("BN_check_prime failed: " + get_openssl_error());
    }
    return ret == 1;
}

std::strong_ordering BigNum::operator<=>(unsigned int rhs) const {
    return BN_cmp(bn_, BigNum(rhs).get()) <=> 0;
}

bool BigNum::operator==(unsigned int rhs) const {
    return BN_is_word(bn_, static_cast<BN_ULONG>(rhs)) && !BN_is_negative(bn_);
}

std::string BigNum::to_hex() const {
    char* hex = BN_bn2hex(bn_);
    if (!hex) return "<hex conversion failed>";
    std::string result(hex);
    OPENSSL_free(hex);
    return result;
}

ModAccel::ModAccel(const BigNum& modulus, BnCtx& bn_ctx) : mont_ctx_(BN_MONT_CTX_new()) {
    if (!mont_ctx_) {
        throw std::runtime_error("BN_MONT_CTX_new failed: " + get_openssl_error());
    }
    if (!BN_MONT_CTX_set(mont_ctx_.get(), modulus.get(), bn_ctx.get())) {
        throw std::runtime_error("BN_MONT_CTX_set failed: " + get_openssl_error());
    }
    LOG_VERBOSE("Montgomery context ready for {}-bit modulus", modulus.num_bits());
}

} // namespace MailAuth
