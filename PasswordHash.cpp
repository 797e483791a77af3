#include "PasswordHash.hpp"
#include <crypt.h>
#include <cstring>
#include <format>
#include <memory>
#include <sodium/utils.h>
#include "AuthError.hpp"
#include "SRP.hpp"
#include "logger.hpp"

namespace MailAuth {
namespace PasswordHash {

namespace {
// "$2y$10$" followed by the 22 salt characters
constexpr size_t kBcryptPrefixLength = 29;
constexpr std::string_view kSaltSuffix = "proton";

struct CryptDataDeleter {
    void operator()(crypt_data* data) const {
        sodium_memzero(data, sizeof(crypt_data));
        delete data;
    }
};
} // namespace

std::string bcrypt(std::string_view password, std::string_view salt22, int cost) {
    if (salt22.size() != 22) {
        throw std::invalid_argument("bcrypt salt must be 22 characters");
    }
    std::string setting = std::format("$2y${:02}${}", cost, salt22);
    std::string phrase(password);
    Utils::ScopedWipe<std::string> wipe_phrase(phrase);

    // crypt_data holds the phrase and intermediate state; wiped on every exit
    std::unique_ptr<crypt_data, CryptDataDeleter> data(new crypt_data);
    std::memset(data.get(), 0, sizeof(crypt_data));
    const char* hashed = crypt_rn(phrase.c_str(), setting.c_str(), data.get(), sizeof(crypt_data));
    if (!hashed || hashed[0] == '*') {
        throw std::runtime_error("bcrypt failed for setting " + setting);
    }
    return std::string(hashed);
}

Bytes hash_password(int auth_version, std::string_view password,
                    std::span<const uint8_t> salt, std::span<const uint8_t> modulus) {
    if (auth_version != 3 && auth_version != 4) {
        LOG_ERROR("Auth version {} is not supported", auth_version);
        throw AuthError(AuthErrc::UnsupportedAuthVersion,
                        std::format("auth version {} is not supported", auth_version));
    }

    Bytes salted(salt.begin(), salt.end());
    salted.insert(salted.end(), kSaltSuffix.begin(), kSaltSuffix.end());
    std::string encoded_salt = Utils::bcrypt_base64_encode(salted).substr(0, 22);

    std::string crypted = bcrypt(password, encoded_salt);
    Utils::ScopedWipe<std::string> wipe_crypted(crypted);

    Bytes input(crypted.begin(), crypted.end());
    Utils::ScopedWipe<Bytes> wipe_input(input);
    input.insert(input.end(), modulus.begin(), modulus.end());
    return expand_hash(input);
}

std::string compute_key_password(std::string_view password, std::span<const uint8_t> key_salt) {
    if (key_salt.size() != kKeySaltLength) {
        throw AuthError(AuthErrc::InvalidKeySalt,
                        std::format("key salt must be {} bytes, got {}", kKeySaltLength, key_salt.size()));
    }
    std::string encoded_salt = Utils::bcrypt_base64_encode(key_salt);
    std::string hashed = bcrypt(password, encoded_salt);
    std::string passphrase = hashed.substr(kBcryptPrefixLength);
    Utils::secure_wipe(hashed);
    return passphrase;
}

} // namespace PasswordHash
} // namespace MailAuth
