#pragma once

#include <span>
#include <string>
#include <string_view>
#include "AuthUtils.hpp"

namespace MailAuth {
namespace PasswordHash {

constexpr int kBcryptCost = 10;
constexpr size_t kKeySaltLength = 16;

// bcrypt with the "$2y$" prefix. `salt22` is the 22-character radix-64 salt.
// Returns the full 60-character modular crypt string.
std::string bcrypt(std::string_view password, std::string_view salt22, int cost = kBcryptCost);

// SRP private value x for the given auth version, little-endian, 256 bytes.
// Throws AuthError(UnsupportedAuthVersion) for versions this client does not speak.
Bytes hash_password(int auth_version, std::string_view password,
                    std::span<const uint8_t> salt, std::span<const uint8_t> modulus);

// Mailbox passphrase for single-password accounts: bcrypt output without
// the "$2y$10$<salt>" prefix. Throws AuthError(InvalidKeySalt) unless the
// salt is 16 bytes.
std::string compute_key_password(std::string_view password, std::span<const uint8_t> key_salt);

} // namespace PasswordHash
} // namespace MailAuth
