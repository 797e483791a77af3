#include "AuthUtils.hpp"
#include <algorithm>
#include <array>
#include <openssl/evp.h>
#include <sodium/utils.h>

namespace MailAuth {
namespace Utils {

namespace {
constexpr std::string_view kStandardAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr std::string_view kBcryptAlphabet =
    "./ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
} // namespace

std::string base64_encode(std::span<const uint8_t> data) {
    if (data.empty()) return {};
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  data.data(), static_cast<int>(data.size()));
    out.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return out;
}

std::optional<Bytes> base64_decode(std::string_view text) {
    std::string compact;
    compact.reserve(text.size());
    for (char c : text) {
        if (c == '\r' || c == '\n') continue;
        compact.push_back(c);
    }
    if (compact.empty()) return Bytes{};
    if (compact.size() % 4 != 0) return std::nullopt;

    size_t padding = 0;
    if (compact.back() == '=') ++padding;
    if (compact.size() > 1 && compact[compact.size() - 2] == '=') ++padding;

    Bytes out(3 * (compact.size() / 4));
    int decoded = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(compact.data()),
                                  static_cast<int>(compact.size()));
    if (decoded < 0 || static_cast<size_t>(decoded) < padding) {
        return std::nullopt;
    }
    out.resize(static_cast<size_t>(decoded) - padding);
    return out;
}

std::string bcrypt_base64_encode(std::span<const uint8_t> data) {
    std::string standard = base64_encode(data);
    while (!standard.empty() && standard.back() == '=') {
        standard.pop_back();
    }
    std::array<char, 256> table{};
    for (size_t i = 0; i < kStandardAlphabet.size(); ++i) {
        table[static_cast<uint8_t>(kStandardAlphabet[i])] = kBcryptAlphabet[i];
    }
    std::transform(standard.begin(), standard.end(), standard.begin(),
                   [&table](char c) { return table[static_cast<uint8_t>(c)]; });
    return standard;
}

void secure_wipe(std::string& str) noexcept {
    if (!str.empty()) sodium_memzero(str.data(), str.size());
    str.clear();
}

void secure_wipe(Bytes& bytes) noexcept {
    if (!bytes.empty()) sodium_memzero(bytes.data(), bytes.size());
    bytes.clear();
}

} // namespace Utils
} // namespace MailAuth
