#ifndef MAILAUTH_UTILS_HPP
#define MAILAUTH_UTILS_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace MailAuth {

using Bytes = std::vector<uint8_t>;

namespace Utils {

// Standard alphabet with padding, as used by every base64 field of the API.
std::string base64_encode(std::span<const uint8_t> data);
// Line breaks are ignored; anything else outside the alphabet is rejected.
std::optional<Bytes> base64_decode(std::string_view text);

// bcrypt's radix-64 ("./A-Za-z0-9"), unpadded.
std::string bcrypt_base64_encode(std::span<const uint8_t> data);

// Zero the buffer with a write the optimizer cannot drop, then empty it.
void secure_wipe(std::string& str) noexcept;
void secure_wipe(Bytes& bytes) noexcept;

// Wipes the referenced buffer when the scope ends, whatever the exit path.
template <typename Buffer>
class ScopedWipe {
public:
    explicit ScopedWipe(Buffer& buffer) : buffer_(buffer) {}
    ~ScopedWipe() { secure_wipe(buffer_); }
    ScopedWipe(const ScopedWipe&) = delete;
    ScopedWipe& operator=(const ScopedWipe&) = delete;

private:
    Buffer& buffer_;
};

} // namespace Utils
} // namespace MailAuth

#endif // MAILAUTH_UTILS_HPP
