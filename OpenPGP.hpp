#ifndef MAILAUTH_OPENPGP_HPP
#define MAILAUTH_OPENPGP_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace MailAuth {

// Decrypted-in-place private key ring. Implementations wrap whatever
// OpenPGP library the application links; this library only drives them.
class KeyRing {
public:
    virtual ~KeyRing() = default;

    virtual size_t entry_count() const = 0;
    // Unlocks the private key of entry `index`. Returns false when the
    // passphrase is rejected.
    virtual bool decrypt_entry(size_t index, std::string_view passphrase) = 0;
};

class OpenPGPProvider {
public:
    virtual ~OpenPGPProvider() = default;

    // Returns nullptr when the text is not a parsable armored key ring.
    virtual std::unique_ptr<KeyRing> parse_armored_key_ring(std::string_view armored) = 0;

    // Checks `armored_signature` over `signed_text` against the service's
    // modulus signing key.
    virtual bool verify_detached_signature(std::string_view signed_text,
                                           std::string_view armored_signature) = 0;
};

// A "-----BEGIN PGP SIGNED MESSAGE-----" block split into its parts.
struct ClearSignedMessage {
    std::string hash_header;     // value of the "Hash:" armor header, may be empty
    std::string plaintext;       // dash-unescaped text, '\n' line endings
    std::string signed_text;     // canonical form the signature covers (CRLF, trailing blanks removed)
    std::string armored_signature;

    // std::nullopt when framing is broken or anything follows the signature block.
    static std::optional<ClearSignedMessage> parse(std::string_view text);
};

} // namespace MailAuth

#endif // MAILAUTH_OPENPGP_HPP
