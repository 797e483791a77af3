#include "AuthError.hpp"

namespace MailAuth {

namespace {

class AuthCategory : public boost::system::error_category {
public:
    const char* name() const noexcept override { return "mailauth"; }

    std::string message(int ev) const override {
        return to_string(static_cast<AuthErrc>(ev));
    }
};

} // namespace

const boost::system::error_category& auth_category() noexcept {
    static const AuthCategory category;
    return category;
}

const char* to_string(AuthErrc e) noexcept {
    switch (e) {
        case AuthErrc::Success: return "success";
        case AuthErrc::TransportError: return "transport error";
        case AuthErrc::ApiError: return "API error";
        case AuthErrc::InvalidModulus: return "invalid SRP modulus";
        case AuthErrc::InvalidServerEphemeral: return "invalid SRP server ephemeral";
        case AuthErrc::UnsupportedAuthVersion: return "unsupported auth version";
        case AuthErrc::ServerProofMismatch: return "invalid server proof";
        case AuthErrc::InvalidKeySalt: return "invalid key salt";
        case AuthErrc::MalformedKeyRing: return "malformed key ring";
        case AuthErrc::DecryptionFailed: return "private key decryption failed";
        case AuthErrc::InvalidState: return "operation not allowed in current state";
    }
    return "unknown error";
}

} // namespace MailAuth
