#ifndef MAILAUTH_AUTH_ERROR_HPP
#define MAILAUTH_AUTH_ERROR_HPP

#include <string>
#include <type_traits>

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

namespace MailAuth {

// Failure reasons of an authentication attempt or unlock.
enum class AuthErrc {
    Success = 0,
    TransportError,
    ApiError,
    InvalidModulus,
    InvalidServerEphemeral,
    UnsupportedAuthVersion,
    ServerProofMismatch,
    InvalidKeySalt,
    MalformedKeyRing,
    DecryptionFailed,
    InvalidState
};

const boost::system::error_category& auth_category() noexcept;

inline boost::system::error_code make_error_code(AuthErrc e) noexcept {
    return {static_cast<int>(e), auth_category()};
}

// Protocol-integrity violations: the server (or something in between) sent
// values that no honest server produces.
inline bool is_integrity_violation(AuthErrc e) noexcept {
    return e == AuthErrc::InvalidModulus || e == AuthErrc::InvalidServerEphemeral;
}

// Local key unlock failures. The session credentials are still good, so
// unlock may be retried with another password.
inline bool is_unlock_failure(AuthErrc e) noexcept {
    return e == AuthErrc::InvalidKeySalt || e == AuthErrc::MalformedKeyRing ||
           e == AuthErrc::DecryptionFailed;
}

class AuthError : public boost::system::system_error {
public:
    AuthError(AuthErrc errc, const std::string& what)
        : boost::system::system_error(make_error_code(errc), what), errc_(errc) {}

    AuthErrc errc() const noexcept { return errc_; }

private:
    AuthErrc errc_;
};

const char* to_string(AuthErrc e) noexcept;

} // namespace MailAuth

namespace boost::system {
template <>
struct is_error_code_enum<MailAuth::AuthErrc> : std::true_type {};
} // namespace boost::system

#endif // MAILAUTH_AUTH_ERROR_HPP
