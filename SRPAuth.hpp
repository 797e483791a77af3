#pragma once

#include <string_view>
#include "AuthTypes.hpp"
#include "AuthUtils.hpp"
#include "OpenPGP.hpp"
#include "SRP.hpp"

namespace MailAuth {

// Unwraps the clear-signed modulus, checks its signature and returns the
// decoded little-endian bytes. Any failure is AuthError(InvalidModulus).
Bytes read_signed_modulus(std::string_view signed_modulus, OpenPGPProvider& pgp);

// Runs the client side of the SRP handshake for the parameters of one
// /auth/info response. The result carries A and M1 for submission and the
// expected M2 for verify_server_proof.
ClientProof compute_proof(std::string_view password, const AuthInfo& info, OpenPGPProvider& pgp);

} // namespace MailAuth
