#pragma once

#include <memory>
#include <string_view>
#include "AuthTypes.hpp"
#include "OpenPGP.hpp"

namespace MailAuth {

// Decrypted key ring bound to the credentials it was unlocked with.
struct UnlockedIdentity {
    std::string user_id;
    std::shared_ptr<KeyRing> key_ring;
};

// Turns credentials + password into an unlocked key ring. Holds no state;
// committing the result to a Session is the caller's job.
class KeyUnlocker {
public:
    explicit KeyUnlocker(OpenPGPProvider& pgp) : pgp_(pgp) {}

    // Throws AuthError: InvalidKeySalt, MalformedKeyRing or DecryptionFailed.
    UnlockedIdentity unlock(const SessionCredentials& credentials, std::string_view password);

private:
    std::string derive_passphrase(const SessionCredentials& credentials, std::string_view password) const;

    OpenPGPProvider& pgp_;
};

} // namespace MailAuth
