#include "AuthTypes.hpp"
#include "AuthUtils.hpp"

namespace MailAuth {

SessionCredentials::~SessionCredentials() {
    Utils::secure_wipe(access_token);
    Utils::secure_wipe(refresh_token);
}

} // namespace MailAuth
