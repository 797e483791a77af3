#pragma once

#include <memory>
#include <mutex>
#include <string>
#include "AuthTypes.hpp"
#include "KeyUnlock.hpp"

namespace MailAuth {

// Process-side state of one logged-in user. Written once per successful
// unlock; readable from any thread.
class Session {
public:
    Session() = default;
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    ~Session();

    // Replaces whatever the session held before.
    void commit(const SessionCredentials& credentials, UnlockedIdentity identity);
    void clear();

    bool is_unlocked() const;
    std::string user_id() const;
    std::string access_token() const;
    std::shared_ptr<KeyRing> key_ring() const;

private:
    mutable std::mutex mutex_;
    std::string user_id_;
    std::string access_token_;
    std::shared_ptr<KeyRing> key_ring_;
};

} // namespace MailAuth
