#include "Session.hpp"
#include "AuthUtils.hpp"
#include "logger.hpp"

namespace MailAuth {

Session::~Session() {
  Utils::secure_wipe(access_token_);
}

void Session::commit(const SessionCredentials& credentials, UnlockedIdentity identity) {
  std::lock_guard<std::mutex> lock(mutex_);
  Utils::secure_wipe(access_token_);
  user_id_ = credentials.user_id;
  access_token_ = credentials.access_token;
  key_ring_ = std::move(identity.key_ring);
  LOG_DEBUG("Session committed for user {}", user_id_);
}

void Session::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  Utils::secure_wipe(access_token_);
  user_id_.clear();
  key_ring_.reset();
}

bool Session::is_unlocked() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return key_ring_ != nullptr;
}

std::string Session::user_id() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return user_id_;
}

std::string Session::access_token() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return access_token_;
}

std::shared_ptr<KeyRing> Session::key_ring() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return key_ring_;
}

} // namespace MailAuth
