#include "ClientConfig.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace MailAuth {

namespace {

LogLevel parse_level_or_throw(const std::string& name) {
  auto level = Logger::parseLevel(name);
  if (!level) throw std::invalid_argument("unknown log level: " + name);
  return *level;
}

std::chrono::seconds parse_timeout(const std::string& text) {
  size_t used = 0;
  long long seconds = 0;
  try {
    seconds = std::stoll(text, &used);
  } catch (const std::exception&) {
    throw std::invalid_argument("timeout is not a number: " + text);
  }
  if (used != text.size() || seconds <= 0) {
    throw std::invalid_argument("timeout must be a positive number of seconds: " + text);
  }
  return std::chrono::seconds(seconds);
}

const char* env(const char* name) {
  const char* value = std::getenv(name);
  return (value && *value) ? value : nullptr;
}

} // namespace

ClientConfig ClientConfig::from_environment() {
  ClientConfig config;
  if (const char* v = env("MAILAUTH_API_URL")) config.api_url = v;
  if (const char* v = env("MAILAUTH_CLIENT_ID")) config.client_id = v;
  if (const char* v = env("MAILAUTH_CLIENT_SECRET")) config.client_secret = v;
  if (const char* v = env("MAILAUTH_APP_VERSION")) config.app_version = v;
  if (const char* v = env("MAILAUTH_LOG_LEVEL")) config.log_level = parse_level_or_throw(v);
  if (const char* v = env("MAILAUTH_TIMEOUT")) config.timeout = parse_timeout(v);
  return config;
}

ClientConfig ClientConfig::from_file(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("cannot open config file " + path);
  }

  nlohmann::json j;
  try {
    file >> j;
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("cannot parse config file " + path + ": " + e.what());
  }
  if (!j.is_object()) {
    throw std::runtime_error("config file " + path + " is not a JSON object");
  }

  ClientConfig config;
  try {
    config.api_url = j.value("api_url", config.api_url);
    config.client_id = j.value("client_id", config.client_id);
    config.client_secret = j.value("client_secret", config.client_secret);
    config.app_version = j.value("app_version", config.app_version);
    if (j.contains("timeout")) {
      long long seconds = j["timeout"].get<long long>();
      if (seconds <= 0) throw std::invalid_argument("timeout must be positive");
      config.timeout = std::chrono::seconds(seconds);
    }
    if (j.contains("log_level")) {
      config.log_level = parse_level_or_throw(j["log_level"].get<std::string>());
    }
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("invalid value in config file " + path + ": " + e.what());
  }
  return config;
}

void ClientConfig::apply_log_level() const {
  Logger::getInstance().setLevel(log_level);
}

} // namespace MailAuth
