#pragma once

#include <chrono>
#include <string>
#include "logger.hpp"

namespace MailAuth {

struct ClientConfig {
    std::string api_url = "https://mail.proton.me/api";
    std::string client_id = "WebMail";
    std::string client_secret;
    std::string app_version = "Other";
    std::chrono::seconds timeout{30};
    LogLevel log_level = LogLevel::INFO;

    // Defaults overridden by MAILAUTH_API_URL, MAILAUTH_CLIENT_ID,
    // MAILAUTH_CLIENT_SECRET, MAILAUTH_APP_VERSION, MAILAUTH_LOG_LEVEL and
    // MAILAUTH_TIMEOUT (seconds). Invalid values throw std::invalid_argument.
    static ClientConfig from_environment();

    // JSON object with any of the keys "api_url", "client_id",
    // "client_secret", "app_version", "timeout", "log_level".
    // Throws std::runtime_error when the file cannot be read or parsed.
    static ClientConfig from_file(const std::string& path);

    void apply_log_level() const;
};

} // namespace MailAuth
