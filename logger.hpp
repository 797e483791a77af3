#ifndef MAILAUTH_LOGGER_HPP
#define MAILAUTH_LOGGER_HPP

#include <array>
#include <atomic>
#include <chrono>
#include <format>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include "formatters.hpp"

namespace MailAuth {

enum class LogLevel { VERBOSE = 0, DEBUG = 1, INFO = 2, WARNING = 3, ERROR = 4 };

// Records go to stderr. Secrets must never be passed as arguments.
class Logger {
  public:
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    // Hands records to a strand of ioc instead of writing them inline.
    void init(boost::asio::io_context& ioc) {
        if (m_log_strand) {
            log(LogLevel::WARNING, std::source_location::current(),
                "Logger already runs asynchronously, init ignored");
            return;
        }
        m_log_strand = std::make_unique<Strand>(ioc.get_executor());
        m_async.store(true);
        log(LogLevel::DEBUG, std::source_location::current(), "Asynchronous logging enabled");
    }

    // Back to inline output. Records already posted stay on the strand; call
    // before the io_context is destroyed.
    void detach() {
        m_async.store(false);
        m_log_strand.reset();
    }

    void setLevel(LogLevel level) { m_level.store(level); }
    LogLevel getLevel() const { return m_level.load(); }

    // Accepts the names printed in log records, plus "WARN". Case-sensitive.
    static std::optional<LogLevel> parseLevel(std::string_view name) {
        if (name == "WARN") return LogLevel::WARNING;
        for (size_t i = 0; i < kLevelNames.size(); ++i) {
            if (kLevelNames[i] == name) return static_cast<LogLevel>(i);
        }
        return std::nullopt;
    }

    template <typename... Args>
    void log(LogLevel level,
             std::source_location location = std::source_location::current(),
             std::format_string<Args...> fmt = "",
             Args&&... args) {
        if (level < m_level.load()) return;

        std::string record;
        try {
            record = compose(level, location, std::format(fmt, std::forward<Args>(args)...));
        } catch (const std::format_error& e) {
            record = compose(LogLevel::ERROR, location,
                             std::format("bad log format \"{}\": {}", fmt.get(), e.what()));
        }

        if (m_async.load()) {
            boost::asio::post(*m_log_strand, [record = std::move(record)]() {
                std::clog << record << '\n';
            });
            return;
        }
        std::lock_guard<std::mutex> lock(m_output_mutex);
        std::clog << record << '\n';
    }

  private:
    using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

    static constexpr std::array<std::string_view, 5> kLevelNames{
        "VERBOSE", "DEBUG", "INFO", "WARNING", "ERROR"};

    Logger() = default;

    static std::string compose(LogLevel level, const std::source_location& location,
                               const std::string& message) {
        auto index = static_cast<size_t>(level);
        std::string_view name = index < kLevelNames.size() ? kLevelNames[index] : "UNKNOWN";
        const char* separator = message.find('\n') == std::string::npos ? " " : "\n";
        return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}] [{}]{}{}",
                           std::chrono::system_clock::now(), name,
                           shortFunctionName(location.function_name()), separator, message);
    }

    // "MailAuth::Bytes MailAuth::SRPCommon::calculate_K(const BigNum&)" -> "SRPCommon::calculate_K"
    static std::string_view shortFunctionName(std::string_view signature) noexcept {
        std::string_view name = signature.substr(0, signature.find('('));
        if (auto space = name.rfind(' '); space != std::string_view::npos) {
            name.remove_prefix(space + 1);
        }
        auto last = name.rfind("::");
        if (last == std::string_view::npos || last == 0) return name;
        auto owner = name.rfind("::", last - 1);
        return owner == std::string_view::npos ? name : name.substr(owner + 2);
    }

    std::atomic<LogLevel> m_level{LogLevel::INFO};
    std::atomic<bool> m_async{false};
    std::unique_ptr<Strand> m_log_strand;
    std::mutex m_output_mutex;
};

} // namespace MailAuth

#define MAILAUTH_LOG_AT(level, fmt, ...)                                       \
    ::MailAuth::Logger::getInstance().log(level, std::source_location::current(), \
                                          fmt __VA_OPT__(, ) __VA_ARGS__)

#define LOG_VERBOSE(fmt, ...) MAILAUTH_LOG_AT(::MailAuth::LogLevel::VERBOSE, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_DEBUG(fmt, ...) MAILAUTH_LOG_AT(::MailAuth::LogLevel::DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_INFO(fmt, ...) MAILAUTH_LOG_AT(::MailAuth::LogLevel::INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_WARN(fmt, ...) MAILAUTH_LOG_AT(::MailAuth::LogLevel::WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_ERROR(fmt, ...) MAILAUTH_LOG_AT(::MailAuth::LogLevel::ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif // MAILAUTH_LOGGER_HPP
