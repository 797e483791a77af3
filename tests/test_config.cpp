#include <catch2/catch.hpp>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <boost/asio/io_context.hpp>
#include "ClientConfig.hpp"
#include "formatters.hpp"
#include "logger.hpp"

using namespace MailAuth;

namespace {

struct ClogCapture {
    explicit ClogCapture(std::ostream& sink) : original(std::clog.rdbuf(sink.rdbuf())) {}
    ~ClogCapture() {
        Logger::getInstance().detach();
        std::clog.rdbuf(original);
    }
    std::streambuf* original;
};

struct ScopedEnv {
    std::string name;
    ScopedEnv(const char* n, const char* value) : name(n) { setenv(n, value, 1); }
    ~ScopedEnv() { unsetenv(name.c_str()); }
};

struct TempFile {
    std::string path;
    explicit TempFile(const std::string& content) {
        char name[] = "/tmp/mailauth-config-XXXXXX";
        int fd = mkstemp(name);
        REQUIRE(fd >= 0);
        path = name;
        std::FILE* f = fdopen(fd, "w");
        std::fputs(content.c_str(), f);
        std::fclose(f);
    }
    ~TempFile() { std::remove(path.c_str()); }
};

} // namespace

TEST_CASE("Config defaults and environment", "[config]") {

    SECTION("defaults") {
        ClientConfig config;
        REQUIRE(config.api_url == "https://mail.proton.me/api");
        REQUIRE(config.timeout == std::chrono::seconds(30));
        REQUIRE(config.log_level == LogLevel::INFO);
    }

    SECTION("environment overrides") {
        ScopedEnv url("MAILAUTH_API_URL", "http://localhost:8080");
        ScopedEnv id("MAILAUTH_CLIENT_ID", "test-client");
        ScopedEnv version("MAILAUTH_APP_VERSION", "Other@1.2.3");
        ScopedEnv level("MAILAUTH_LOG_LEVEL", "DEBUG");
        ScopedEnv timeout("MAILAUTH_TIMEOUT", "5");

        ClientConfig config = ClientConfig::from_environment();
        REQUIRE(config.api_url == "http://localhost:8080");
        REQUIRE(config.client_id == "test-client");
        REQUIRE(config.app_version == "Other@1.2.3");
        REQUIRE(config.log_level == LogLevel::DEBUG);
        REQUIRE(config.timeout == std::chrono::seconds(5));
        REQUIRE(config.client_secret.empty());
    }

    SECTION("bad values are reported") {
        {
            ScopedEnv level("MAILAUTH_LOG_LEVEL", "LOUD");
            REQUIRE_THROWS_AS(ClientConfig::from_environment(), std::invalid_argument);
        }
        {
            ScopedEnv timeout("MAILAUTH_TIMEOUT", "10s");
            REQUIRE_THROWS_AS(ClientConfig::from_environment(), std::invalid_argument);
        }
        {
            ScopedEnv timeout("MAILAUTH_TIMEOUT", "0");
            REQUIRE_THROWS_AS(ClientConfig::from_environment(), std::invalid_argument);
        }
    }
}

TEST_CASE("Config file", "[config]") {

    SECTION("keys override defaults") {
        TempFile file(R"({"api_url": "https://api.example", "client_secret": "s3",
                          "timeout": 12, "log_level": "ERROR"})");
        ClientConfig config = ClientConfig::from_file(file.path);
        REQUIRE(config.api_url == "https://api.example");
        REQUIRE(config.client_secret == "s3");
        REQUIRE(config.client_id == "WebMail");
        REQUIRE(config.timeout == std::chrono::seconds(12));
        REQUIRE(config.log_level == LogLevel::ERROR);
    }

    SECTION("unreadable, malformed and mistyped files") {
        REQUIRE_THROWS_AS(ClientConfig::from_file("/nonexistent/mailauth.json"), std::runtime_error);

        TempFile broken("{ not json");
        REQUIRE_THROWS_AS(ClientConfig::from_file(broken.path), std::runtime_error);

        TempFile wrong_type(R"({"timeout": "soon"})");
        REQUIRE_THROWS_AS(ClientConfig::from_file(wrong_type.path), std::runtime_error);

        TempFile not_object("[1, 2]");
        REQUIRE_THROWS_AS(ClientConfig::from_file(not_object.path), std::runtime_error);
    }
}

TEST_CASE("Logger levels", "[config][logging]") {
    REQUIRE(Logger::parseLevel("VERBOSE") == LogLevel::VERBOSE);
    REQUIRE(Logger::parseLevel("WARN") == LogLevel::WARNING);
    REQUIRE(Logger::parseLevel("WARNING") == LogLevel::WARNING);
    REQUIRE_FALSE(Logger::parseLevel("debug").has_value());

    LogLevel before = Logger::getInstance().getLevel();
    ClientConfig config;
    config.log_level = LogLevel::ERROR;
    config.apply_log_level();
    REQUIRE(Logger::getInstance().getLevel() == LogLevel::ERROR);
    Logger::getInstance().setLevel(before);
}

TEST_CASE("Logger hands records to the io_context after init", "[logging]") {
    boost::asio::io_context ioc;
    std::ostringstream captured;
    ClogCapture capture(captured);
    Logger& logger = Logger::getInstance();

    logger.init(ioc);
    LOG_ERROR("queued record {}", 7);
    REQUIRE(captured.str().empty());

    ioc.run();
    logger.detach();
    LOG_ERROR("inline record");

    std::string out = captured.str();
    REQUIRE(out.find("[ERROR]") != std::string::npos);
    REQUIRE(out.find("queued record 7") != std::string::npos);
    REQUIRE(out.find("inline record") > out.find("queued record 7"));
}

TEST_CASE("Byte vector formatting", "[logging]") {
    std::vector<uint8_t> data = {0xde, 0xad, 0xbe, 0xef};
    REQUIRE(std::format("{}", data) == "deadbeef");
    REQUIRE(std::format("{:L2}", data) == "dead... (2 bytes left)");
    REQUIRE(std::format("{}", std::vector<uint8_t>{}) == "[empty]");
    REQUIRE(std::format("{:4x}", std::vector<char>{'A', 'B'}) == "0000: 41 42        |AB|");
}
