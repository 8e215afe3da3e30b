#include <catch2/catch.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

#include "config/config_loader.hpp"
#include "errors/errors.hpp"
#include "utils/logging.hpp"

using namespace scalebox::config;

namespace {

// Points HOME at a scratch directory and clears SCALEBOX_* for one test.
class ScopedEnvironment {
public:
    ScopedEnvironment() {
        home_ = std::filesystem::temp_directory_path() / ("scalebox_config_test_" + std::to_string(::getpid()));
        std::filesystem::create_directories(home_ / ".scalebox");
        if (const char* home = std::getenv("HOME")) {
            saved_home_ = home;
        }
        ::setenv("HOME", home_.c_str(), 1);
        for (const char* name : kVariables) {
            ::unsetenv(name);
        }
    }

    ~ScopedEnvironment() {
        for (const char* name : kVariables) {
            ::unsetenv(name);
        }
        if (saved_home_.empty()) {
            ::unsetenv("HOME");
        } else {
            ::setenv("HOME", saved_home_.c_str(), 1);
        }
        std::error_code ec;
        std::filesystem::remove_all(home_, ec);
        scalebox::utils::SetLogConfig(scalebox::utils::LogConfig{});
    }

    void WriteConfig(const std::string& content) {
        std::ofstream out(home_ / ".scalebox" / "config.json");
        out << content;
    }

private:
    static constexpr const char* kVariables[] = {
        "SCALEBOX_API_KEY",
        "SCALEBOX_ACCESS_TOKEN",
        "SCALEBOX_ENVD_ACCESS_TOKEN",
        "SCALEBOX_API_URL",
        "SCALEBOX_REQUEST_TIMEOUT_MS",
        "SCALEBOX_DEBUG"
    };

    std::filesystem::path home_;
    std::string saved_home_;
};

}  // namespace

TEST_CASE("LoadConfig falls back to defaults", "[config]") {
    ScopedEnvironment env;
    const auto config = LoadConfig();
    CHECK(config.connection.api_url == "https://api.scalebox.dev");
    CHECK(config.connection.request_timeout_ms == 30000);
    CHECK(config.polling.interval_ms == 1000);
    CHECK(config.polling.timeout_ms == 300000);
    CHECK_FALSE(config.connection.debug);
    CHECK_THROWS_WITH(ValidateConnectionConfig(config.connection),
                      "Either apiKey, accessToken, or envdAccessToken must be provided");
}

TEST_CASE("LoadConfig reads the config file then the environment", "[config]") {
    ScopedEnvironment env;
    env.WriteConfig(R"({
        "apiKey": "file-key",
        "apiUrl": "https://file.example",
        "requestTimeoutMs": 1000,
        "headers": {"X-Team": "core"},
        "polling": {"intervalMs": 250}
    })");
    ::setenv("SCALEBOX_API_URL", "https://env.example", 1);
    ::setenv("SCALEBOX_ACCESS_TOKEN", "env-token", 1);

    const auto config = LoadConfig();
    CHECK(config.connection.api_key == "file-key");
    CHECK(config.connection.api_url == "https://env.example");
    CHECK(config.connection.request_timeout_ms == 1000);
    CHECK(config.connection.headers.at("X-Team") == "core");
    CHECK(config.polling.interval_ms == 250);
    CHECK(config.connection.access_token == "env-token");
    CHECK(config.connection.envd_access_token == "env-token");
    CHECK_NOTHROW(ValidateConnectionConfig(config.connection));
}

TEST_CASE("LoadConfig keeps defaults when the file is malformed", "[config]") {
    ScopedEnvironment env;
    env.WriteConfig("{ not json");
    ::setenv("SCALEBOX_REQUEST_TIMEOUT_MS", "abc", 1);

    const auto config = LoadConfig();
    CHECK(config.connection.api_url == "https://api.scalebox.dev");
    CHECK(config.connection.request_timeout_ms == 30000);
}

TEST_CASE("SCALEBOX_DEBUG lowers the log threshold", "[config]") {
    ScopedEnvironment env;
    ::setenv("SCALEBOX_DEBUG", "true", 1);
    const auto config = LoadConfig();
    CHECK(config.connection.debug);
    CHECK(scalebox::utils::GetLogConfig().min_level == scalebox::utils::LogLevel::kDebug);
}
