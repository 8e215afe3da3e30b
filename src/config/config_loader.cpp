#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

#include "errors/errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace scalebox::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
#if defined(_WIN32)
    if (!home) {
        home = std::getenv("USERPROFILE");
    }
#endif
    return std::filesystem::path(home ? home : ".");
}

void ApplyString(std::string& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ApplyInt(int& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

bool ParseBool(const std::string& value) {
    const auto lowered = utils::ToLower(value);
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        utils::LogWarn("config", "ignoring non-numeric value: " + value);
        return fallback;
    }
}

void ResolveTokenAliases(ConnectionConfig& connection) {
    if (connection.access_token.empty()) {
        connection.access_token = connection.envd_access_token;
    }
    if (connection.envd_access_token.empty()) {
        connection.envd_access_token = connection.access_token;
    }
}

}  // namespace

std::filesystem::path GetConfigPath() {
    return GetHomePath() / ".scalebox" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    auto& connection = config.connection;
    ApplyString(connection.api_key, data, "apiKey");
    ApplyString(connection.access_token, data, "accessToken");
    ApplyString(connection.envd_access_token, data, "envdAccessToken");
    ApplyString(connection.api_url, data, "apiUrl");
    ApplyInt(connection.request_timeout_ms, data, "requestTimeoutMs");
    if (data.contains("debug") && data["debug"].is_boolean()) {
        connection.debug = data["debug"].get<bool>();
    }
    if (data.contains("headers") && data["headers"].is_object()) {
        for (const auto& item : data["headers"].items()) {
            if (item.value().is_string()) {
                connection.headers[item.key()] = item.value().get<std::string>();
            }
        }
    }

    if (data.contains("polling") && data["polling"].is_object()) {
        const auto& polling = data["polling"];
        ApplyInt(config.polling.interval_ms, polling, "intervalMs");
        ApplyInt(config.polling.timeout_ms, polling, "timeoutMs");
    }
}

Config LoadConfig() {
    Config config{};

    const auto config_path = GetConfigPath();
    if (std::filesystem::exists(config_path)) {
        try {
            std::ifstream input(config_path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            utils::LogWarn("config", "keeping defaults, cannot parse " + config_path.string() + ": " + ex.what());
        }
    }

    auto& connection = config.connection;

    const auto api_key = GetEnv("SCALEBOX_API_KEY");
    if (!api_key.empty()) {
        connection.api_key = api_key;
    }

    const auto access_token = GetEnv("SCALEBOX_ACCESS_TOKEN");
    if (!access_token.empty()) {
        connection.access_token = access_token;
    }

    const auto envd_access_token = GetEnv("SCALEBOX_ENVD_ACCESS_TOKEN");
    if (!envd_access_token.empty()) {
        connection.envd_access_token = envd_access_token;
    }

    const auto api_url = GetEnv("SCALEBOX_API_URL");
    if (!api_url.empty()) {
        connection.api_url = api_url;
    }

    const auto request_timeout = GetEnv("SCALEBOX_REQUEST_TIMEOUT_MS");
    if (!request_timeout.empty()) {
        connection.request_timeout_ms = ParseInt(request_timeout, connection.request_timeout_ms);
    }

    const auto debug = GetEnv("SCALEBOX_DEBUG");
    if (!debug.empty()) {
        connection.debug = ParseBool(debug);
    }

    ResolveTokenAliases(connection);

    if (connection.debug) {
        utils::SetLogConfig(utils::LogConfig{.min_level = utils::LogLevel::kDebug});
        utils::LogDebug("config", "loaded api_url=" + connection.api_url +
            " has_api_key=" + (connection.api_key.empty() ? "false" : "true") +
            " has_access_token=" + (connection.access_token.empty() ? "false" : "true"));
    }

    return config;
}

void ValidateConnectionConfig(const ConnectionConfig& config) {
    if (config.api_key.empty() && config.access_token.empty() && config.envd_access_token.empty()) {
        throw errors::InvalidArgumentError(
            "Either apiKey, accessToken, or envdAccessToken must be provided",
            "missing_credentials");
    }
    if (config.request_timeout_ms <= 0) {
        throw errors::InvalidArgumentError("requestTimeoutMs must be positive", "invalid_timeout");
    }
}

}  // namespace scalebox::config
