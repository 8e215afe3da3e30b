#pragma once

#include <map>
#include <string>

namespace scalebox::config {

constexpr const char* kDefaultApiUrl = "https://api.scalebox.dev";
constexpr int kDefaultSandboxTimeoutMs = 300000;
constexpr int kDefaultRequestTimeoutMs = 30000;
constexpr int kDefaultCommandTimeoutMs = 60000;
constexpr int kKeepalivePingIntervalS = 50;
constexpr int kDefaultPollIntervalMs = 1000;

struct ConnectionConfig {
    std::string api_key;
    std::string access_token;
    std::string envd_access_token;
    std::string api_url = kDefaultApiUrl;
    int request_timeout_ms = kDefaultRequestTimeoutMs;
    bool debug = false;
    std::map<std::string, std::string> headers;
};

struct PollingConfig {
    int interval_ms = kDefaultPollIntervalMs;
    int timeout_ms = kDefaultSandboxTimeoutMs;
};

struct Config {
    ConnectionConfig connection;
    PollingConfig polling;
};

}  // namespace scalebox::config
