#include "utils/logging.hpp"

#include <iostream>
#include <mutex>

namespace scalebox::utils {
namespace {

std::mutex& LogMutex() {
    static std::mutex mutex;
    return mutex;
}

LogConfig& CurrentConfig() {
    static LogConfig config{};
    return config;
}

}  // namespace

void SetLogConfig(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(LogMutex());
    CurrentConfig() = config;
}

LogConfig GetLogConfig() {
    std::lock_guard<std::mutex> lock(LogMutex());
    return CurrentConfig();
}

void Log(LogLevel level, const std::string& tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(LogMutex());
    if (static_cast<int>(level) < static_cast<int>(CurrentConfig().min_level)) {
        return;
    }
    std::cerr << "[" << tag << "] ";
    if (level != LogLevel::kInfo) {
        std::cerr << ToString(level) << " ";
    }
    std::cerr << message << std::endl;
}

}  // namespace scalebox::utils
