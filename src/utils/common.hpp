#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>
#include <string>
#include <vector>

namespace scalebox::utils {

// Visitor built from lambdas, one per variant alternative.
template <typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

inline std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

inline std::chrono::system_clock::time_point Now() {
    return std::chrono::system_clock::now();
}

inline long long NowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string Base64Encode(const std::string& data);

// Accepts standard and URL-safe alphabets, with or without padding.
// Throws std::invalid_argument on characters outside the alphabet.
std::string Base64Decode(const std::string& encoded);

}  // namespace scalebox::utils
