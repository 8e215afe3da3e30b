#include "utils/common.hpp"

#include <stdexcept>

namespace scalebox::utils {
namespace {

int DecodeChar(unsigned char c) {
    if (c >= 'A' && c <= 'Z') {
        return c - 'A';
    }
    if (c >= 'a' && c <= 'z') {
        return c - 'a' + 26;
    }
    if (c >= '0' && c <= '9') {
        return c - '0' + 52;
    }
    if (c == '+' || c == '-') {
        return 62;
    }
    if (c == '/' || c == '_') {
        return 63;
    }
    return -1;
}

}  // namespace

std::string Base64Encode(const std::string& data) {
    static const char table[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string encoded;
    encoded.reserve(((data.size() + 2) / 3) * 4);
    std::size_t i = 0;
    while (i < data.size()) {
        const std::size_t start = i;
        const unsigned int octet_a = i < data.size() ? static_cast<unsigned char>(data[i++]) : 0;
        const unsigned int octet_b = i < data.size() ? static_cast<unsigned char>(data[i++]) : 0;
        const unsigned int octet_c = i < data.size() ? static_cast<unsigned char>(data[i++]) : 0;

        const unsigned int triple = (octet_a << 16) + (octet_b << 8) + octet_c;
        encoded.push_back(table[(triple >> 18) & 0x3F]);
        encoded.push_back(table[(triple >> 12) & 0x3F]);
        encoded.push_back(start + 1 < data.size() ? table[(triple >> 6) & 0x3F] : '=');
        encoded.push_back(start + 2 < data.size() ? table[triple & 0x3F] : '=');
    }
    return encoded;
}

std::string Base64Decode(const std::string& encoded) {
    std::string decoded;
    decoded.reserve((encoded.size() / 4) * 3);
    unsigned int buffer = 0;
    int bits = 0;
    for (const unsigned char c : encoded) {
        if (c == '=') {
            break;
        }
        if (std::isspace(c)) {
            continue;
        }
        const int value = DecodeChar(c);
        if (value < 0) {
            throw std::invalid_argument("invalid base64 character");
        }
        buffer = (buffer << 6) | static_cast<unsigned int>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            decoded.push_back(static_cast<char>((buffer >> bits) & 0xFF));
        }
    }
    return decoded;
}

}  // namespace scalebox::utils
