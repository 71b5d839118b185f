#include "mcpguard/base64.hpp"

#include <cstdint>

namespace mcpguard::base64 {

namespace {

constexpr char kChars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int value_of(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

} // anonymous namespace

std::string encode(std::string_view data) {
    std::string result;
    result.reserve(4 * ((data.size() + 2) / 3));

    for (size_t i = 0; i < data.size(); i += 3) {
        uint32_t n = static_cast<uint32_t>(static_cast<uint8_t>(data[i])) << 16;
        if (i + 1 < data.size()) n |= static_cast<uint32_t>(static_cast<uint8_t>(data[i + 1])) << 8;
        if (i + 2 < data.size()) n |= static_cast<uint32_t>(static_cast<uint8_t>(data[i + 2]));

        result += kChars[(n >> 18) & 0x3F];
        result += kChars[(n >> 12) & 0x3F];
        result += (i + 1 < data.size()) ? kChars[(n >> 6) & 0x3F] : '=';
        result += (i + 2 < data.size()) ? kChars[n & 0x3F] : '=';
    }
    return result;
}

std::optional<std::string> decode(std::string_view encoded) {
    std::string result;
    result.reserve(3 * encoded.size() / 4);

    uint32_t buf = 0;
    int bits = 0;
    bool padding = false;
    for (const char c : encoded) {
        if (c == '\n' || c == '\r') continue;
        if (c == '=') {
            padding = true;
            continue;
        }
        int val = value_of(c);
        if (val < 0 || padding) return std::nullopt;

        buf = (buf << 6) | static_cast<uint32_t>(val);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<char>((buf >> bits) & 0xFF));
        }
    }
    return result;
}

} // namespace mcpguard::base64
