// src/base64.hpp
// Standard-alphabet Base64 (RFC 4648), padded, no line wrapping.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace atlantis {
namespace base64 {

static constexpr const char* ALPHABET =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

inline std::string encode(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(((len + 2) / 3) * 4);

    size_t i = 0;
    while (i + 3 <= len) {
        uint32_t n = (static_cast<uint32_t>(data[i]) << 16)
                   | (static_cast<uint32_t>(data[i + 1]) << 8)
                   | static_cast<uint32_t>(data[i + 2]);
        out.push_back(ALPHABET[(n >> 18) & 0x3F]);
        out.push_back(ALPHABET[(n >> 12) & 0x3F]);
        out.push_back(ALPHABET[(n >> 6) & 0x3F]);
        out.push_back(ALPHABET[n & 0x3F]);
        i += 3;
    }

    size_t rest = len - i;
    if (rest == 1) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        out.push_back(ALPHABET[(n >> 18) & 0x3F]);
        out.push_back(ALPHABET[(n >> 12) & 0x3F]);
        out.push_back('=');
        out.push_back('=');
    } else if (rest == 2) {
        uint32_t n = (static_cast<uint32_t>(data[i]) << 16)
                   | (static_cast<uint32_t>(data[i + 1]) << 8);
        out.push_back(ALPHABET[(n >> 18) & 0x3F]);
        out.push_back(ALPHABET[(n >> 12) & 0x3F]);
        out.push_back(ALPHABET[(n >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

inline std::string encode(const std::vector<uint8_t>& data) {
    return encode(data.data(), data.size());
}

inline std::string encode(const std::string& data) {
    return encode(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

// Returns nullopt on characters outside the alphabet or bad padding.
inline std::optional<std::vector<uint8_t>> decode(const std::string& encoded) {
    auto sextet = [](char c) -> int {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '+') return 62;
        if (c == '/') return 63;
        return -1;
    };

    if (encoded.size() % 4 != 0) return std::nullopt;

    std::vector<uint8_t> out;
    out.reserve(encoded.size() / 4 * 3);

    for (size_t i = 0; i < encoded.size(); i += 4) {
        bool last = i + 4 == encoded.size();
        int a = sextet(encoded[i]);
        int b = sextet(encoded[i + 1]);
        if (a < 0 || b < 0) return std::nullopt;

        char c3 = encoded[i + 2];
        char c4 = encoded[i + 3];
        if (last && c3 == '=' && c4 == '=') {
            out.push_back(static_cast<uint8_t>((a << 2) | (b >> 4)));
            break;
        }
        int c = sextet(c3);
        if (c < 0) return std::nullopt;
        if (last && c4 == '=') {
            out.push_back(static_cast<uint8_t>((a << 2) | (b >> 4)));
            out.push_back(static_cast<uint8_t>(((b & 0x0F) << 4) | (c >> 2)));
            break;
        }
        int d = sextet(c4);
        if (d < 0) return std::nullopt;

        out.push_back(static_cast<uint8_t>((a << 2) | (b >> 4)));
        out.push_back(static_cast<uint8_t>(((b & 0x0F) << 4) | (c >> 2)));
        out.push_back(static_cast<uint8_t>(((c & 0x03) << 6) | d));
    }
    return out;
}

} // namespace base64
} // namespace atlantis
