#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace llmfirewall::base64 {

namespace detail {

inline constexpr uint8_t kInvalid = 64;

inline constexpr uint8_t kTable[128] = {
    64,64,64,64,64,64,64,64,64,64,64,64,64,64,64,64,
    64,64,64,64,64,64,64,64,64,64,64,64,64,64,64,64,
    64,64,64,64,64,64,64,64,64,64,64,62,64,64,64,63,
    52,53,54,55,56,57,58,59,60,61,64,64,64,64,64,64,
    64, 0, 1, 2, 3, 4, 5, 6, 7, 8, 9,10,11,12,13,14,
    15,16,17,18,19,20,21,22,23,24,25,64,64,64,64,64,
    64,26,27,28,29,30,31,32,33,34,35,36,37,38,39,40,
    41,42,43,44,45,46,47,48,49,50,51,64,64,64,64,64
};

[[nodiscard]] inline uint8_t lookup(char c) {
    const auto uc = static_cast<unsigned char>(c);
    return uc < 128 ? kTable[uc] : kInvalid;
}

} // namespace detail

inline std::string encode(const uint8_t* data, size_t len) {
    static const char kChars[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string result;
    result.reserve(4 * ((len + 2) / 3));

    for (size_t i = 0; i < len; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < len) n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < len) n |= static_cast<uint32_t>(data[i + 2]);

        result += kChars[(n >> 18) & 0x3F];
        result += kChars[(n >> 12) & 0x3F];
        result += (i + 1 < len) ? kChars[(n >> 6) & 0x3F] : '=';
        result += (i + 2 < len) ? kChars[n & 0x3F] : '=';
    }
    return result;
}

inline std::string encode(std::string_view text) {
    return encode(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

/**
 * @brief Strict decode of padded standard base64.
 *
 * Rejects input whose length is not a multiple of 4, any character outside
 * the alphabet, and '=' anywhere except the last one or two positions.
 * @return Decoded bytes, or nullopt when the input is not valid base64
 */
[[nodiscard]] inline std::optional<std::string> try_decode(std::string_view encoded) {
    if (encoded.empty() || encoded.size() % 4 != 0) return std::nullopt;

    size_t padding = 0;
    if (encoded.back() == '=') {
        padding = (encoded[encoded.size() - 2] == '=') ? 2 : 1;
    }

    std::string result;
    result.reserve(3 * encoded.size() / 4);

    const size_t data_len = encoded.size() - padding;
    uint32_t buf = 0;
    int bits = 0;
    for (size_t i = 0; i < data_len; ++i) {
        const uint8_t val = detail::lookup(encoded[i]);
        if (val == detail::kInvalid) return std::nullopt;

        buf = (buf << 6) | val;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<char>((buf >> bits) & 0xFF));
        }
    }
    return result;
}

} // namespace llmfirewall::base64
