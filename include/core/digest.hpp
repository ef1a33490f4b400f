#pragma once

#include <string>
#include <string_view>

namespace llmfirewall::digest {

/// Lower-case hex SHA-256 of value (64 chars).
[[nodiscard]] std::string sha256_hex(std::string_view value);

/// First n hex chars of the SHA-256 of value (n <= 64).
[[nodiscard]] std::string sha256_prefix(std::string_view value, size_t n);

} // namespace llmfirewall::digest
