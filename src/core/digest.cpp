#include "core/digest.hpp"

#include <openssl/sha.h>

#include <format>

namespace llmfirewall::digest {

std::string sha256_hex(std::string_view value) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(value.data()),
           value.size(), hash);

    std::string result;
    result.reserve(SHA256_DIGEST_LENGTH * 2);
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        result += std::format("{:02x}", hash[i]);
    }
    return result;
}

std::string sha256_prefix(std::string_view value, size_t n) {
    auto hex = sha256_hex(value);
    if (n < hex.size()) hex.resize(n);
    return hex;
}

} // namespace llmfirewall::digest
