#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <string_view>

namespace llmfirewall {

/**
 * @brief Synthesizes substitute values for detected entities.
 *
 * Fakes come from reserved ranges that never identify a real party:
 * RFC 2606 example domains, the fictional 555-01xx telephone block and the
 * RFC 5737 TEST-NET-1 network (192.0.2.0/24). Person and location
 * placeholders take their suffix from a SHA-256 of the original, so the same
 * value always yields the same placeholder. Card numbers, SSNs, API keys and
 * passwords are never faked, only redacted.
 *
 * Thread-safe.
 */
class FakeValueGenerator {
public:
    FakeValueGenerator();
    explicit FakeValueGenerator(uint64_t seed);

    [[nodiscard]] std::string generate(EntityKind kind, std::string_view original);

    /// "<TYPE_REDACTED>"
    [[nodiscard]] static std::string redaction_token(EntityKind kind);

    /// "<TYPE_ANONYMIZED>"
    [[nodiscard]] static std::string anonymized_token(EntityKind kind);

    [[nodiscard]] static std::string fake_email(std::string_view original);
    [[nodiscard]] static std::string hashed_placeholder(std::string_view prefix,
                                                        std::string_view original);

private:
    [[nodiscard]] std::string fake_phone(std::string_view original);
    [[nodiscard]] std::string fake_ip();
    [[nodiscard]] uint32_t random_between(uint32_t lo, uint32_t hi);

    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
};

} // namespace llmfirewall
