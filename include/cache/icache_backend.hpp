#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace llmfirewall {

/**
 * @brief Key/value store with per-key expiry used for anonymization mappings.
 *
 * Implementations can be in-process (single node) or networked (Redis).
 * Every set() is a single atomic key write with its own TTL.
 * Networked implementations throw CacheError when the store is unreachable
 * or a call exceeds its timeout.
 */
class ICacheBackend {
public:
    virtual ~ICacheBackend() = default;

    [[nodiscard]] virtual std::optional<std::string> get(const std::string& key) = 0;

    virtual void set(const std::string& key, const std::string& value,
                     std::chrono::seconds ttl) = 0;

    /// True when the store answers. Never throws.
    [[nodiscard]] virtual bool ping() = 0;

    [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace llmfirewall
