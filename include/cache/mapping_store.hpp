#pragma once

#include "cache/icache_backend.hpp"
#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace llmfirewall {

/**
 * @brief One original -> fake substitution recorded for a request.
 */
struct AnonymizationMapping {
    std::string original_value;
    std::string fake_value;
    EntityKind entity_type = EntityKind::UNKNOWN;
    std::chrono::system_clock::time_point created_at{};
};

/**
 * @brief Request-scoped anonymization mappings with expiry.
 *
 * Keys are "anon:<request_id>:<sha256(original)>" so raw values never appear
 * in the key space. Values are JSON {original, fake, type, created_at}.
 *
 * Writes go to the primary backend; when it throws, the mapping is written
 * to the local fallback instead and the request continues. Reads consult the
 * primary first and the fallback on a miss or a failure, so a mapping
 * written during an outage stays visible to later lookups in this process.
 */
class MappingStore {
public:
    struct Config {
        std::chrono::seconds ttl{3600};
    };

    /// fallback may be null (a default in-memory backend is created) or equal to primary.
    MappingStore(std::shared_ptr<ICacheBackend> primary,
                 std::shared_ptr<ICacheBackend> fallback,
                 Config config);

    [[nodiscard]] std::optional<AnonymizationMapping> lookup(
        const std::string& request_id, const std::string& original_value);

    /// A primary failure is absorbed by writing to the fallback.
    void store(const std::string& request_id, const AnonymizationMapping& mapping);

    [[nodiscard]] bool ping();

    [[nodiscard]] const char* backend_name() const { return primary_->name(); }

    [[nodiscard]] std::chrono::seconds ttl() const { return config_.ttl; }

    [[nodiscard]] static std::string make_key(std::string_view request_id,
                                              std::string_view original_value);

    [[nodiscard]] static std::string serialize(const AnonymizationMapping& mapping);

    /// nullopt when the payload is not a mapping document.
    [[nodiscard]] static std::optional<AnonymizationMapping> deserialize(std::string_view payload);

    struct Stats {
        uint64_t lookups;
        uint64_t hits;
        uint64_t stores;
        uint64_t backend_errors;
        uint64_t fallback_reads;
        uint64_t fallback_writes;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    [[nodiscard]] bool has_separate_fallback() const { return fallback_ != primary_; }

    std::shared_ptr<ICacheBackend> primary_;
    std::shared_ptr<ICacheBackend> fallback_;
    Config config_;

    std::atomic<uint64_t> lookups_{0};
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> stores_{0};
    std::atomic<uint64_t> backend_errors_{0};
    std::atomic<uint64_t> fallback_reads_{0};
    std::atomic<uint64_t> fallback_writes_{0};
};

} // namespace llmfirewall
