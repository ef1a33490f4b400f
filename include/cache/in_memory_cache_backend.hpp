#pragma once

#include "cache/icache_backend.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace llmfirewall {

/**
 * @brief Sharded LRU map with per-entry expiry.
 *
 * One mutex per shard; readers never observe a partially written entry.
 * Expired entries are dropped lazily on access. A full shard evicts its
 * least recently used entry.
 */
class InMemoryCacheBackend : public ICacheBackend {
public:
    struct Config {
        size_t max_entries = 100000;
        size_t num_shards = 16;
    };

    InMemoryCacheBackend() : InMemoryCacheBackend(Config{}) {}
    explicit InMemoryCacheBackend(const Config& config);

    [[nodiscard]] std::optional<std::string> get(const std::string& key) override;

    void set(const std::string& key, const std::string& value,
             std::chrono::seconds ttl) override;

    [[nodiscard]] bool ping() override { return true; }

    [[nodiscard]] const char* name() const override { return "memory"; }

    struct Stats {
        uint64_t hits;
        uint64_t misses;
        uint64_t evictions;
        uint64_t expirations;
        size_t current_entries;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    struct CacheEntry {
        std::string key;
        std::string value;
        std::chrono::steady_clock::time_point expires_at;
    };

    class Shard {
    public:
        explicit Shard(size_t max_entries) : max_entries_(max_entries) {}

        std::optional<std::string> get(const std::string& key);
        void set(const std::string& key, std::string value,
                 std::chrono::steady_clock::time_point expires_at);
        size_t size() const;

        std::atomic<uint64_t> evictions{0};
        std::atomic<uint64_t> expirations{0};

    private:
        void evict_one();

        mutable std::mutex mutex_;
        size_t max_entries_;
        std::list<CacheEntry> lru_list_;
        std::unordered_map<std::string, std::list<CacheEntry>::iterator> map_;
    };

    size_t select_shard(const std::string& key) const;

    Config config_;
    std::vector<std::unique_ptr<Shard>> shards_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
};

} // namespace llmfirewall
