#include "cache/in_memory_cache_backend.hpp"

#include <algorithm>
#include <functional>

namespace llmfirewall {

// ============================================================================
// InMemoryCacheBackend
// ============================================================================

InMemoryCacheBackend::InMemoryCacheBackend(const Config& config)
    : config_(config) {
    const size_t num_shards = std::max(config_.num_shards, size_t{1});
    const size_t per_shard = std::max(config_.max_entries / num_shards, size_t{1});
    shards_.reserve(num_shards);
    for (size_t i = 0; i < num_shards; ++i) {
        shards_.push_back(std::make_unique<Shard>(per_shard));
    }
}

size_t InMemoryCacheBackend::select_shard(const std::string& key) const {
    return std::hash<std::string>{}(key) % shards_.size();
}

std::optional<std::string> InMemoryCacheBackend::get(const std::string& key) {
    auto& shard = *shards_[select_shard(key)];
    auto result = shard.get(key);
    if (result) {
        hits_.fetch_add(1, std::memory_order_relaxed);
    } else {
        misses_.fetch_add(1, std::memory_order_relaxed);
    }
    return result;
}

void InMemoryCacheBackend::set(const std::string& key, const std::string& value,
                               std::chrono::seconds ttl) {
    const auto expires = std::chrono::steady_clock::now() + ttl;
    auto& shard = *shards_[select_shard(key)];
    shard.set(key, value, expires);
}

InMemoryCacheBackend::Stats InMemoryCacheBackend::get_stats() const {
    size_t entries = 0;
    uint64_t evictions = 0;
    uint64_t expirations = 0;
    for (const auto& shard : shards_) {
        entries += shard->size();
        evictions += shard->evictions.load(std::memory_order_relaxed);
        expirations += shard->expirations.load(std::memory_order_relaxed);
    }
    return {
        .hits = hits_.load(std::memory_order_relaxed),
        .misses = misses_.load(std::memory_order_relaxed),
        .evictions = evictions,
        .expirations = expirations,
        .current_entries = entries,
    };
}

// ============================================================================
// Shard
// ============================================================================

std::optional<std::string> InMemoryCacheBackend::Shard::get(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end()) return std::nullopt;

    if (std::chrono::steady_clock::now() >= it->second->expires_at) {
        lru_list_.erase(it->second);
        map_.erase(it);
        expirations.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    // Move to front (most recently used)
    lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
    return it->second->value;
}

void InMemoryCacheBackend::Shard::set(
    const std::string& key, std::string value,
    std::chrono::steady_clock::time_point expires_at) {
    std::lock_guard lock(mutex_);

    auto it = map_.find(key);
    if (it != map_.end()) {
        it->second->value = std::move(value);
        it->second->expires_at = expires_at;
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
        return;
    }

    while (map_.size() >= max_entries_ && !lru_list_.empty()) {
        evict_one();
    }

    lru_list_.emplace_front(CacheEntry{key, std::move(value), expires_at});
    map_[key] = lru_list_.begin();
}

void InMemoryCacheBackend::Shard::evict_one() {
    const bool expired = std::chrono::steady_clock::now() >= lru_list_.back().expires_at;
    map_.erase(lru_list_.back().key);
    lru_list_.pop_back();
    if (expired) {
        expirations.fetch_add(1, std::memory_order_relaxed);
    } else {
        evictions.fetch_add(1, std::memory_order_relaxed);
    }
}

size_t InMemoryCacheBackend::Shard::size() const {
    std::lock_guard lock(mutex_);
    return map_.size();
}

} // namespace llmfirewall
