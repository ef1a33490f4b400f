#include "cache/mapping_store.hpp"
#include "cache/in_memory_cache_backend.hpp"
#include "core/digest.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <stdexcept>

namespace llmfirewall {

using json = nlohmann::json;

MappingStore::MappingStore(std::shared_ptr<ICacheBackend> primary,
                           std::shared_ptr<ICacheBackend> fallback,
                           Config config)
    : primary_(std::move(primary))
    , fallback_(std::move(fallback))
    , config_(config) {
    if (!primary_) {
        throw std::invalid_argument("MappingStore requires a primary cache backend");
    }
    if (!fallback_) {
        fallback_ = std::make_shared<InMemoryCacheBackend>();
    }
}

std::string MappingStore::make_key(std::string_view request_id,
                                   std::string_view original_value) {
    return std::format("anon:{}:{}", request_id, digest::sha256_hex(original_value));
}

std::string MappingStore::serialize(const AnonymizationMapping& mapping) {
    const json doc = {
        {"original", mapping.original_value},
        {"fake", mapping.fake_value},
        {"type", entity_kind_to_string(mapping.entity_type)},
        {"created_at", std::chrono::duration_cast<std::chrono::seconds>(
            mapping.created_at.time_since_epoch()).count()},
    };
    return doc.dump();
}

std::optional<AnonymizationMapping> MappingStore::deserialize(std::string_view payload) {
    const auto doc = json::parse(payload, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object()) return std::nullopt;

    const auto original = doc.find("original");
    const auto fake = doc.find("fake");
    if (original == doc.end() || !original->is_string() ||
        fake == doc.end() || !fake->is_string()) {
        return std::nullopt;
    }

    AnonymizationMapping mapping;
    mapping.original_value = original->get<std::string>();
    mapping.fake_value = fake->get<std::string>();
    if (const auto type = doc.find("type"); type != doc.end() && type->is_string()) {
        mapping.entity_type = entity_kind_from_recognizer(type->get<std::string>());
    }
    if (const auto ts = doc.find("created_at"); ts != doc.end() && ts->is_number_integer()) {
        mapping.created_at = std::chrono::system_clock::time_point(
            std::chrono::seconds(ts->get<int64_t>()));
    }
    return mapping;
}

std::optional<AnonymizationMapping> MappingStore::lookup(
    const std::string& request_id, const std::string& original_value) {
    lookups_.fetch_add(1, std::memory_order_relaxed);
    const auto key = make_key(request_id, original_value);

    std::optional<std::string> payload;
    try {
        payload = primary_->get(key);
    } catch (const CacheError& e) {
        backend_errors_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Mapping lookup on {} backend failed, using local fallback: {}",
            primary_->name(), e.what()));
    }

    if (!payload && has_separate_fallback()) {
        payload = fallback_->get(key);
        if (payload) fallback_reads_.fetch_add(1, std::memory_order_relaxed);
    }
    if (!payload) return std::nullopt;

    auto mapping = deserialize(*payload);
    if (!mapping || mapping->original_value != original_value) {
        utils::log::warn(std::format("Discarding malformed mapping entry for request {}", request_id));
        return std::nullopt;
    }
    hits_.fetch_add(1, std::memory_order_relaxed);
    return mapping;
}

void MappingStore::store(const std::string& request_id, const AnonymizationMapping& mapping) {
    stores_.fetch_add(1, std::memory_order_relaxed);
    const auto key = make_key(request_id, mapping.original_value);
    const auto payload = serialize(mapping);

    try {
        primary_->set(key, payload, config_.ttl);
        return;
    } catch (const CacheError& e) {
        backend_errors_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Mapping store on {} backend failed, writing to local fallback: {}",
            primary_->name(), e.what()));
    }

    if (!has_separate_fallback()) return;
    fallback_->set(key, payload, config_.ttl);
    fallback_writes_.fetch_add(1, std::memory_order_relaxed);
}

bool MappingStore::ping() {
    return primary_->ping();
}

MappingStore::Stats MappingStore::get_stats() const {
    return {
        .lookups = lookups_.load(std::memory_order_relaxed),
        .hits = hits_.load(std::memory_order_relaxed),
        .stores = stores_.load(std::memory_order_relaxed),
        .backend_errors = backend_errors_.load(std::memory_order_relaxed),
        .fallback_reads = fallback_reads_.load(std::memory_order_relaxed),
        .fallback_writes = fallback_writes_.load(std::memory_order_relaxed),
    };
}

} // namespace llmfirewall
