#pragma once

#include "cache/mapping_store.hpp"
#include "core/types.hpp"
#include "security/fake_value_generator.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace llmfirewall {

struct AnonymizationResult {
    std::string text;
    std::unordered_map<std::string, std::string> mapping;   // original -> fake
    std::vector<Finding> findings;                          // input order, replacement filled
    size_t replaced = 0;
};

struct DeanonymizationResult {
    std::string text;
    bool success = false;
    std::string error;
};

/**
 * @brief Replaces recognized entities with realistic substitutes.
 *
 * Spans are applied in descending start order against the original input,
 * so a replacement never shifts the offsets of spans not yet applied.
 * Overlapping spans resolve leftmost-longest; the shorter overlapping span
 * keeps its replacement in the findings but is not substituted. Spans outside
 * the text or empty spans are skipped.
 *
 * Within one request the same original value always receives the same fake
 * (mapping store lookup, backed by a per-call memo).
 */
class EntityAnonymizer {
public:
    struct Config {
        bool enabled = false;
    };

    EntityAnonymizer(Config config,
                     std::shared_ptr<MappingStore> store,
                     std::shared_ptr<FakeValueGenerator> generator);

    [[nodiscard]] bool is_enabled() const { return config_.enabled; }

    /// Disabled: returns the text unchanged with an empty mapping.
    [[nodiscard]] AnonymizationResult anonymize(
        std::string_view text,
        const std::vector<Finding>& entity_findings,
        const std::string& request_id);

    /// Token redaction ("<TYPE_REDACTED>") with the same span handling. No mappings stored.
    [[nodiscard]] AnonymizationResult redact(
        std::string_view text,
        const std::vector<Finding>& entity_findings);

    /// Reversal is a privileged operation that is not offered; always fails.
    [[nodiscard]] DeanonymizationResult deanonymize(
        std::string_view text, const std::string& request_id) const;

    struct Stats {
        uint64_t anonymize_calls;
        uint64_t redact_calls;
        uint64_t entities_replaced;
        uint64_t mappings_reused;
        uint64_t overlaps_skipped;
        uint64_t invalid_spans;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    struct SpanPlan {
        std::vector<size_t> valid;      // indices of usable findings, start descending
        std::vector<size_t> applied;    // subset actually substituted, start descending
    };

    [[nodiscard]] SpanPlan plan_spans(std::string_view text,
                                      const std::vector<Finding>& findings);

    [[nodiscard]] std::string resolve_fake(
        const Finding& finding, const std::string& original,
        const std::string& request_id,
        std::unordered_map<std::string, std::string>& memo);

    [[nodiscard]] static AnonymizationResult apply(
        std::string_view text, const std::vector<Finding>& findings,
        const SpanPlan& plan);

    Config config_;
    std::shared_ptr<MappingStore> store_;
    std::shared_ptr<FakeValueGenerator> generator_;

    std::atomic<uint64_t> anonymize_calls_{0};
    std::atomic<uint64_t> redact_calls_{0};
    std::atomic<uint64_t> entities_replaced_{0};
    std::atomic<uint64_t> mappings_reused_{0};
    std::atomic<uint64_t> overlaps_skipped_{0};
    std::atomic<uint64_t> invalid_spans_{0};
};

} // namespace llmfirewall
