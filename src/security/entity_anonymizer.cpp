#include "security/entity_anonymizer.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace llmfirewall {

EntityAnonymizer::EntityAnonymizer(Config config,
                                   std::shared_ptr<MappingStore> store,
                                   std::shared_ptr<FakeValueGenerator> generator)
    : config_(config)
    , store_(std::move(store))
    , generator_(std::move(generator)) {
    if (!store_ || !generator_) {
        throw std::invalid_argument("EntityAnonymizer requires a mapping store and a fake value generator");
    }
}

// ============================================================================
// Span planning
// ============================================================================

EntityAnonymizer::SpanPlan EntityAnonymizer::plan_spans(
    std::string_view text, const std::vector<Finding>& findings) {
    SpanPlan plan;

    std::vector<size_t> order;
    order.reserve(findings.size());
    for (size_t i = 0; i < findings.size(); ++i) {
        const auto& f = findings[i];
        if (f.start >= f.end || f.end > text.size()) {
            invalid_spans_.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format("Skipping {} entity with invalid span [{}, {}) for text of {} bytes",
                entity_kind_to_string(f.type), f.start, f.end, text.size()));
            continue;
        }
        order.push_back(i);
    }

    // Leftmost-longest: ascending start, longer span first on ties
    std::ranges::sort(order, [&findings](size_t a, size_t b) {
        if (findings[a].start != findings[b].start) return findings[a].start < findings[b].start;
        return findings[a].end > findings[b].end;
    });

    size_t covered_until = 0;
    for (const size_t idx : order) {
        if (findings[idx].start >= covered_until) {
            plan.applied.push_back(idx);
            covered_until = findings[idx].end;
        } else {
            overlaps_skipped_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    std::ranges::reverse(order);
    std::ranges::reverse(plan.applied);
    plan.valid = std::move(order);
    return plan;
}

AnonymizationResult EntityAnonymizer::apply(
    std::string_view text, const std::vector<Finding>& findings, const SpanPlan& plan) {
    AnonymizationResult result;
    result.text = std::string(text);
    for (const size_t idx : plan.applied) {
        const auto& f = findings[idx];
        result.text.replace(f.start, f.end - f.start, f.replacement);
    }
    result.replaced = plan.applied.size();
    return result;
}

// ============================================================================
// Public API
// ============================================================================

AnonymizationResult EntityAnonymizer::anonymize(
    std::string_view text,
    const std::vector<Finding>& entity_findings,
    const std::string& request_id) {
    if (!config_.enabled || entity_findings.empty()) {
        AnonymizationResult result;
        result.text = std::string(text);
        result.findings = entity_findings;
        return result;
    }
    anonymize_calls_.fetch_add(1, std::memory_order_relaxed);

    auto findings = entity_findings;
    const auto plan = plan_spans(text, findings);

    std::unordered_map<std::string, std::string> memo;
    for (const size_t idx : plan.valid) {
        auto& f = findings[idx];
        const std::string original(text.substr(f.start, f.end - f.start));
        f.replacement = resolve_fake(f, original, request_id, memo);
    }

    auto result = apply(text, findings, plan);
    result.mapping = std::move(memo);
    result.findings = std::move(findings);
    entities_replaced_.fetch_add(result.replaced, std::memory_order_relaxed);

    utils::log::info(std::format("Anonymized {} entities in request {}", result.replaced, request_id));
    return result;
}

AnonymizationResult EntityAnonymizer::redact(
    std::string_view text, const std::vector<Finding>& entity_findings) {
    redact_calls_.fetch_add(1, std::memory_order_relaxed);

    auto findings = entity_findings;
    const auto plan = plan_spans(text, findings);
    for (const size_t idx : plan.valid) {
        findings[idx].replacement = FakeValueGenerator::redaction_token(findings[idx].type);
    }

    auto result = apply(text, findings, plan);
    result.findings = std::move(findings);
    entities_replaced_.fetch_add(result.replaced, std::memory_order_relaxed);
    return result;
}

DeanonymizationResult EntityAnonymizer::deanonymize(
    std::string_view text, const std::string& request_id) const {
    utils::log::warn(std::format("De-anonymization requested for request {} but is not supported", request_id));
    return {std::string(text), false, "de-anonymization is not supported"};
}

std::string EntityAnonymizer::resolve_fake(
    const Finding& finding, const std::string& original,
    const std::string& request_id,
    std::unordered_map<std::string, std::string>& memo) {
    if (const auto it = memo.find(original); it != memo.end()) {
        return it->second;
    }

    std::string fake;
    if (auto existing = store_->lookup(request_id, original)) {
        mappings_reused_.fetch_add(1, std::memory_order_relaxed);
        fake = std::move(existing->fake_value);
    } else {
        fake = generator_->generate(finding.type, original);
        store_->store(request_id, AnonymizationMapping{
            original, fake, finding.type, std::chrono::system_clock::now()});
    }

    memo.emplace(original, fake);
    return fake;
}

EntityAnonymizer::Stats EntityAnonymizer::get_stats() const {
    return {
        .anonymize_calls = anonymize_calls_.load(std::memory_order_relaxed),
        .redact_calls = redact_calls_.load(std::memory_order_relaxed),
        .entities_replaced = entities_replaced_.load(std::memory_order_relaxed),
        .mappings_reused = mappings_reused_.load(std::memory_order_relaxed),
        .overlaps_skipped = overlaps_skipped_.load(std::memory_order_relaxed),
        .invalid_spans = invalid_spans_.load(std::memory_order_relaxed),
    };
}

} // namespace llmfirewall
