#include "core/verdict_aggregator.hpp"
#include "core/utils.hpp"
#include "security/fake_value_generator.hpp"

#include <algorithm>
#include <format>
#include <new>
#include <numeric>
#include <optional>

namespace llmfirewall {

namespace {

constexpr double kFaultConfidence = 0.5;

// Clean outcomes keep their default and do not weigh on the verdict
bool contributes(const DetectorOutcome& outcome) {
    return outcome.faulted || !outcome.findings.empty();
}

std::string summarize_types(const std::vector<Finding>& findings) {
    std::string out;
    for (const auto& f : findings) {
        if (!out.empty()) out += ',';
        out += entity_kind_to_string(f.type);
    }
    return out;
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

Result<std::shared_ptr<VerdictAggregator>> VerdictAggregator::create(
    AggregatorComponents components, Config config) {
    using R = Result<std::shared_ptr<VerdictAggregator>>;

    if (!components.recognizer) {
        return R::error(ErrorCategory::CONFIG_ERROR, "entity recognizer is required");
    }
    if (!components.pattern_engine) {
        return R::error(ErrorCategory::CONFIG_ERROR, "pattern rule engine is required");
    }
    if (!components.semantic_scorer) {
        return R::error(ErrorCategory::CONFIG_ERROR, "semantic risk scorer is required");
    }
    if (!components.anonymizer) {
        return R::error(ErrorCategory::CONFIG_ERROR, "entity anonymizer is required");
    }
    if (components.flags.anonymization && !components.anonymizer->is_enabled()) {
        return R::error(ErrorCategory::CONFIG_ERROR,
            "anonymization flag is set but the anonymizer is disabled");
    }
    if (!utils::in_unit_interval(config.pii_confidence_threshold)) {
        return R::error(ErrorCategory::CONFIG_ERROR, std::format(
            "PII confidence threshold must be within [0, 1], got {}", config.pii_confidence_threshold));
    }
    if (config.min_content_length == 0 || config.min_content_length > config.max_content_length) {
        return R::error(ErrorCategory::CONFIG_ERROR, std::format(
            "content length bounds invalid: min {} max {}",
            config.min_content_length, config.max_content_length));
    }
    if (config.max_content_length > PatternRuleEngine::kMaxTextLength) {
        return R::error(ErrorCategory::CONFIG_ERROR, std::format(
            "max_content_length {} exceeds the pattern engine scan limit of {} bytes",
            config.max_content_length, PatternRuleEngine::kMaxTextLength));
    }

    return R::ok(std::shared_ptr<VerdictAggregator>(
        new VerdictAggregator(std::move(components), std::move(config))));
}

VerdictAggregator::VerdictAggregator(AggregatorComponents components, Config config)
    : c_(std::move(components))
    , config_(std::move(config)) {
    utils::log::info(std::format(
        "Verdict aggregator ready: pii={} ({}), injection={}, anonymization={}, ml_jailbreak={}",
        utils::booltostr(c_.flags.pii_detection), c_.recognizer->name(),
        utils::booltostr(c_.flags.prompt_injection),
        utils::booltostr(c_.flags.anonymization),
        utils::booltostr(c_.flags.ml_jailbreak && c_.semantic_scorer->is_enabled())));
}

// ============================================================================
// Entry point
// ============================================================================

Result<Verdict> VerdictAggregator::check_content(
    std::string_view content,
    const std::string& request_id,
    const RequestMetadata& metadata) {

    if (content.empty()) {
        rejected_inputs_.fetch_add(1, std::memory_order_relaxed);
        return Result<Verdict>::error(ErrorCategory::INVALID_INPUT, "content must not be empty");
    }
    if (content.size() > config_.max_content_length) {
        rejected_inputs_.fetch_add(1, std::memory_order_relaxed);
        return Result<Verdict>::error(ErrorCategory::INVALID_INPUT, std::format(
            "content exceeds maximum length of {} bytes", config_.max_content_length));
    }
    if (content.size() < config_.min_content_length) {
        rejected_inputs_.fetch_add(1, std::memory_order_relaxed);
        return Result<Verdict>::error(ErrorCategory::INVALID_INPUT, std::format(
            "content is shorter than minimum length of {} bytes", config_.min_content_length));
    }

    const std::string id = request_id.empty() ? utils::generate_uuid() : request_id;
    utils::log::debug(std::format("Checking request {}: {} bytes, {} metadata entries",
        id, content.size(), metadata.size()));

    return Result<Verdict>::ok(analyze(content, id));
}

// ============================================================================
// Analysis
// ============================================================================

Verdict VerdictAggregator::analyze(std::string_view text, const std::string& request_id) {
    const utils::Timer timer;
    checks_.fetch_add(1, std::memory_order_relaxed);

    Verdict verdict;
    verdict.request_id = request_id;
    verdict.redacted_text = std::string(text);
    verdict.semantic.threshold = c_.semantic_scorer->threshold();

    std::vector<double> samples;

    if (c_.flags.pii_detection) {
        auto pii = run_pii(text, request_id, verdict.detector_errors);
        if (contributes(pii.outcome)) samples.push_back(pii.outcome.confidence);
        if (!pii.outcome.findings.empty()) {
            verdict.redacted_text = std::move(pii.redacted_text);
            verdict.anonymized_entities = pii.anonymized;
            verdict.anonymization_map = std::move(pii.mapping);
        }
        verdict.findings = std::move(pii.outcome.findings);
    }

    std::optional<DetectorOutcome> pattern;
    if (c_.flags.prompt_injection && c_.pattern_engine->is_enabled()) {
        pattern = run_pattern(text, request_id, verdict.detector_errors);
        if (contributes(*pattern)) samples.push_back(pattern->confidence);
        verdict.findings.insert(verdict.findings.end(),
            pattern->findings.begin(), pattern->findings.end());
    }

    if (c_.flags.ml_jailbreak && c_.semantic_scorer->is_enabled()) {
        auto semantic = run_semantic(text, request_id, verdict.detector_errors);
        if (contributes(semantic.outcome)) samples.push_back(semantic.outcome.confidence);
        if (pattern) record_ab_comparison(*pattern, semantic, request_id);
        verdict.findings.insert(verdict.findings.end(),
            semantic.outcome.findings.begin(), semantic.outcome.findings.end());
        verdict.semantic = std::move(semantic.metadata);
    }

    verdict.is_safe = verdict.findings.empty();
    verdict.confidence = samples.empty()
        ? 1.0
        : std::accumulate(samples.begin(), samples.end(), 0.0) / static_cast<double>(samples.size());
    verdict.elapsed = timer.elapsed_us();

    if (!verdict.is_safe) {
        unsafe_verdicts_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Security event: request {} unsafe, {} findings [{}], confidence {:.2f}",
            request_id, verdict.findings.size(), summarize_types(verdict.findings), verdict.confidence));
    }
    utils::log::debug(std::format("Request {} analyzed in {}us: safe={}, confidence {:.2f}",
        request_id, verdict.elapsed.count(), utils::booltostr(verdict.is_safe), verdict.confidence));
    return verdict;
}

bool VerdictAggregator::entity_allowed(EntityKind kind) const {
    if (config_.pii_entities.empty()) return kind != EntityKind::UNKNOWN;
    return std::ranges::find(config_.pii_entities, kind) != config_.pii_entities.end();
}

std::vector<Finding> VerdictAggregator::collect_pii_findings(
    std::string_view text, const std::vector<RecognizedEntity>& entities) const {

    std::vector<Finding> findings;
    findings.reserve(entities.size());
    for (const auto& entity : entities) {
        const auto kind = entity_kind_from_recognizer(entity.entity_type);
        if (!entity_allowed(kind)) continue;
        if (entity.score < config_.pii_confidence_threshold) continue;
        if (entity.start >= entity.end || entity.end > text.size()) {
            utils::log::warn(std::format("Ignoring {} span [{}, {}) outside input of {} bytes",
                entity.entity_type, entity.start, entity.end, text.size()));
            continue;
        }
        findings.push_back(Finding{
            .type = kind,
            .text = std::string(text.substr(entity.start, entity.end - entity.start)),
            .start = entity.start,
            .end = entity.end,
            .confidence = entity.score,
            .category = "pii",
            .replacement = FakeValueGenerator::redaction_token(kind),
        });
    }
    return findings;
}

VerdictAggregator::PiiOutcome VerdictAggregator::run_pii(
    std::string_view text, const std::string& request_id, std::vector<std::string>& errors) {

    PiiOutcome result;
    try {
        const auto entities = c_.recognizer->recognize(
            text, config_.language, config_.pii_entities, config_.pii_confidence_threshold);
        auto findings = collect_pii_findings(text, entities);

        if (findings.empty()) {
            result.redacted_text = std::string(text);
            return result;
        }

        double sum = 0.0;
        for (const auto& f : findings) sum += f.confidence;
        result.outcome.confidence = sum / static_cast<double>(findings.size());

        AnonymizationResult replaced;
        if (c_.flags.anonymization) {
            try {
                replaced = c_.anonymizer->anonymize(text, findings, request_id);
                result.anonymized = replaced.replaced;
            } catch (const std::bad_alloc&) {
                throw;
            } catch (const std::exception& e) {
                anonymization_fallbacks_.fetch_add(1, std::memory_order_relaxed);
                utils::log::error(std::format("Anonymization failed for request {}, redacting instead: {}",
                    request_id, e.what()));
                errors.push_back(std::format("anonymizer: {}", e.what()));
                replaced = c_.anonymizer->redact(text, findings);
            }
        } else {
            replaced = c_.anonymizer->redact(text, findings);
        }

        result.redacted_text = std::move(replaced.text);
        result.mapping = std::move(replaced.mapping);
        result.outcome.findings = std::move(replaced.findings);
        pii_findings_.fetch_add(result.outcome.findings.size(), std::memory_order_relaxed);
    } catch (const std::bad_alloc&) {
        throw;
    } catch (const std::exception& e) {
        pii_faults_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("PII detection failed for request {}: {}", request_id, e.what()));
        errors.push_back(std::format("pii: {}", e.what()));
        result = PiiOutcome{};
        result.outcome = {.findings = {}, .confidence = kFaultConfidence, .faulted = true, .error = e.what()};
        result.redacted_text = std::string(text);
    }
    return result;
}

DetectorOutcome VerdictAggregator::run_pattern(
    std::string_view text, const std::string& request_id, std::vector<std::string>& errors) {

    DetectorOutcome outcome;
    try {
        outcome = c_.pattern_engine->evaluate(text);
    } catch (const std::bad_alloc&) {
        throw;
    } catch (const std::exception& e) {
        outcome = {.findings = {}, .confidence = kFaultConfidence, .faulted = true, .error = e.what()};
    }

    if (outcome.faulted) {
        pattern_faults_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Pattern detection failed for request {}: {}",
            request_id, outcome.error));
        errors.push_back(std::format("pattern: {}", outcome.error));
    }
    pattern_findings_.fetch_add(outcome.findings.size(), std::memory_order_relaxed);
    return outcome;
}

SemanticScore VerdictAggregator::run_semantic(
    std::string_view text, const std::string& request_id, std::vector<std::string>& errors) {

    SemanticScore score;
    try {
        score = c_.semantic_scorer->score(text);
    } catch (const std::bad_alloc&) {
        throw;
    } catch (const std::exception& e) {
        score.outcome = {.findings = {}, .confidence = kFaultConfidence, .faulted = true, .error = e.what()};
        score.metadata.method = "error";
        score.metadata.error = e.what();
        score.metadata.threshold = c_.semantic_scorer->threshold();
    }

    if (score.outcome.faulted) {
        semantic_faults_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Semantic scoring failed for request {}: {}",
            request_id, score.outcome.error));
        errors.push_back(std::format("semantic: {}", score.outcome.error));
    }
    semantic_findings_.fetch_add(score.outcome.findings.size(), std::memory_order_relaxed);
    return score;
}

void VerdictAggregator::record_ab_comparison(const DetectorOutcome& pattern,
                                             const SemanticScore& semantic,
                                             const std::string& request_id) {
    if (pattern.faulted || semantic.outcome.faulted) return;

    const bool pattern_flagged = !pattern.findings.empty();
    const bool semantic_flagged = !semantic.outcome.findings.empty();
    if (pattern_flagged == semantic_flagged) {
        ab_agreements_.fetch_add(1, std::memory_order_relaxed);
        return;
    }
    ab_disagreements_.fetch_add(1, std::memory_order_relaxed);
    utils::log::info(std::format(
        "Detector disagreement on request {}: pattern={} semantic={} (risk {:.3f}, threshold {})",
        request_id, utils::booltostr(pattern_flagged), utils::booltostr(semantic_flagged),
        semantic.metadata.risk_score, semantic.metadata.threshold));
}

VerdictAggregator::Stats VerdictAggregator::get_stats() const {
    return {
        .checks = checks_.load(std::memory_order_relaxed),
        .rejected_inputs = rejected_inputs_.load(std::memory_order_relaxed),
        .unsafe_verdicts = unsafe_verdicts_.load(std::memory_order_relaxed),
        .pii_findings = pii_findings_.load(std::memory_order_relaxed),
        .pattern_findings = pattern_findings_.load(std::memory_order_relaxed),
        .semantic_findings = semantic_findings_.load(std::memory_order_relaxed),
        .pii_faults = pii_faults_.load(std::memory_order_relaxed),
        .pattern_faults = pattern_faults_.load(std::memory_order_relaxed),
        .semantic_faults = semantic_faults_.load(std::memory_order_relaxed),
        .anonymization_fallbacks = anonymization_fallbacks_.load(std::memory_order_relaxed),
        .ab_agreements = ab_agreements_.load(std::memory_order_relaxed),
        .ab_disagreements = ab_disagreements_.load(std::memory_order_relaxed),
    };
}

} // namespace llmfirewall
