#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "recognizer/ientity_recognizer.hpp"
#include "security/entity_anonymizer.hpp"
#include "security/pattern_rule_engine.hpp"
#include "security/semantic_risk_scorer.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace llmfirewall {

/**
 * @brief Per-detector switches. A disabled detector is never invoked.
 */
struct DetectorFlags {
    bool pii_detection = true;
    bool prompt_injection = true;
    bool anonymization = false;     // false: PII is replaced by <TYPE_REDACTED> tokens
    bool ml_jailbreak = false;
};

/**
 * @brief Detector handles. All are required; use the flags to switch them off.
 */
struct AggregatorComponents {
    std::shared_ptr<IEntityRecognizer> recognizer;
    std::shared_ptr<PatternRuleEngine> pattern_engine;
    std::shared_ptr<SemanticRiskScorer> semantic_scorer;
    std::shared_ptr<EntityAnonymizer> anonymizer;

    DetectorFlags flags;
};

/**
 * @brief Runs the detectors over one input and merges their output.
 *
 * Order: PII recognition (+ anonymization or redaction), pattern rules,
 * semantic scoring. Findings keep that order. The verdict is unsafe iff any
 * finding exists. Confidence is the mean of the samples of detectors that
 * reported findings or faulted; detectors that found nothing contribute no
 * sample (1.0 when no sample exists).
 *
 * Each detector is isolated: an exception escaping it becomes a faulted
 * outcome (no findings, confidence 0.5) and the remaining detectors still
 * run. std::bad_alloc is not recovered.
 */
class VerdictAggregator {
public:
    struct Config {
        std::vector<EntityKind> pii_entities;       // empty: every kind the recognizer knows
        double pii_confidence_threshold = 0.7;
        std::string language = "en";
        size_t max_content_length = 10240;
        size_t min_content_length = 1;
    };

    [[nodiscard]] static Result<std::shared_ptr<VerdictAggregator>> create(
        AggregatorComponents components, Config config);

    /**
     * @brief Validate the input, assign a request id, then analyze.
     * @return INVALID_INPUT for empty, too short or too long content
     */
    [[nodiscard]] Result<Verdict> check_content(
        std::string_view content,
        const std::string& request_id,
        const RequestMetadata& metadata = {});

    /// Detection on already validated text.
    [[nodiscard]] Verdict analyze(std::string_view text, const std::string& request_id);

    [[nodiscard]] const DetectorFlags& flags() const { return c_.flags; }
    [[nodiscard]] const AggregatorComponents& components() const { return c_; }

    struct Stats {
        uint64_t checks;
        uint64_t rejected_inputs;
        uint64_t unsafe_verdicts;
        uint64_t pii_findings;
        uint64_t pattern_findings;
        uint64_t semantic_findings;
        uint64_t pii_faults;
        uint64_t pattern_faults;
        uint64_t semantic_faults;
        uint64_t anonymization_fallbacks;
        uint64_t ab_agreements;
        uint64_t ab_disagreements;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    VerdictAggregator(AggregatorComponents components, Config config);

    struct PiiOutcome {
        DetectorOutcome outcome;
        std::string redacted_text;
        std::unordered_map<std::string, std::string> mapping;
        size_t anonymized = 0;
    };

    [[nodiscard]] PiiOutcome run_pii(std::string_view text, const std::string& request_id,
                                     std::vector<std::string>& errors);
    [[nodiscard]] DetectorOutcome run_pattern(std::string_view text, const std::string& request_id,
                                              std::vector<std::string>& errors);
    [[nodiscard]] SemanticScore run_semantic(std::string_view text, const std::string& request_id,
                                             std::vector<std::string>& errors);

    [[nodiscard]] std::vector<Finding> collect_pii_findings(
        std::string_view text, const std::vector<RecognizedEntity>& entities) const;

    void record_ab_comparison(const DetectorOutcome& pattern, const SemanticScore& semantic,
                              const std::string& request_id);

    [[nodiscard]] bool entity_allowed(EntityKind kind) const;

    AggregatorComponents c_;
    Config config_;

    std::atomic<uint64_t> checks_{0};
    std::atomic<uint64_t> rejected_inputs_{0};
    std::atomic<uint64_t> unsafe_verdicts_{0};
    std::atomic<uint64_t> pii_findings_{0};
    std::atomic<uint64_t> pattern_findings_{0};
    std::atomic<uint64_t> semantic_findings_{0};
    std::atomic<uint64_t> pii_faults_{0};
    std::atomic<uint64_t> pattern_faults_{0};
    std::atomic<uint64_t> semantic_faults_{0};
    std::atomic<uint64_t> anonymization_fallbacks_{0};
    std::atomic<uint64_t> ab_agreements_{0};
    std::atomic<uint64_t> ab_disagreements_{0};
};

} // namespace llmfirewall
