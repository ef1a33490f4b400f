#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace llmfirewall {

enum class RuleFamily : uint8_t {
    DIRECT_INJECTION,
    JAILBREAK
};

[[nodiscard]] const char* rule_family_to_string(RuleFamily family);
[[nodiscard]] std::optional<RuleFamily> parse_rule_family(std::string_view name);

/**
 * @brief One regex rule. Patterns are ECMAScript, matched case-insensitively.
 */
struct PatternRule {
    RuleFamily family = RuleFamily::DIRECT_INJECTION;
    std::string name;
    std::string pattern;
    EntityKind kind = EntityKind::PROMPT_INJECTION;
    std::string category;
    double confidence = 0.9;
    std::string replacement;
};

/**
 * @brief Regex and heuristic detector for prompt injection and jailbreaks.
 *
 * Families, evaluated in order and concatenated:
 *   1. direct injection rules       PROMPT_INJECTION 0.9
 *   2. jailbreak phrasing rules     JAILBREAK        0.8
 *   3. base64 payloads hiding instruction keywords   ENCODED_PAYLOAD 0.85
 *   4. special character ratio above threshold       EXCESSIVE_SPECIAL_CHARS 0.7
 *   5. repeated delimiter runs (two or more per kind) PROMPT_INJECTION 0.6
 *
 * Rules are compiled once by create(); an invalid pattern fails creation.
 * evaluate() is fail-open: an internal fault yields no findings with
 * confidence 0.5 and never throws (memory exhaustion excepted). Inputs
 * longer than kMaxTextLength are not scanned and take the fault path.
 */
class PatternRuleEngine {
public:
    struct Config {
        bool enabled = true;
        double special_char_threshold = 0.1;
        std::vector<PatternRule> extra_rules;
    };

    /// std::regex matching recurses per matched character; longer inputs risk the stack.
    static constexpr size_t kMaxTextLength = 16384;

    [[nodiscard]] static Result<std::shared_ptr<PatternRuleEngine>> create(const Config& config);

    [[nodiscard]] DetectorOutcome evaluate(std::string_view text) const;

    [[nodiscard]] bool is_enabled() const { return config_.enabled; }
    [[nodiscard]] size_t rule_count() const { return rules_.size(); }

    [[nodiscard]] static const std::vector<PatternRule>& builtin_rules();

    /// Fraction of code points that are neither ASCII alphanumeric nor ASCII whitespace.
    [[nodiscard]] static double special_char_ratio(std::string_view text);

    /// min(0.95, 0.7 + 0.1 * n) for n > 0, else 1.0
    [[nodiscard]] static double confidence_for(size_t finding_count);

    struct Stats {
        uint64_t evaluations;
        uint64_t texts_flagged;
        uint64_t findings;
        uint64_t faults;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    struct CompiledRule {
        PatternRule rule;
        std::regex regex;
    };

    PatternRuleEngine(Config config, std::vector<CompiledRule> rules);

    void check_rules(std::string_view text, std::vector<Finding>& out) const;
    void check_encoded_payloads(std::string_view text, std::vector<Finding>& out) const;
    void check_special_characters(std::string_view text, std::vector<Finding>& out) const;
    void check_delimiters(std::string_view text, std::vector<Finding>& out) const;

    Config config_;
    std::vector<CompiledRule> rules_;

    mutable std::atomic<uint64_t> evaluations_{0};
    mutable std::atomic<uint64_t> texts_flagged_{0};
    mutable std::atomic<uint64_t> findings_{0};
    mutable std::atomic<uint64_t> faults_{0};
};

} // namespace llmfirewall
