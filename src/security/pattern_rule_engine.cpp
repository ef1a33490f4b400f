#include "security/pattern_rule_engine.hpp"
#include "core/base64.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <new>

namespace llmfirewall {

namespace {

constexpr double kDirectConfidence = 0.9;
constexpr double kJailbreakConfidence = 0.8;
constexpr double kEncodedConfidence = 0.85;
constexpr double kSpecialCharConfidence = 0.7;
constexpr double kDelimiterConfidence = 0.6;
constexpr double kFaultConfidence = 0.5;

constexpr size_t kEncodedDisplayChars = 50;
constexpr size_t kMinBase64Run = 20;
constexpr size_t kMaxBase64Padding = 2;
constexpr size_t kMinDelimiterRun = 3;
constexpr size_t kMinDelimiterRuns = 2;

constexpr std::string_view kInjectionReplacement = "<PROMPT_INJECTION_DETECTED>";
constexpr std::string_view kJailbreakReplacement = "<JAILBREAK_DETECTED>";
constexpr std::string_view kEncodedReplacement = "<ENCODED_PAYLOAD_DETECTED>";

constexpr std::array<std::string_view, 6> kEncodedKeywords = {
    "system", "prompt", "instruction", "ignore", "override", "admin",
};

constexpr std::array<char, 4> kDelimiterGlyphs = {'-', '=', '*', '#'};

PatternRule direct(std::string name, std::string pattern) {
    return {RuleFamily::DIRECT_INJECTION, std::move(name), std::move(pattern),
            EntityKind::PROMPT_INJECTION, "direct_injection", kDirectConfidence,
            std::string(kInjectionReplacement)};
}

PatternRule jailbreak(std::string name, std::string pattern) {
    return {RuleFamily::JAILBREAK, std::move(name), std::move(pattern),
            EntityKind::JAILBREAK, "jailbreak_attempt", kJailbreakConfidence,
            std::string(kJailbreakReplacement)};
}

std::vector<PatternRule> make_builtin_rules() {
    // "ignore all previous instructions" carries two qualifiers
    const std::string override_tail =
        R"(\s+((previous|all|above|prior|earlier|your)\s+){1,2}(instructions?|prompts?|commands?|rules?))";
    return {
        // Instruction override
        direct("instruction_override", "ignore" + override_tail),
        direct("instruction_override", "disregard" + override_tail),
        direct("instruction_override", "forget" + override_tail),
        direct("instruction_override", "override" + override_tail),
        // System prompt leakage
        direct("system_prompt_leak",
               R"((show|display|reveal|print|output|tell\s+me)\s+(your|the)\s+(system\s+)?(prompt|instructions?|rules?))"),
        direct("system_prompt_leak", R"(what\s+(are|is)\s+your\s+(system\s+)?(prompt|instructions?|rules?))"),
        direct("system_prompt_leak", R"(repeat\s+(your|the)\s+(system\s+)?(prompt|instructions?))"),
        // Role-play and mode switching
        direct("mode_switch", R"(you\s+are\s+now\s+(in|a|an)\s+(developer|admin|debug|god)\s+mode)"),
        direct("mode_switch", R"(enable\s+(developer|admin|debug|god)\s+mode)"),
        direct("mode_switch",
               R"((act|pretend|behave)\s+as\s+(if\s+you\s+are\s+)?(a|an)\s+(jailbroken|unrestricted|evil|malicious|hacker))"),
        direct("mode_switch", R"(from\s+now\s+on,?\s+you\s+(are|will\s+be|should\s+be))"),
        // DAN (Do Anything Now)
        direct("dan", R"(\bDAN\b.*mode)"),
        direct("dan", R"(do\s+anything\s+now)"),
        // Chat template escape tokens
        direct("escape_token", R"(<\|im_(start|end)\|>)"),
        direct("escape_token", R"(\[INST\].*\[/INST\])"),
        direct("escape_token", R"(###\s*(Instruction|System|Human|Assistant))"),
        // Delimiter phrases
        direct("delimiter_phrase", R"(---+\s*(end|start)\s+of\s+(prompt|instructions?))"),
        direct("delimiter_phrase", R"(\*\*\*+\s*(end|start)\s+of\s+(prompt|instructions?))"),
        // Encoded payload indicators
        direct("encoded_indicator", R"(base64:)"),
        direct("encoded_indicator", R"(eval\s*\()"),
        direct("encoded_indicator", R"(exec\s*\()"),
        // XML / JSON role injection
        direct("role_injection", R"(<\s*system\s*>)"),
        direct("role_injection", R"(<\s*instruction\s*>)"),
        direct("role_injection", R"("role"\s*:\s*"system")"),
        // "translate" in other languages
        direct("multilingual", "traduire|traduzir|übersetzen|翻译"),

        jailbreak("hypothetical", R"(hypothetically)"),
        jailbreak("fiction_framing", R"(in\s+a\s+fictional\s+(world|universe|scenario|story))"),
        jailbreak("purpose_framing", R"(for\s+(educational|research|academic)\s+purposes\s+only)"),
        jailbreak("no_consequences", R"(no\s+consequences)"),
        jailbreak("no_restrictions", R"(without\s+any\s+(restrictions?|limitations?|filters?|guidelines?))"),
        jailbreak("bypass_safety", R"(bypass\s+(safety|content)\s+(filters?|guidelines?|restrictions?))"),
        jailbreak("unfiltered", R"(unfiltered\s+response)"),
        jailbreak("no_restrictions", R"((pretend|imagine)\s+you\s+have\s+no\s+(restrictions?|limitations?|ethics?))"),
    };
}

Finding make_match_finding(const PatternRule& rule, std::string_view text,
                           size_t start, size_t length) {
    return Finding{
        .type = rule.kind,
        .text = std::string(text.substr(start, length)),
        .start = start,
        .end = start + length,
        .confidence = rule.confidence,
        .category = rule.category,
        .replacement = rule.replacement,
    };
}

struct Run {
    size_t start;
    size_t length;
};

bool is_base64_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
        || c == '+' || c == '/';
}

// Maximal base64 alphabet runs of at least kMinBase64Run chars plus up to two '=' pads.
std::vector<Run> find_base64_runs(std::string_view text) {
    std::vector<Run> runs;
    size_t i = 0;
    while (i < text.size()) {
        if (!is_base64_char(text[i])) {
            ++i;
            continue;
        }
        const size_t start = i;
        while (i < text.size() && is_base64_char(text[i])) ++i;
        if (i - start < kMinBase64Run) continue;
        for (size_t pad = 0; pad < kMaxBase64Padding && i < text.size() && text[i] == '='; ++pad) ++i;
        runs.push_back({start, i - start});
    }
    return runs;
}

std::vector<Run> find_glyph_runs(std::string_view text, char glyph) {
    std::vector<Run> runs;
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != glyph) {
            ++i;
            continue;
        }
        const size_t start = i;
        while (i < text.size() && text[i] == glyph) ++i;
        if (i - start >= kMinDelimiterRun) runs.push_back({start, i - start});
    }
    return runs;
}

bool contains_instruction_keyword(const std::string& decoded) {
    const auto lower = utils::to_lower(decoded);
    return std::ranges::any_of(kEncodedKeywords, [&lower](std::string_view kw) {
        return lower.find(kw) != std::string::npos;
    });
}

} // anonymous namespace

// ============================================================================
// Rule family names
// ============================================================================

const char* rule_family_to_string(RuleFamily family) {
    switch (family) {
        case RuleFamily::DIRECT_INJECTION: return "direct";
        case RuleFamily::JAILBREAK:        return "jailbreak";
    }
    return "unknown";
}

std::optional<RuleFamily> parse_rule_family(std::string_view name) {
    const auto lower = utils::to_lower(name);
    if (lower == "direct" || lower == "direct_injection") return RuleFamily::DIRECT_INJECTION;
    if (lower == "jailbreak") return RuleFamily::JAILBREAK;
    return std::nullopt;
}

// ============================================================================
// Construction
// ============================================================================

const std::vector<PatternRule>& PatternRuleEngine::builtin_rules() {
    static const std::vector<PatternRule> rules = make_builtin_rules();
    return rules;
}

Result<std::shared_ptr<PatternRuleEngine>> PatternRuleEngine::create(const Config& config) {
    using R = Result<std::shared_ptr<PatternRuleEngine>>;

    if (!utils::in_unit_interval(config.special_char_threshold)) {
        return R::error(ErrorCategory::CONFIG_ERROR, std::format(
            "special_char_threshold must be within [0, 1], got {}", config.special_char_threshold));
    }

    std::vector<PatternRule> all_rules = builtin_rules();
    all_rules.insert(all_rules.end(), config.extra_rules.begin(), config.extra_rules.end());

    std::vector<CompiledRule> compiled;
    compiled.reserve(all_rules.size());
    for (auto& rule : all_rules) {
        if (!utils::in_unit_interval(rule.confidence)) {
            return R::error(ErrorCategory::CONFIG_ERROR, std::format(
                "rule '{}' confidence must be within [0, 1], got {}", rule.name, rule.confidence));
        }
        try {
            std::regex regex(rule.pattern,
                std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
            compiled.push_back(CompiledRule{std::move(rule), std::move(regex)});
        } catch (const std::regex_error& e) {
            return R::error(ErrorCategory::CONFIG_ERROR, std::format(
                "rule '{}' has an invalid pattern '{}': {}", rule.name, rule.pattern, e.what()));
        }
    }

    auto engine = std::shared_ptr<PatternRuleEngine>(
        new PatternRuleEngine(config, std::move(compiled)));
    utils::log::info(std::format("Pattern rule engine ready: {} rules ({} custom), special char threshold {}",
        engine->rule_count(), config.extra_rules.size(), config.special_char_threshold));
    return R::ok(std::move(engine));
}

PatternRuleEngine::PatternRuleEngine(Config config, std::vector<CompiledRule> rules)
    : config_(std::move(config))
    , rules_(std::move(rules)) {}

// ============================================================================
// Evaluation
// ============================================================================

double PatternRuleEngine::confidence_for(size_t finding_count) {
    if (finding_count == 0) return 1.0;
    return std::min(0.95, 0.7 + 0.1 * static_cast<double>(finding_count));
}

DetectorOutcome PatternRuleEngine::evaluate(std::string_view text) const {
    if (!config_.enabled) {
        return {};
    }
    evaluations_.fetch_add(1, std::memory_order_relaxed);

    if (text.size() > kMaxTextLength) {
        faults_.fetch_add(1, std::memory_order_relaxed);
        auto error = std::format("input of {} bytes exceeds the {} byte scan limit",
            text.size(), kMaxTextLength);
        utils::log::error(std::format("Pattern rule evaluation skipped: {}", error));
        return {.findings = {}, .confidence = kFaultConfidence, .faulted = true, .error = std::move(error)};
    }

    DetectorOutcome outcome;
    try {
        check_rules(text, outcome.findings);
        check_encoded_payloads(text, outcome.findings);
        check_special_characters(text, outcome.findings);
        check_delimiters(text, outcome.findings);
    } catch (const std::bad_alloc&) {
        throw;
    } catch (const std::exception& e) {
        faults_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Pattern rule evaluation failed: {}", e.what()));
        return {.findings = {}, .confidence = kFaultConfidence, .faulted = true, .error = e.what()};
    }

    outcome.confidence = confidence_for(outcome.findings.size());
    if (!outcome.findings.empty()) {
        texts_flagged_.fetch_add(1, std::memory_order_relaxed);
        findings_.fetch_add(outcome.findings.size(), std::memory_order_relaxed);
        utils::log::warn(std::format("Detected {} prompt injection indicators, confidence {:.2f}",
            outcome.findings.size(), outcome.confidence));
    }
    return outcome;
}

void PatternRuleEngine::check_rules(std::string_view text, std::vector<Finding>& out) const {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    for (const auto& compiled : rules_) {
        for (auto it = std::cregex_iterator(begin, end, compiled.regex);
             it != std::cregex_iterator(); ++it) {
            const auto& m = *it;
            if (m.length(0) == 0) continue;
            out.push_back(make_match_finding(compiled.rule, text,
                static_cast<size_t>(m.position(0)), static_cast<size_t>(m.length(0))));
        }
    }
}

void PatternRuleEngine::check_encoded_payloads(std::string_view text, std::vector<Finding>& out) const {
    for (const auto& [start, length] : find_base64_runs(text)) {
        const auto candidate = text.substr(start, length);

        // Not base64 at all: skip without reporting
        const auto decoded = base64::try_decode(candidate);
        if (!decoded || !contains_instruction_keyword(*decoded)) continue;

        out.push_back(Finding{
            .type = EntityKind::ENCODED_PAYLOAD,
            .text = utils::truncate_for_display(candidate, kEncodedDisplayChars),
            .start = start,
            .end = start + length,
            .confidence = kEncodedConfidence,
            .category = "encoded_injection",
            .replacement = std::string(kEncodedReplacement),
        });
    }
}

double PatternRuleEngine::special_char_ratio(std::string_view text) {
    size_t total = 0;
    size_t special = 0;
    for (size_t i = 0; i < text.size(); i += utils::utf8::advance(text, i)) {
        ++total;
        const auto c = static_cast<unsigned char>(text[i]);
        if (c >= 0x80) {
            ++special;
        } else if (!std::isalnum(c) && !std::isspace(c)) {
            ++special;
        }
    }
    return total == 0 ? 0.0 : static_cast<double>(special) / static_cast<double>(total);
}

void PatternRuleEngine::check_special_characters(std::string_view text, std::vector<Finding>& out) const {
    if (text.empty()) return;

    const double ratio = special_char_ratio(text);
    if (ratio > config_.special_char_threshold) {
        out.push_back(Finding{
            .type = EntityKind::EXCESSIVE_SPECIAL_CHARS,
            .text = std::format("Special character ratio: {:.2f}%", ratio * 100.0),
            .start = 0,
            .end = 0,
            .confidence = kSpecialCharConfidence,
            .category = "suspicious_pattern",
            .replacement = "",
        });
    }
}

void PatternRuleEngine::check_delimiters(std::string_view text, std::vector<Finding>& out) const {
    for (const char glyph : kDelimiterGlyphs) {
        const auto runs = find_glyph_runs(text, glyph);
        // A single separator is ordinary formatting
        if (runs.size() < kMinDelimiterRuns) continue;

        for (const auto& [start, length] : runs) {
            out.push_back(Finding{
                .type = EntityKind::PROMPT_INJECTION,
                .text = std::string(text.substr(start, length)),
                .start = start,
                .end = start + length,
                .confidence = kDelimiterConfidence,
                .category = "delimiter_injection",
                .replacement = "",
            });
        }
    }
}

PatternRuleEngine::Stats PatternRuleEngine::get_stats() const {
    return {
        .evaluations = evaluations_.load(std::memory_order_relaxed),
        .texts_flagged = texts_flagged_.load(std::memory_order_relaxed),
        .findings = findings_.load(std::memory_order_relaxed),
        .faults = faults_.load(std::memory_order_relaxed),
    };
}

} // namespace llmfirewall
