#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace llmfirewall {

// ============================================================================
// Entity kinds
//
// Enumerator values are the wire values of the check-content response and
// must stay stable. Append new kinds at the end.
// ============================================================================

enum class EntityKind : uint8_t {
    UNKNOWN = 0,
    API_KEY = 1,
    EMAIL = 2,
    PHONE = 3,
    SSN = 4,
    CREDIT_CARD = 5,
    IP_ADDRESS = 6,
    PERSON = 7,
    LOCATION = 8,
    URL = 9,
    PASSWORD = 10,
    PROMPT_INJECTION = 11,
    JAILBREAK = 12,
    EXCESSIVE_SPECIAL_CHARS = 13,
    ENCODED_PAYLOAD = 14,
    ML_JAILBREAK = 15
};

inline constexpr uint8_t kMaxEntityKindValue = std::to_underlying(EntityKind::ML_JAILBREAK);

[[nodiscard]] inline constexpr const char* entity_kind_to_string(EntityKind kind) {
    switch (kind) {
        case EntityKind::UNKNOWN:                 return "UNKNOWN";
        case EntityKind::API_KEY:                 return "API_KEY";
        case EntityKind::EMAIL:                   return "EMAIL";
        case EntityKind::PHONE:                   return "PHONE";
        case EntityKind::SSN:                     return "SSN";
        case EntityKind::CREDIT_CARD:             return "CREDIT_CARD";
        case EntityKind::IP_ADDRESS:              return "IP_ADDRESS";
        case EntityKind::PERSON:                  return "PERSON";
        case EntityKind::LOCATION:                return "LOCATION";
        case EntityKind::URL:                     return "URL";
        case EntityKind::PASSWORD:                return "PASSWORD";
        case EntityKind::PROMPT_INJECTION:        return "PROMPT_INJECTION";
        case EntityKind::JAILBREAK:               return "JAILBREAK";
        case EntityKind::EXCESSIVE_SPECIAL_CHARS: return "EXCESSIVE_SPECIAL_CHARS";
        case EntityKind::ENCODED_PAYLOAD:         return "ENCODED_PAYLOAD";
        case EntityKind::ML_JAILBREAK:            return "ML_JAILBREAK";
    }
    return "UNKNOWN";
}

/**
 * @brief Parse an entity type name as used in config and by recognizers.
 *
 * Accepts canonical names and the recognizer aliases PHONE_NUMBER,
 * EMAIL_ADDRESS, US_SSN and IP. Case-insensitive.
 * @return The kind, or nullopt when the name is not known
 */
[[nodiscard]] std::optional<EntityKind> parse_entity_kind(std::string_view name);

/// Recognizer output mapping: unknown names become EntityKind::UNKNOWN.
[[nodiscard]] inline EntityKind entity_kind_from_recognizer(std::string_view name) {
    return parse_entity_kind(name).value_or(EntityKind::UNKNOWN);
}

/// PII-class kinds are produced by the entity recognizer and subject to anonymization.
[[nodiscard]] inline constexpr bool is_pii_kind(EntityKind kind) {
    switch (kind) {
        case EntityKind::API_KEY:
        case EntityKind::EMAIL:
        case EntityKind::PHONE:
        case EntityKind::SSN:
        case EntityKind::CREDIT_CARD:
        case EntityKind::IP_ADDRESS:
        case EntityKind::PERSON:
        case EntityKind::LOCATION:
        case EntityKind::URL:
        case EntityKind::PASSWORD:
            return true;
        case EntityKind::UNKNOWN:
        case EntityKind::PROMPT_INJECTION:
        case EntityKind::JAILBREAK:
        case EntityKind::EXCESSIVE_SPECIAL_CHARS:
        case EntityKind::ENCODED_PAYLOAD:
        case EntityKind::ML_JAILBREAK:
            return false;
    }
    return false;
}

// ============================================================================
// Findings
// ============================================================================

/**
 * @brief A single detected issue.
 *
 * start/end are byte offsets into the original UTF-8 input,
 * 0 <= start <= end <= text.size(). Findings that describe the whole input
 * without a span (special-char ratio) use [0, 0].
 */
struct Finding {
    EntityKind type = EntityKind::UNKNOWN;
    std::string text;
    size_t start = 0;
    size_t end = 0;
    double confidence = 0.0;
    std::string category;
    std::string replacement;
};

/**
 * @brief Outcome of one detector over one input.
 *
 * confidence is the detector's own sample for verdict aggregation.
 * faulted marks the fail-open path (zero findings, reduced confidence).
 */
struct DetectorOutcome {
    std::vector<Finding> findings;
    double confidence = 1.0;
    bool faulted = false;
    std::string error;
};

/**
 * @brief Diagnostics of the semantic scorer, always populated.
 *
 * method is "embedding_similarity", "disabled" or "error".
 */
struct SemanticMetadata {
    std::string method = "disabled";
    std::string model_version;
    double inference_time_ms = 0.0;
    double max_unsafe_similarity = 0.0;
    double max_safe_similarity = 0.0;
    double risk_score = 0.0;
    double threshold = 0.0;
    std::string error;
};

// ============================================================================
// Verdict
// ============================================================================

struct Verdict {
    bool is_safe = true;
    std::string redacted_text;
    std::vector<Finding> findings;
    double confidence = 1.0;
    std::string request_id;

    // Diagnostics (not part of the safety decision)
    size_t anonymized_entities = 0;
    std::unordered_map<std::string, std::string> anonymization_map;  // original -> fake
    SemanticMetadata semantic;
    std::vector<std::string> detector_errors;
    std::chrono::microseconds elapsed{0};
};

/// Caller supplied key/value pairs attached to a check (client, route, ...).
using RequestMetadata = std::unordered_map<std::string, std::string>;

} // namespace llmfirewall
