#include "recognizer/pattern_entity_recognizer.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>

namespace llmfirewall {

namespace {

std::string digits_only(std::string_view value) {
    std::string digits;
    digits.reserve(value.size());
    for (const char c : value) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits += c;
        }
    }
    return digits;
}

bool overlaps(const RecognizedEntity& a, const RecognizedEntity& b) {
    return a.start < b.end && b.start < a.end;
}

} // anonymous namespace

// ============================================================================
// Validators
// ============================================================================

bool PatternEntityRecognizer::luhn_validate(std::string_view number) {
    const auto digits = digits_only(number);
    if (digits.size() < 13 || digits.size() > 19) {
        return false;
    }

    int sum = 0;
    bool double_digit = false;

    // Process from right to left
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        int digit = *it - '0';
        if (double_digit) {
            digit *= 2;
            if (digit > 9) {
                digit -= 9;
            }
        }
        sum += digit;
        double_digit = !double_digit;
    }

    return (sum % 10) == 0;
}

bool PatternEntityRecognizer::validate_ssn(std::string_view value) {
    const auto digits = digits_only(value);
    if (digits.size() != 9) {
        return false;
    }

    // Area number (first 3) cannot be 000, 666, or 900-999
    const int area = utils::parse_int<int>(std::string_view(digits).substr(0, 3));
    if (area == 0 || area == 666 || area >= 900) {
        return false;
    }

    // Group number (middle 2) cannot be 00
    if (utils::parse_int<int>(std::string_view(digits).substr(3, 2)) == 0) {
        return false;
    }

    // Serial number (last 4) cannot be 0000
    return utils::parse_int<int>(std::string_view(digits).substr(5, 4)) != 0;
}

bool PatternEntityRecognizer::validate_ipv4(std::string_view value) {
    const auto octets = utils::split(std::string(value), '.');
    if (octets.size() != 4) return false;
    return std::ranges::all_of(octets, [](const std::string& octet) {
        if (octet.empty() || octet.size() > 3) return false;
        if (octet.size() > 1 && octet[0] == '0') return false;
        const auto v = utils::try_parse_int<int>(octet);
        return v && *v <= 255;
    });
}

// ============================================================================
// Recognizer table
// ============================================================================

PatternEntityRecognizer::PatternEntityRecognizer() {
    const auto flags = std::regex::ECMAScript | std::regex::optimize;
    const auto add = [&](EntityKind kind, const char* name, const char* pattern,
                         double score, Validator validator = nullptr) {
        recognizers_.push_back(Recognizer{kind, name, std::regex(pattern, flags), score, validator});
    };

    add(EntityKind::EMAIL, "email",
        R"([a-zA-Z0-9](?:[a-zA-Z0-9._%+-]*[a-zA-Z0-9])?@[a-zA-Z0-9](?:[a-zA-Z0-9.-]*[a-zA-Z0-9])?\.[a-zA-Z]{2,8})",
        1.0);

    // US formats with separators: (555) 123-4567, 555-123-4567, +1 555.123.4567
    add(EntityKind::PHONE, "us_phone",
        R"((?:\+1[-.\s]?)?(?:\(\d{3}\)\s?|\b\d{3}[-.\s])\d{3}[-.\s]\d{4}\b)",
        0.75);

    add(EntityKind::SSN, "us_ssn", R"(\b\d{3}[-\s]\d{2}[-\s]\d{4}\b)", 0.85, &validate_ssn);

    add(EntityKind::CREDIT_CARD, "credit_card", R"(\b(?:\d{4}[-\s]?){3}\d{1,7}\b)", 1.0, &luhn_validate);

    add(EntityKind::IP_ADDRESS, "ipv4", R"(\b(?:\d{1,3}\.){3}\d{1,3}\b)", 0.95, &validate_ipv4);

    add(EntityKind::URL, "url", R"(\bhttps?://[^\s<>"']+)", 0.75);

    add(EntityKind::API_KEY, "openai_api_key", R"(\bsk-[a-zA-Z0-9]{48}\b)", 0.9);
    add(EntityKind::API_KEY, "anthropic_api_key", R"(\bsk-ant-[a-zA-Z0-9\-]{95,115}\b)", 0.9);
    add(EntityKind::API_KEY, "generic_api_key",
        R"(\b[Aa][Pp][Ii][-_]?[Kk][Ee][Yy]\s*[:=]\s*['"]?[a-zA-Z0-9_\-]{32,}['"]?)", 0.7);
    add(EntityKind::API_KEY, "bearer_token",
        R"(\b[Bb]earer\s+[a-zA-Z0-9\-_]+\.[a-zA-Z0-9\-_]+\.[a-zA-Z0-9\-_]+\b)", 0.8);
    add(EntityKind::API_KEY, "aws_access_key",
        R"(\b(?:A3T[A-Z0-9]|AKIA|AGPA|AIDA|AROA|AIPA|ANPA|ANVA|ASIA)[A-Z0-9]{16}\b)", 0.9);
}

// ============================================================================
// Recognition
// ============================================================================

std::vector<RecognizedEntity> PatternEntityRecognizer::recognize(
    std::string_view text,
    const std::string& /*language*/,
    const std::vector<EntityKind>& entity_types,
    double score_threshold) {

    calls_.fetch_add(1, std::memory_order_relaxed);

    const auto wanted = [&entity_types](EntityKind kind) {
        return entity_types.empty() ||
               std::ranges::find(entity_types, kind) != entity_types.end();
    };

    std::vector<RecognizedEntity> candidates;
    const char* begin = text.data();
    const char* end = text.data() + text.size();

    for (const auto& rec : recognizers_) {
        if (rec.score < score_threshold || !wanted(rec.kind)) continue;

        for (auto it = std::cregex_iterator(begin, end, rec.regex);
             it != std::cregex_iterator(); ++it) {
            const auto start = static_cast<size_t>(it->position(0));
            const auto length = static_cast<size_t>(it->length(0));
            if (length == 0) continue;

            if (rec.validator && !rec.validator(text.substr(start, length))) {
                rejected_.fetch_add(1, std::memory_order_relaxed);
                continue;
            }
            candidates.push_back(RecognizedEntity{
                .entity_type = entity_kind_to_string(rec.kind),
                .start = start,
                .end = start + length,
                .score = rec.score,
            });
        }
    }

    // Strongest, then longest, claims its span first
    std::ranges::stable_sort(candidates, [](const RecognizedEntity& a, const RecognizedEntity& b) {
        if (a.score != b.score) return a.score > b.score;
        return (a.end - a.start) > (b.end - b.start);
    });

    std::vector<RecognizedEntity> accepted;
    for (auto& candidate : candidates) {
        const bool conflict = std::ranges::any_of(accepted, [&candidate](const RecognizedEntity& e) {
            return overlaps(candidate, e);
        });
        if (!conflict) accepted.push_back(std::move(candidate));
    }

    std::ranges::sort(accepted, {}, &RecognizedEntity::start);
    entities_.fetch_add(accepted.size(), std::memory_order_relaxed);
    return accepted;
}

PatternEntityRecognizer::Stats PatternEntityRecognizer::get_stats() const {
    return {
        .calls = calls_.load(std::memory_order_relaxed),
        .entities = entities_.load(std::memory_order_relaxed),
        .rejected_by_validator = rejected_.load(std::memory_order_relaxed),
    };
}

} // namespace llmfirewall
