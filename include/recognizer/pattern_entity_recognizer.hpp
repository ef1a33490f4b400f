#pragma once

#include "recognizer/ientity_recognizer.hpp"

#include <atomic>
#include <cstdint>
#include <regex>
#include <string>
#include <vector>

namespace llmfirewall {

/**
 * @brief In-process regex recognizer.
 *
 * Covers EMAIL, PHONE, SSN, CREDIT_CARD, IP_ADDRESS, URL and API_KEY.
 * Numeric kinds are validated structurally (Luhn for cards, area/group/serial
 * for SSNs, octet range for IPv4) to keep false positives down. PERSON and
 * LOCATION need an NLP model and are never produced here.
 *
 * Overlapping candidates are resolved by score, then by length: a span is
 * dropped when it overlaps an already accepted, stronger one.
 */
class PatternEntityRecognizer : public IEntityRecognizer {
public:
    PatternEntityRecognizer();

    [[nodiscard]] std::vector<RecognizedEntity> recognize(
        std::string_view text,
        const std::string& language,
        const std::vector<EntityKind>& entity_types,
        double score_threshold) override;

    [[nodiscard]] const char* name() const override { return "pattern"; }

    [[nodiscard]] static bool luhn_validate(std::string_view number);
    [[nodiscard]] static bool validate_ssn(std::string_view value);
    [[nodiscard]] static bool validate_ipv4(std::string_view value);

    struct Stats {
        uint64_t calls;
        uint64_t entities;
        uint64_t rejected_by_validator;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    using Validator = bool (*)(std::string_view);

    struct Recognizer {
        EntityKind kind;
        std::string pattern_name;
        std::regex regex;
        double score;
        Validator validator;    // nullptr: regex match suffices
    };

    std::vector<Recognizer> recognizers_;

    std::atomic<uint64_t> calls_{0};
    std::atomic<uint64_t> entities_{0};
    std::atomic<uint64_t> rejected_{0};
};

} // namespace llmfirewall
