#pragma once

#include "recognizer/ientity_recognizer.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace llmfirewall {

/**
 * @brief Client for a Presidio analyzer service.
 *
 * POST {endpoint}/analyze with {"text", "language", "entities",
 * "score_threshold"}; the response is an array of
 * {"entity_type", "start", "end", "score"} whose offsets count code points.
 * They are converted to byte offsets before returning.
 */
class PresidioEntityRecognizer : public IEntityRecognizer {
public:
    struct Config {
        std::string endpoint = "http://localhost:5002";
        uint32_t timeout_ms = 2000;
    };

    explicit PresidioEntityRecognizer(Config config);

    [[nodiscard]] std::vector<RecognizedEntity> recognize(
        std::string_view text,
        const std::string& language,
        const std::vector<EntityKind>& entity_types,
        double score_threshold) override;

    [[nodiscard]] const char* name() const override { return "presidio"; }

    /// Presidio's name for a kind (EMAIL -> EMAIL_ADDRESS, PHONE -> PHONE_NUMBER, ...)
    [[nodiscard]] static const char* presidio_entity_name(EntityKind kind);

    /// Parse an /analyze response body for the given text. Throws RecognizerError.
    [[nodiscard]] static std::vector<RecognizedEntity> parse_response(
        std::string_view text, const std::string& body);

    struct Stats {
        uint64_t requests;
        uint64_t errors;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    Config config_;

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> errors_{0};
};

} // namespace llmfirewall
