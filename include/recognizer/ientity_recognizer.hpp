#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace llmfirewall {

/**
 * @brief One entity span reported by a recognizer.
 *
 * entity_type is the recognizer's own name for the kind (EMAIL_ADDRESS,
 * PHONE_NUMBER, ...); map it with entity_kind_from_recognizer().
 * start/end are byte offsets into the analyzed text.
 */
struct RecognizedEntity {
    std::string entity_type;
    size_t start = 0;
    size_t end = 0;
    double score = 0.0;
};

/**
 * @brief Named-entity recognition step of the PII detector.
 *
 * Implementations return only entities of the requested kinds whose score
 * is at least score_threshold. Failures throw RecognizerError.
 */
class IEntityRecognizer {
public:
    virtual ~IEntityRecognizer() = default;

    [[nodiscard]] virtual std::vector<RecognizedEntity> recognize(
        std::string_view text,
        const std::string& language,
        const std::vector<EntityKind>& entity_types,
        double score_threshold) = 0;

    [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace llmfirewall
