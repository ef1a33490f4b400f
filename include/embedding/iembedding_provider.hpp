#pragma once

#include <string>
#include <vector>

namespace llmfirewall {

/**
 * @brief Text embedding function.
 *
 * encode() is deterministic for equal input and has no side effects.
 * Every call for one provider returns vectors of the same dimension.
 * Failures (transport, bad response) throw EmbeddingError.
 */
class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = default;

    [[nodiscard]] virtual std::vector<float> encode(const std::string& text) = 0;

    [[nodiscard]] virtual std::string model_name() const = 0;
};

} // namespace llmfirewall
