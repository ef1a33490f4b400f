#pragma once

#include "core/types.hpp"
#include "embedding/iembedding_provider.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace llmfirewall {

/**
 * @brief Result of one semantic scoring pass.
 */
struct SemanticScore {
    DetectorOutcome outcome;
    SemanticMetadata metadata;
};

/**
 * @brief Embedding-similarity jailbreak scorer.
 *
 * Two exemplar sets (unsafe, safe) are embedded once at construction and
 * L2-normalized. For an input the risk is
 *
 *     max_unsafe_similarity - 0.5 * max_safe_similarity
 *
 * and a single ML_JAILBREAK finding spanning the whole input is emitted when
 * risk > threshold (strictly). Without a provider, or when exemplar embedding
 * fails, the scorer is disabled and every call returns no findings with
 * confidence 1.0 and method "disabled".
 */
class SemanticRiskScorer {
public:
    struct Config {
        bool enabled = false;
        double threshold = 0.5;
        std::vector<std::string> unsafe_examples;   // empty: built-in set
        std::vector<std::string> safe_examples;     // empty: built-in set
    };

    SemanticRiskScorer(Config config, std::shared_ptr<IEmbeddingProvider> provider);

    [[nodiscard]] SemanticScore score(std::string_view text) const;

    /// True when enabled by config and the exemplar sets are embedded.
    [[nodiscard]] bool is_enabled() const { return ready_; }

    [[nodiscard]] double threshold() const { return config_.threshold; }
    [[nodiscard]] const std::string& model_version() const { return model_version_; }
    [[nodiscard]] size_t unsafe_exemplar_count() const { return unsafe_.size(); }
    [[nodiscard]] size_t safe_exemplar_count() const { return safe_.size(); }

    [[nodiscard]] static const std::vector<std::string>& default_unsafe_examples();
    [[nodiscard]] static const std::vector<std::string>& default_safe_examples();

    /// Scale v to unit length in place. Returns false for an all-zero vector.
    static bool l2_normalize(std::vector<float>& v);

    /// Dot product of two unit vectors of equal dimension.
    [[nodiscard]] static double cosine_similarity(const std::vector<float>& a,
                                                  const std::vector<float>& b);

    struct Stats {
        uint64_t scored;
        uint64_t flagged;
        uint64_t errors;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    bool embed_exemplars();
    [[nodiscard]] std::vector<float> embed(const std::string& text) const;
    [[nodiscard]] double max_similarity(const std::vector<float>& query,
                                        const std::vector<std::vector<float>>& set) const;

    Config config_;
    std::shared_ptr<IEmbeddingProvider> provider_;
    std::string model_version_;
    bool ready_ = false;
    size_t dimension_ = 0;

    std::vector<std::vector<float>> unsafe_;
    std::vector<std::vector<float>> safe_;

    mutable std::atomic<uint64_t> scored_{0};
    mutable std::atomic<uint64_t> flagged_{0};
    mutable std::atomic<uint64_t> errors_{0};
};

} // namespace llmfirewall
