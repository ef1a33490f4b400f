#pragma once

#include "embedding/iembedding_provider.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace llmfirewall {

/**
 * @brief Embedding client for OpenAI-compatible /v1/embeddings servers.
 *
 * Request:  {"model": "...", "input": "..."}
 * Response: {"data": [{"embedding": [ ... ]}], ...}
 *
 * Connection failures and HTTP 429 are retried up to max_retries times;
 * anything else throws EmbeddingError immediately.
 */
class HttpEmbeddingProvider : public IEmbeddingProvider {
public:
    struct Config {
        std::string endpoint = "http://localhost:8080";
        std::string api_key;
        std::string model = "all-MiniLM-L6-v2";
        uint32_t timeout_ms = 2000;
        uint32_t max_retries = 2;
    };

    explicit HttpEmbeddingProvider(Config config);

    [[nodiscard]] std::vector<float> encode(const std::string& text) override;

    [[nodiscard]] std::string model_name() const override { return config_.model; }

    /// Extract data[0].embedding from a response body. Throws EmbeddingError.
    [[nodiscard]] static std::vector<float> parse_response(const std::string& body);

    struct Stats {
        uint64_t requests = 0;
        uint64_t errors = 0;
        uint64_t retries = 0;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    Config config_;

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> errors_{0};
    std::atomic<uint64_t> retries_{0};
};

} // namespace llmfirewall
