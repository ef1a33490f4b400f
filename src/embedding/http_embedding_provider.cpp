#include "embedding/http_embedding_provider.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <nlohmann/json.hpp>

#include <chrono>
#include <format>
#include <thread>

namespace llmfirewall {

using json = nlohmann::json;

HttpEmbeddingProvider::HttpEmbeddingProvider(Config config)
    : config_(std::move(config)) {}

std::vector<float> HttpEmbeddingProvider::parse_response(const std::string& body) {
    const auto doc = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object()) {
        throw EmbeddingError("Embedding response is not a JSON object");
    }

    const auto data = doc.find("data");
    if (data == doc.end() || !data->is_array() || data->empty()) {
        throw EmbeddingError("Embedding response has no data");
    }
    const auto& first = (*data)[0];
    const auto embedding = first.find("embedding");
    if (embedding == first.end() || !embedding->is_array() || embedding->empty()) {
        throw EmbeddingError("Embedding response has no embedding vector");
    }

    std::vector<float> vec;
    vec.reserve(embedding->size());
    for (const auto& v : *embedding) {
        if (!v.is_number()) {
            throw EmbeddingError("Embedding vector contains a non-numeric value");
        }
        vec.push_back(v.get<float>());
    }
    return vec;
}

std::vector<float> HttpEmbeddingProvider::encode(const std::string& text) {
    requests_.fetch_add(1, std::memory_order_relaxed);

    if (config_.endpoint.empty()) {
        errors_.fetch_add(1, std::memory_order_relaxed);
        throw EmbeddingError("No embedding endpoint configured");
    }

    const json request = {{"model", config_.model}, {"input", text}};
    const auto body = request.dump();

    httplib::Client cli(config_.endpoint);
    cli.set_connection_timeout(std::chrono::milliseconds(config_.timeout_ms));
    cli.set_read_timeout(std::chrono::milliseconds(config_.timeout_ms));
    cli.set_write_timeout(std::chrono::milliseconds(config_.timeout_ms));

    httplib::Headers headers;
    if (!config_.api_key.empty()) {
        headers.emplace("Authorization", "Bearer " + config_.api_key);
    }

    for (uint32_t attempt = 0; attempt <= config_.max_retries; ++attempt) {
        if (attempt > 0) retries_.fetch_add(1, std::memory_order_relaxed);

        const auto res = cli.Post("/v1/embeddings", headers, body, "application/json");

        if (!res) {
            if (attempt < config_.max_retries) continue;
            errors_.fetch_add(1, std::memory_order_relaxed);
            throw EmbeddingError(std::format("Embedding request failed: {}",
                httplib::to_string(res.error())));
        }

        if (res->status == httplib::StatusCode::TooManyRequests_429 &&
            attempt < config_.max_retries) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100 * (attempt + 1)));
            continue;
        }

        if (res->status != httplib::StatusCode::OK_200) {
            errors_.fetch_add(1, std::memory_order_relaxed);
            throw EmbeddingError(std::format("Embedding API error: HTTP {} - {}",
                res->status, res->body.substr(0, 200)));
        }

        try {
            return parse_response(res->body);
        } catch (const EmbeddingError&) {
            errors_.fetch_add(1, std::memory_order_relaxed);
            throw;
        }
    }

    errors_.fetch_add(1, std::memory_order_relaxed);
    throw EmbeddingError("Embedding request: max retries exceeded");
}

HttpEmbeddingProvider::Stats HttpEmbeddingProvider::get_stats() const {
    return {
        .requests = requests_.load(std::memory_order_relaxed),
        .errors = errors_.load(std::memory_order_relaxed),
        .retries = retries_.load(std::memory_order_relaxed),
    };
}

} // namespace llmfirewall
