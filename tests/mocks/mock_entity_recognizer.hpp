#pragma once

#include "core/error.hpp"
#include "recognizer/ientity_recognizer.hpp"

#include <atomic>
#include <string>
#include <vector>

namespace llmfirewall::testing {

/**
 * @brief Recognizer returning a preset entity list, or failing on demand
 */
class MockEntityRecognizer : public IEntityRecognizer {
public:
    explicit MockEntityRecognizer(std::vector<RecognizedEntity> entities = {})
        : entities_(std::move(entities)) {}

    [[nodiscard]] std::vector<RecognizedEntity> recognize(
        std::string_view /*text*/,
        const std::string& language,
        const std::vector<EntityKind>& /*entity_types*/,
        double score_threshold) override {
        call_count_.fetch_add(1, std::memory_order_relaxed);
        last_language_ = language;
        last_threshold_ = score_threshold;
        if (should_throw_) {
            throw RecognizerError("Mock recognizer unavailable");
        }
        return entities_;
    }

    [[nodiscard]] const char* name() const override { return "mock"; }

    void set_entities(std::vector<RecognizedEntity> entities) { entities_ = std::move(entities); }
    void set_should_throw(bool v) { should_throw_ = v; }

    [[nodiscard]] uint64_t call_count() const { return call_count_.load(std::memory_order_relaxed); }
    [[nodiscard]] const std::string& last_language() const { return last_language_; }
    [[nodiscard]] double last_threshold() const { return last_threshold_; }

private:
    std::vector<RecognizedEntity> entities_;
    bool should_throw_ = false;
    std::string last_language_;
    double last_threshold_ = 0.0;
    std::atomic<uint64_t> call_count_{0};
};

} // namespace llmfirewall::testing
