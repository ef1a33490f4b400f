#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace llmfirewall {

/**
 * @brief Error categories for the firewall
 */
enum class ErrorCategory {
    NONE,
    INVALID_INPUT,
    CONFIG_ERROR,
    DETECTOR_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:           return "none";
        case ErrorCategory::INVALID_INPUT:  return "invalid_input";
        case ErrorCategory::CONFIG_ERROR:   return "config_error";
        case ErrorCategory::DETECTOR_ERROR: return "detector_error";
        case ErrorCategory::INTERNAL_ERROR: return "internal_error";
    }
    return "unknown";
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

// ============================================================================
// Collaborator failures
//
// Thrown by adapters (cache, embedding, recognizer). The pipeline converts
// them into degraded detector outcomes; they never reach the caller.
// ============================================================================

class CacheError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class EmbeddingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class RecognizerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace llmfirewall
