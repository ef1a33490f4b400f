#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace llmfirewall {

// ============================================================================
// Configuration Types
// ============================================================================

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 50051;
    int thread_pool_size = 8;
    int64_t max_content_length = 10240;  // bytes
    int64_t min_content_length = 1;      // bytes
    std::string service_version = "1.0.0";
};

struct LoggingConfig {
    std::string level = "info";
};

struct FeatureFlagsConfig {
    bool pii_detection = true;
    bool prompt_injection = true;
    bool anonymization = false;
    bool ml_jailbreak = false;
};

struct PiiConfig {
    std::vector<std::string> entities = {
        "EMAIL", "PHONE_NUMBER", "CREDIT_CARD", "SSN", "IP_ADDRESS", "PERSON", "LOCATION",
    };
    double confidence_threshold = 0.7;
    std::string language = "en";
    std::string recognizer = "pattern";     // pattern | presidio
    std::string endpoint;                   // presidio analyzer base URL
    int64_t timeout_ms = 2000;
};

struct CustomRuleConfig {
    std::string name;
    std::string family = "direct";          // direct | jailbreak
    std::string pattern;
    std::string category;
    double confidence = 0.9;
};

struct PromptInjectionConfig {
    double special_char_threshold = 0.1;
    std::vector<CustomRuleConfig> rules;
};

struct MlJailbreakConfig {
    double threshold = 0.5;
    std::string endpoint;
    std::string api_key;
    std::string model = "all-MiniLM-L6-v2";
    int64_t timeout_ms = 2000;
    std::vector<std::string> unsafe_examples;   // empty: built-in set
    std::vector<std::string> safe_examples;     // empty: built-in set
};

struct CacheBackendConfig {
    std::string backend = "memory";         // memory | redis
    std::string host = "127.0.0.1";
    int port = 6379;
    std::string password;
    int db = 0;
    int64_t timeout_ms = 200;
    int64_t max_entries = 100000;
};

struct AnonymizationConfig {
    int64_t mapping_ttl_seconds = 3600;
    CacheBackendConfig cache;
};

struct FirewallConfig {
    ServerConfig server;
    LoggingConfig logging;
    FeatureFlagsConfig features;
    PiiConfig pii;
    PromptInjectionConfig prompt_injection;
    MlJailbreakConfig ml_jailbreak;
    AnonymizationConfig anonymization;
};

} // namespace llmfirewall
