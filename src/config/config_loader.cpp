#include "config/config_loader.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"
#include "security/pattern_rule_engine.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace llmfirewall {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Resolve include directives in a parsed TOML table.
 */
void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10, possible circular include");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Merge: included is base, root is overlay (main wins)
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

ServerConfig ConfigLoader::extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or(cfg.host);
    cfg.port = static_cast<int>(s["port"].value_or(int64_t{cfg.port}));
    cfg.thread_pool_size = static_cast<int>(s["threads"].value_or(int64_t{cfg.thread_pool_size}));
    cfg.max_content_length = s["max_content_length"].value_or(cfg.max_content_length);
    cfg.min_content_length = s["min_content_length"].value_or(cfg.min_content_length);
    cfg.service_version = s["service_version"].value_or(cfg.service_version);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

FeatureFlagsConfig ConfigLoader::extract_features(const toml::table& root) {
    FeatureFlagsConfig cfg;
    const auto* feat = root["features"].as_table();
    if (!feat) return cfg;

    cfg.pii_detection    = (*feat)["pii_detection"].value_or(cfg.pii_detection);
    cfg.prompt_injection = (*feat)["prompt_injection"].value_or(cfg.prompt_injection);
    cfg.anonymization    = (*feat)["anonymization"].value_or(cfg.anonymization);
    cfg.ml_jailbreak     = (*feat)["ml_jailbreak"].value_or(cfg.ml_jailbreak);
    return cfg;
}

PiiConfig ConfigLoader::extract_pii(const toml::table& root) {
    PiiConfig cfg;
    const auto* pii = root["pii"].as_table();
    if (!pii) return cfg;
    const auto& p = *pii;

    if (p["entities"].is_array()) {
        cfg.entities = toml_string_array(p, "entities");
    }
    cfg.confidence_threshold = p["confidence_threshold"].value_or(cfg.confidence_threshold);
    cfg.language = p["language"].value_or(cfg.language);
    cfg.recognizer = p["recognizer"].value_or(cfg.recognizer);
    cfg.endpoint = p["endpoint"].value_or(cfg.endpoint);
    cfg.timeout_ms = p["timeout_ms"].value_or(cfg.timeout_ms);
    return cfg;
}

PromptInjectionConfig ConfigLoader::extract_prompt_injection(const toml::table& root) {
    PromptInjectionConfig cfg;
    const auto* pi = root["prompt_injection"].as_table();
    if (!pi) return cfg;

    cfg.special_char_threshold = (*pi)["special_char_threshold"].value_or(cfg.special_char_threshold);

    if (const auto* rules = (*pi)["rules"].as_array()) {
        cfg.rules.reserve(rules->size());
        for (const auto& elem : *rules) {
            const auto* r = elem.as_table();
            if (!r) continue;

            CustomRuleConfig rule;
            rule.name = (*r)["name"].value_or(std::format("custom_{}", cfg.rules.size()));
            rule.family = (*r)["family"].value_or(rule.family);
            rule.pattern = (*r)["pattern"].value_or(""s);
            rule.category = (*r)["category"].value_or(""s);
            rule.confidence = (*r)["confidence"].value_or(rule.confidence);
            cfg.rules.emplace_back(std::move(rule));
        }
    }
    return cfg;
}

MlJailbreakConfig ConfigLoader::extract_ml_jailbreak(const toml::table& root) {
    MlJailbreakConfig cfg;
    const auto* ml = root["ml_jailbreak"].as_table();
    if (!ml) return cfg;
    const auto& m = *ml;

    cfg.threshold = m["threshold"].value_or(cfg.threshold);
    cfg.endpoint = m["endpoint"].value_or(""s);
    cfg.api_key = m["api_key"].value_or(""s);
    cfg.model = m["model"].value_or(cfg.model);
    cfg.timeout_ms = m["timeout_ms"].value_or(cfg.timeout_ms);
    cfg.unsafe_examples = toml_string_array(m, "unsafe_examples");
    cfg.safe_examples = toml_string_array(m, "safe_examples");
    return cfg;
}

AnonymizationConfig ConfigLoader::extract_anonymization(const toml::table& root) {
    AnonymizationConfig cfg;
    const auto* anon = root["anonymization"].as_table();
    if (!anon) return cfg;

    cfg.mapping_ttl_seconds = (*anon)["mapping_ttl_seconds"].value_or(cfg.mapping_ttl_seconds);

    if (const auto* cache = (*anon)["cache"].as_table()) {
        const auto& c = *cache;
        auto& cc = cfg.cache;
        cc.backend = utils::to_lower(c["backend"].value_or(cc.backend));
        cc.host = c["host"].value_or(cc.host);
        cc.port = static_cast<int>(c["port"].value_or(int64_t{cc.port}));
        cc.password = c["password"].value_or(""s);
        cc.db = static_cast<int>(c["db"].value_or(int64_t{cc.db}));
        cc.timeout_ms = c["timeout_ms"].value_or(cc.timeout_ms);
        cc.max_entries = c["max_entries"].value_or(cc.max_entries);
    }
    return cfg;
}

// ---- Shared extraction + validation ----------------------------------------

FirewallConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    FirewallConfig config;
    config.server = extract_server(tbl);
    config.logging = extract_logging(tbl);
    config.features = extract_features(tbl);
    config.pii = extract_pii(tbl);
    config.prompt_injection = extract_prompt_injection(tbl);
    config.ml_jailbreak = extract_ml_jailbreak(tbl);
    config.anonymization = extract_anonymization(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(FirewallConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const FirewallConfig& config) {
    std::vector<std::string> errors;

    // ---- server ----
    if (!utils::in_range<1, 65535>(config.server.port)) {
        errors.push_back(std::format("server.port must be 1-65535, got {}", config.server.port));
    }
    if (config.server.thread_pool_size <= 0) {
        errors.push_back(std::format("server.threads must be > 0, got {}", config.server.thread_pool_size));
    }
    if (config.server.min_content_length <= 0) {
        errors.push_back(std::format("server.min_content_length must be > 0, got {}",
            config.server.min_content_length));
    }
    if (config.server.max_content_length > static_cast<int64_t>(PatternRuleEngine::kMaxTextLength)) {
        errors.push_back(std::format("server.max_content_length must be <= {}, got {}",
            PatternRuleEngine::kMaxTextLength, config.server.max_content_length));
    }
    if (config.server.min_content_length > config.server.max_content_length) {
        errors.push_back(std::format(
            "server.min_content_length ({}) > max_content_length ({})",
            config.server.min_content_length, config.server.max_content_length));
    }

    // ---- logging ----
    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level '{}' is not one of debug, info, warn, error",
            config.logging.level));
    }

    // ---- pii ----
    for (const auto& name : config.pii.entities) {
        if (!parse_entity_kind(name)) {
            errors.push_back(std::format("pii.entities contains unknown entity type '{}'", name));
        }
    }
    if (!utils::in_unit_interval(config.pii.confidence_threshold)) {
        errors.push_back(std::format("pii.confidence_threshold must be within [0, 1], got {}",
            config.pii.confidence_threshold));
    }
    if (config.pii.recognizer != "pattern" && config.pii.recognizer != "presidio") {
        errors.push_back(std::format("pii.recognizer must be 'pattern' or 'presidio', got '{}'",
            config.pii.recognizer));
    }
    if (config.features.pii_detection && config.pii.recognizer == "presidio" &&
        config.pii.endpoint.empty()) {
        errors.push_back("pii.endpoint required when the presidio recognizer is used");
    }
    if (config.pii.timeout_ms <= 0) {
        errors.push_back("pii.timeout_ms must be > 0");
    }

    // ---- prompt_injection ----
    if (!utils::in_unit_interval(config.prompt_injection.special_char_threshold)) {
        errors.push_back(std::format("prompt_injection.special_char_threshold must be within [0, 1], got {}",
            config.prompt_injection.special_char_threshold));
    }
    for (size_t i = 0; i < config.prompt_injection.rules.size(); ++i) {
        const auto& rule = config.prompt_injection.rules[i];
        if (rule.pattern.empty()) {
            errors.push_back(std::format("prompt_injection.rules[{}].pattern must not be empty", i));
        }
        if (!parse_rule_family(rule.family)) {
            errors.push_back(std::format("prompt_injection.rules[{}].family '{}' must be 'direct' or 'jailbreak'",
                i, rule.family));
        }
        if (!utils::in_unit_interval(rule.confidence)) {
            errors.push_back(std::format("prompt_injection.rules[{}].confidence must be within [0, 1], got {}",
                i, rule.confidence));
        }
    }

    // ---- ml_jailbreak ----
    if (!utils::in_unit_interval(config.ml_jailbreak.threshold)) {
        errors.push_back(std::format("ml_jailbreak.threshold must be within [0, 1], got {}",
            config.ml_jailbreak.threshold));
    }
    if (config.features.ml_jailbreak && config.ml_jailbreak.endpoint.empty()) {
        errors.push_back("ml_jailbreak.endpoint required when ml_jailbreak is enabled");
    }
    if (config.ml_jailbreak.timeout_ms <= 0) {
        errors.push_back("ml_jailbreak.timeout_ms must be > 0");
    }

    // ---- anonymization ----
    const auto& anon = config.anonymization;
    if (anon.mapping_ttl_seconds <= 0) {
        errors.push_back(std::format("anonymization.mapping_ttl_seconds must be > 0, got {}",
            anon.mapping_ttl_seconds));
    }
    if (anon.cache.backend != "memory" && anon.cache.backend != "redis") {
        errors.push_back(std::format("anonymization.cache.backend must be 'memory' or 'redis', got '{}'",
            anon.cache.backend));
    }
    if (anon.cache.backend == "redis") {
        if (anon.cache.host.empty()) {
            errors.push_back("anonymization.cache.host required for the redis backend");
        }
        if (!utils::in_range<1, 65535>(anon.cache.port)) {
            errors.push_back(std::format("anonymization.cache.port must be 1-65535, got {}", anon.cache.port));
        }
        if (anon.cache.db < 0) {
            errors.push_back("anonymization.cache.db must be >= 0");
        }
        if (anon.cache.timeout_ms <= 0) {
            errors.push_back("anonymization.cache.timeout_ms must be > 0");
        }
    }
    if (anon.cache.max_entries <= 0) {
        errors.push_back("anonymization.cache.max_entries must be > 0");
    }

    return errors;
}

} // namespace llmfirewall
