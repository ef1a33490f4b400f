#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace llmfirewall {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
//
// String values support ${ENV_VAR} expansion. A top-level
// include = "file.toml" (or an array of files) is merged underneath the
// including file, which wins on conflicts.
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        FirewallConfig config;

        static LoadResult ok(FirewallConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to firewall.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check a config against the runtime constraints
     * @return One message per violation; empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const FirewallConfig& config);

private:
    static ServerConfig extract_server(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static FeatureFlagsConfig extract_features(const toml::table& root);
    static PiiConfig extract_pii(const toml::table& root);
    static PromptInjectionConfig extract_prompt_injection(const toml::table& root);
    static MlJailbreakConfig extract_ml_jailbreak(const toml::table& root);
    static AnonymizationConfig extract_anonymization(const toml::table& root);

    static FirewallConfig extract_all_sections(const toml::table& tbl);
    static LoadResult validate_and_return(FirewallConfig config);
};

} // namespace llmfirewall
