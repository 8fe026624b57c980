#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace promptguard {

/**
 * @brief Loads promptguard.toml into a FirewallConfig
 *
 * String values support ${ENV_VAR} expansion (unset variables expand to
 * the empty string). Missing sections keep their defaults; a missing
 * [[policies]] array selects the built-in rule set.
 */
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

    static LoadResult load_from_file(const std::string& config_path);
    static LoadResult load_from_string(const std::string& toml_content);

    /// Every problem found, empty when the config is usable
    static std::vector<std::string> validate_config(const FirewallConfig& config);

private:
    static LoadResult extract_all_sections(const toml::table& root);

    static DetectorConfig extract_detector(const toml::table& root);
    static ScorerConfig extract_scorer(const toml::table& root);
    static AuditConfig extract_audit(const toml::table& root);
    static ConfigWatcherConfig extract_config_watcher(const toml::table& root);
};

} // namespace promptguard
