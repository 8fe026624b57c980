#pragma once

#include "policy/policy_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace promptguard {

/**
 * @brief Policy loader from TOML configuration
 *
 * Parses the [[policies]] array. Per-policy checks happen here (known
 * action/severity/category names, threshold range, non-negative priority,
 * no repeated category); rule-set checks such as unique names and
 * shadowing happen in PolicyEngine::validate at activation.
 */
class PolicyLoader {
public:
    /**
     * @brief Load result
     */
    struct LoadResult {
        bool success;
        std::string error_message;
        std::vector<Policy> policies;

        static LoadResult ok(std::vector<Policy> policies_vec) {
            LoadResult result;
            result.success = true;
            result.policies = std::move(policies_vec);
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
     * @brief Load policies from TOML file
     * @param config_path Path to promptguard.toml
     */
    static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load policies from TOML string
     */
    static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Load policies from an already parsed document
     */
    static LoadResult load_from_table(const toml::table& root);
};

} // namespace promptguard
