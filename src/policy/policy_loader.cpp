#include "policy/policy_loader.hpp"
#include "policy/policy_engine.hpp"
#include "core/utils.hpp"

#include <cstdint>
#include <format>
#include <fstream>

using namespace std::string_literals;

namespace promptguard {

// Constexpr config keys (used 2+ times in policy parsing)
static constexpr std::string_view kPolicies   = "policies";
static constexpr std::string_view kAction     = "action";
static constexpr std::string_view kSeverity   = "severity";
static constexpr std::string_view kThreshold  = "threshold";
static constexpr std::string_view kCategories = "categories";
static constexpr std::string_view kPriority   = "priority";

// ============================================================================
// Public API - Load from file
// ============================================================================

PolicyLoader::LoadResult PolicyLoader::load_from_file(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        return LoadResult::error(std::format("Cannot open config file: {}", config_path));
    }

    std::string buffer((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
    return load_from_string(buffer);
}

// ============================================================================
// Public API - Load from string
// ============================================================================

PolicyLoader::LoadResult PolicyLoader::load_from_string(const std::string& toml_content) {
    try {
        return load_from_table(toml::parse(toml_content));
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("TOML parse error: {}", e.what()));
    }
}

// ============================================================================
// Public API - Load from parsed table
// ============================================================================

PolicyLoader::LoadResult PolicyLoader::load_from_table(const toml::table& root) {
    std::vector<Policy> policies;

    try {
        const auto* policies_array = root[kPolicies].as_array();
        if (!policies_array) {
            return LoadResult::error("No [[policies]] array found in configuration");
        }

        for (const auto& elem : *policies_array) {
            const auto* node = elem.as_table();
            if (!node) continue;
            const auto& tbl = *node;

            Policy policy;
            policy.declaration_index = policies.size();

            // Required: name
            policy.name = tbl["name"].value_or(""s);
            if (policy.name.empty()) {
                return LoadResult::error(
                    std::format("Policy #{} must have a name", policy.declaration_index));
            }

            policy.enabled = tbl["enabled"].value_or(true);

            // Required: action
            const auto action_str = tbl[kAction].value<std::string>();
            if (!action_str) {
                return LoadResult::error(std::format("Policy '{}': missing action", policy.name));
            }
            const auto action = parse_action(*action_str);
            if (!action) {
                return LoadResult::error(
                    std::format("Policy '{}': Invalid action '{}'", policy.name, *action_str));
            }
            policy.action = *action;

            // Required: severity
            const auto severity_str = tbl[kSeverity].value<std::string>();
            if (!severity_str) {
                return LoadResult::error(std::format("Policy '{}': missing severity", policy.name));
            }
            const auto severity = parse_threat_level(*severity_str);
            if (!severity) {
                return LoadResult::error(
                    std::format("Policy '{}': Invalid severity '{}'", policy.name, *severity_str));
            }
            policy.severity = *severity;

            // Optional: threshold (fraction or score)
            if (tbl.contains(kThreshold)) {
                const auto threshold = tbl[kThreshold].value<double>();
                if (!threshold || !PolicyEngine::normalize_threshold(*threshold)) {
                    return LoadResult::error(
                        std::format("Policy '{}': threshold must be a number in [0,100]",
                                    policy.name));
                }
                policy.threshold = *threshold;
            }

            // Optional: categories filter
            if (tbl.contains(kCategories)) {
                const auto* cat_arr = tbl[kCategories].as_array();
                if (!cat_arr) {
                    return LoadResult::error(
                        std::format("Policy '{}': categories must be an array", policy.name));
                }
                for (const auto& cat : *cat_arr) {
                    const auto* s = cat.as_string();
                    const auto category = s ? parse_threat_category(s->get()) : std::nullopt;
                    if (!category) {
                        return LoadResult::error(std::format(
                            "Policy '{}': Invalid category '{}'", policy.name,
                            s ? s->get() : "<non-string>"s));
                    }
                    if (category_mask::test(policy.categories, *category)) {
                        return LoadResult::error(std::format(
                            "Policy '{}': duplicate category '{}'", policy.name,
                            threat_category_to_string(*category)));
                    }
                    policy.categories |= category_mask::bit(*category);
                }
            }

            // Optional: priority (defaults to declaration order)
            if (tbl.contains(kPriority)) {
                const auto priority = tbl[kPriority].value<int64_t>();
                if (!priority || *priority < 0 || *priority > INT32_MAX) {
                    return LoadResult::error(
                        std::format("Policy '{}': priority must be a non-negative integer",
                                    policy.name));
                }
                policy.priority = static_cast<int>(*priority);
            }

            policy.description = tbl["description"].value_or(""s);

            policies.emplace_back(std::move(policy));
        }

        return LoadResult::ok(std::move(policies));

    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Error parsing policies: {}", e.what()));
    }
}

} // namespace promptguard
