#include "config/config_loader.hpp"
#include "policy/policy_engine.hpp"
#include "policy/policy_loader.hpp"
#include "core/utils.hpp"

#include <cmath>
#include <cstdlib>
#include <format>
#include <limits>
#include <stdexcept>

using namespace std::string_literals;

namespace promptguard {

// ============================================================================
// TOML Parsing Helpers (env expansion)
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

void expand_env_vars_in_node(toml::node& node);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        expand_env_vars_in_node(val);
    }
}

void expand_env_vars_in_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        auto expanded = expand_env_vars(s->get());
        if (expanded != s->get()) {
            *s = std::move(expanded);
        }
    } else if (auto* t = node.as_table()) {
        expand_env_vars_recursive(*t);
    } else if (auto* a = node.as_array()) {
        for (auto& elem : *a) {
            expand_env_vars_in_node(elem);
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// Integer in [0, max_value] or throw; TOML integers are int64
int64_t non_negative_int(const toml::table& tbl, std::string_view key, int64_t fallback,
                         std::string_view section,
                         int64_t max_value = std::numeric_limits<int64_t>::max()) {
    if (!tbl.contains(key)) return fallback;
    const auto v = tbl[key].value<int64_t>();
    if (!v || *v < 0) {
        throw std::runtime_error(
            std::format("{}.{} must be a non-negative integer", section, key));
    }
    if (*v > max_value) {
        throw std::runtime_error(
            std::format("{}.{} must be at most {}, got {}", section, key, max_value, *v));
    }
    return *v;
}

constexpr int64_t kMaxUint32 = std::numeric_limits<uint32_t>::max();

} // anonymous namespace

// ============================================================================
// Section Extraction
// ============================================================================

DetectorConfig ConfigLoader::extract_detector(const toml::table& root) {
    DetectorConfig cfg;
    const auto* detector = root["detector"].as_table();
    if (!detector) return cfg;
    const auto& d = *detector;

    cfg.max_prompt_length = static_cast<size_t>(
        non_negative_int(d, "max_prompt_length", static_cast<int64_t>(cfg.max_prompt_length),
                         "detector"));
    cfg.encoding_detection = d["encoding_detection"].value_or(true);

    if (const auto* caps = d["category_caps"].as_table()) {
        for (const auto& [key, val] : *caps) {
            const auto category = parse_threat_category(key.str());
            if (!category) {
                throw std::runtime_error(
                    std::format("detector.category_caps: unknown category '{}'", key.str()));
            }
            const auto cap = val.value<double>();
            if (!cap) {
                throw std::runtime_error(
                    std::format("detector.category_caps.{} must be a number", key.str()));
            }
            cfg.category_caps[static_cast<size_t>(*category)] = *cap;
        }
    }
    return cfg;
}

ScorerConfig ConfigLoader::extract_scorer(const toml::table& root) {
    ScorerConfig cfg;
    const auto* scorer = root["scorer"].as_table();
    if (!scorer) return cfg;
    const auto& s = *scorer;

    cfg.enabled = s["enabled"].value_or(false);
    cfg.endpoint = s["endpoint"].value_or(cfg.endpoint);
    cfg.path = s["path"].value_or(cfg.path);
    cfg.api_key = s["api_key"].value_or(""s);
    cfg.timeout_ms = static_cast<uint32_t>(
        non_negative_int(s, "timeout_ms", cfg.timeout_ms, "scorer", kMaxUint32));
    cfg.max_in_flight = static_cast<uint32_t>(
        non_negative_int(s, "max_in_flight", cfg.max_in_flight, "scorer", kMaxUint32));
    cfg.blend = utils::to_lower(s["blend"].value_or(cfg.blend));
    cfg.weight = s["weight"].value_or(cfg.weight);
    return cfg;
}

AuditConfig ConfigLoader::extract_audit(const toml::table& root) {
    AuditConfig cfg;
    const auto* audit = root["audit"].as_table();
    if (!audit) return cfg;
    const auto& a = *audit;

    cfg.enabled = a["enabled"].value_or(true);
    cfg.output_file = a["output_file"].value_or(cfg.output_file);
    cfg.threats_file = a["threats_file"].value_or(cfg.threats_file);
    cfg.batch_flush_interval = std::chrono::milliseconds(
        non_negative_int(a, "batch_flush_interval_ms", cfg.batch_flush_interval.count(), "audit"));
    cfg.integrity_enabled = a["integrity_enabled"].value_or(true);
    cfg.syslog_enabled = a["syslog_enabled"].value_or(false);
    cfg.syslog_ident = a["syslog_ident"].value_or(cfg.syslog_ident);
    cfg.recent_threats_capacity = static_cast<size_t>(
        non_negative_int(a, "recent_threats_capacity",
                         static_cast<int64_t>(cfg.recent_threats_capacity), "audit"));
    return cfg;
}

ConfigWatcherConfig ConfigLoader::extract_config_watcher(const toml::table& root) {
    ConfigWatcherConfig cfg;
    const auto* cw = root["config_watcher"].as_table();
    if (!cw) return cfg;

    cfg.enabled = (*cw)["enabled"].value_or(false);
    cfg.poll_interval_seconds = static_cast<uint32_t>(
        non_negative_int(*cw, "poll_interval_seconds", cfg.poll_interval_seconds, "config_watcher",
                         kMaxUint32));
    return cfg;
}

ConfigLoader::LoadResult ConfigLoader::extract_all_sections(const toml::table& root) {
    FirewallConfig config;
    config.detector = extract_detector(root);
    config.scorer = extract_scorer(root);
    config.audit = extract_audit(root);
    config.config_watcher = extract_config_watcher(root);

    if (root.contains("policies")) {
        auto policies = PolicyLoader::load_from_table(root);
        if (!policies.success) {
            return LoadResult::error(std::move(policies.error_message));
        }
        config.policies = std::move(policies.policies);
        config.has_policies = true;
    }

    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return extract_all_sections(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return extract_all_sections(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const FirewallConfig& config) {
    std::vector<std::string> errors;

    if (config.detector.max_prompt_length == 0) {
        errors.emplace_back("detector.max_prompt_length must be positive");
    }
    for (size_t i = 0; i < kThreatCategoryCount; ++i) {
        const double cap = config.detector.category_caps[i];
        if (!std::isfinite(cap) || cap < 0.0 || cap > kMaxScore) {
            errors.push_back(std::format("detector.category_caps.{} must be in [0,100], got {}",
                threat_category_to_string(static_cast<ThreatCategory>(i)), cap));
        }
    }

    if (config.scorer.blend != "max" && config.scorer.blend != "weighted") {
        errors.push_back(std::format("scorer.blend must be 'max' or 'weighted', got '{}'",
                                     config.scorer.blend));
    }
    if (!std::isfinite(config.scorer.weight) || config.scorer.weight < 0.0 || config.scorer.weight > 1.0) {
        errors.push_back(std::format("scorer.weight must be in [0,1], got {}", config.scorer.weight));
    }
    if (config.scorer.enabled) {
        if (config.scorer.endpoint.empty()) {
            errors.emplace_back("scorer.endpoint required when the scorer is enabled");
        }
        if (config.scorer.timeout_ms == 0) {
            errors.emplace_back("scorer.timeout_ms must be positive");
        }
        if (config.scorer.max_in_flight == 0) {
            errors.emplace_back("scorer.max_in_flight must be positive");
        }
    }

    if (config.audit.enabled) {
        if (config.audit.output_file.empty()) {
            errors.emplace_back("audit.output_file required when audit is enabled");
        }
        if (config.audit.batch_flush_interval.count() == 0) {
            errors.emplace_back("audit.batch_flush_interval_ms must be positive");
        }
    }

    if (config.config_watcher.enabled && config.config_watcher.poll_interval_seconds == 0) {
        errors.emplace_back("config_watcher.poll_interval_seconds must be positive");
    }

    if (config.has_policies) {
        if (auto problem = PolicyEngine::validate(config.policies)) {
            errors.push_back(std::move(*problem));
        }
    }

    return errors;
}

} // namespace promptguard
