#include "policy/policy_engine.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <unordered_set>

namespace promptguard {

namespace {

// Lowest score a policy can match, combining its severity band with its
// threshold. `exclusive` marks the critical band, whose floor is not itself
// critical.
struct ScoreFloor {
    double value;
    bool exclusive;
};

ScoreFloor score_floor(const Policy& p) {
    double band = 0.0;
    switch (p.severity) {
        case ThreatLevel::SAFE:     band = 0.0; break;
        case ThreatLevel::LOW:      band = kLowFloor; break;
        case ThreatLevel::MEDIUM:   band = kMediumFloor; break;
        case ThreatLevel::HIGH:     band = kHighFloor; break;
        case ThreatLevel::CRITICAL:
            if (p.threshold > kCriticalAbove) return {p.threshold, false};
            return {kCriticalAbove, true};
    }
    return {std::max(band, p.threshold), false};
}

// Earlier policy `first` makes `later` unreachable: anything `later` would
// match, `first` matches too.
bool shadows(const Policy& first, const Policy& later) {
    const auto a = score_floor(first);
    const auto b = score_floor(later);
    if (a.value > b.value) return false;
    if (a.value == b.value && a.exclusive && !b.exclusive) return false;
    if (!first.has_category_filter()) return true;
    if (!later.has_category_filter()) return false;
    return (first.categories & later.categories) == later.categories;
}

// Normalized, numbered, evaluation-ordered copy of the enabled policies.
// Assumes validate() has passed.
std::vector<Policy> build_order(const std::vector<Policy>& policies) {
    std::vector<Policy> ordered;
    ordered.reserve(policies.size());
    for (size_t i = 0; i < policies.size(); ++i) {
        if (!policies[i].enabled) continue;
        Policy p = policies[i];
        p.declaration_index = i;
        p.threshold = PolicyEngine::normalize_threshold(p.threshold).value_or(0.0);
        ordered.push_back(std::move(p));
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const Policy& a, const Policy& b) {
        if (a.effective_priority() != b.effective_priority()) {
            return a.effective_priority() < b.effective_priority();
        }
        return a.declaration_index < b.declaration_index;
    });
    return ordered;
}

} // anonymous namespace

PolicyEngine::PolicyEngine() {
    const auto defaults = default_policies();
    auto set = std::make_shared<RuleSet>();
    set->policies = build_order(defaults);
    set->declared = defaults.size();
    set->version = next_version_++;
    rules_.store(std::move(set), std::memory_order_release);
}

// ============================================================================
// Defaults
// ============================================================================

std::vector<Policy> PolicyEngine::default_policies() {
    auto make = [](const char* name, Action action, ThreatLevel severity,
                   double threshold, const char* description) {
        Policy p;
        p.name = name;
        p.action = action;
        p.severity = severity;
        p.threshold = threshold;
        p.description = description;
        return p;
    };

    return {
        make("block_critical_threats", Action::BLOCK, ThreatLevel::CRITICAL, 0.85,
             "Block critical threats immediately"),
        make("sanitize_high_threats", Action::SANITIZE, ThreatLevel::HIGH, 0.65,
             "Sanitize high-risk prompts"),
        make("log_medium_threats", Action::LOG, ThreatLevel::MEDIUM, 0.40,
             "Log medium threats for review"),
        make("allow_safe_prompts", Action::ALLOW, ThreatLevel::SAFE, 0.0,
             "Allow safe prompts"),
    };
}

// ============================================================================
// Validation
// ============================================================================

std::optional<double> PolicyEngine::normalize_threshold(double raw) {
    if (!std::isfinite(raw) || raw < 0.0 || raw > kMaxScore) {
        return std::nullopt;
    }
    return raw <= 1.0 ? raw * 100.0 : raw;
}

std::optional<std::string> PolicyEngine::validate(const std::vector<Policy>& policies) {
    std::unordered_set<std::string> names;
    for (const auto& p : policies) {
        if (p.name.empty()) {
            return "Policy with empty name";
        }
        if (!names.insert(p.name).second) {
            return std::format("Duplicate policy name '{}'", p.name);
        }
        if (!normalize_threshold(p.threshold)) {
            return std::format("Policy '{}': threshold {} outside [0,100]", p.name, p.threshold);
        }
        if (p.priority && *p.priority < 0) {
            return std::format("Policy '{}': negative priority {}", p.name, *p.priority);
        }
    }

    const auto ordered = build_order(policies);
    for (size_t later = 1; later < ordered.size(); ++later) {
        for (size_t first = 0; first < later; ++first) {
            const auto& a = ordered[first];
            const auto& b = ordered[later];
            if (a.action != b.action && shadows(a, b)) {
                return std::format(
                    "Policy '{}' ({}) can never match: shadowed by earlier policy '{}' ({})",
                    b.name, action_to_string(b.action), a.name, action_to_string(a.action));
            }
        }
    }
    return std::nullopt;
}

// ============================================================================
// Activation (RCU)
// ============================================================================

Result<size_t> PolicyEngine::activate(const std::vector<Policy>& policies, const char* verb) {
    std::lock_guard<std::mutex> lock(reload_mutex_);

    if (auto problem = validate(policies)) {
        utils::log::error(std::format("Policy {} rejected: {}", verb, *problem));
        return Result<size_t>::error(ErrorCategory::POLICY_ERROR, std::move(*problem));
    }

    auto set = std::make_shared<RuleSet>();
    set->policies = build_order(policies);
    set->declared = policies.size();
    set->version = next_version_++;

    const size_t count = set->policies.size();
    const uint64_t version = set->version;
    rules_.store(std::move(set), std::memory_order_release);

    utils::log::info(std::format("Policy {}: {} active policies (version {})",
                                 verb, count, version));
    return Result<size_t>::ok(count);
}

Result<size_t> PolicyEngine::load_policies(const std::vector<Policy>& policies) {
    return activate(policies, "load");
}

Result<size_t> PolicyEngine::reload_policies(const std::vector<Policy>& policies) {
    return activate(policies, "reload");
}

// ============================================================================
// Evaluation
// ============================================================================

PolicyEvaluationResult PolicyEngine::evaluate(const ThreatAssessment& assessment) const {
    // Load current rule set (RCU read)
    const auto rules = rules_.load(std::memory_order_acquire);

    if (rules) {
        for (const auto& policy : rules->policies) {
            if (policy.matches(assessment)) {
                return PolicyEvaluationResult(
                    policy.action,
                    policy.name,
                    std::format("Score {:.2f} ({}) matched policy '{}'",
                                assessment.score, threat_level_to_string(assessment.level),
                                policy.name));
            }
        }
    }

    return PolicyEvaluationResult(
        Action::ALLOW,
        kDefaultAllowPolicy,
        "No policy matched - default allow");
}

size_t PolicyEngine::policy_count() const {
    const auto rules = rules_.load(std::memory_order_acquire);
    return rules ? rules->policies.size() : 0;
}

uint64_t PolicyEngine::version() const {
    const auto rules = rules_.load(std::memory_order_acquire);
    return rules ? rules->version : 0;
}

std::shared_ptr<const PolicyEngine::RuleSet> PolicyEngine::snapshot() const {
    return rules_.load(std::memory_order_acquire);
}

} // namespace promptguard
