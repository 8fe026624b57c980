#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "policy/policy_types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace promptguard {

/**
 * @brief Policy Engine - maps a threat assessment to an action
 *
 * Resolution algorithm:
 * 1. Active policies are sorted once at activation by
 *    (priority asc, declaration index asc); disabled policies are dropped
 * 2. The first policy whose severity, threshold and category filter all
 *    match the assessment decides
 * 3. No match → ALLOW under "default_allow"
 *
 * Activation is all-or-nothing: a rule set that fails validation is
 * rejected and the previously active set keeps serving.
 *
 * Thread-safety: Hot-reloadable via RCU (atomic shared_ptr). Readers
 * never block; reloads are serialized by reload_mutex_.
 */
class PolicyEngine {
public:
    /// Immutable, evaluation-ordered snapshot
    struct RuleSet {
        std::vector<Policy> policies;     // Enabled only, in evaluation order
        size_t declared = 0;              // Policies supplied, disabled included
        uint64_t version = 0;
    };

    /**
     * @brief Construct with the built-in default rule set active
     */
    PolicyEngine();

    /**
     * @brief Validate and activate a rule set
     * @return Number of enabled policies, or POLICY_ERROR (previous set kept)
     */
    [[nodiscard]] Result<size_t> load_policies(const std::vector<Policy>& policies);

    /**
     * @brief Hot reload (RCU update); same contract as load_policies
     */
    [[nodiscard]] Result<size_t> reload_policies(const std::vector<Policy>& policies);

    [[nodiscard]] PolicyEvaluationResult evaluate(const ThreatAssessment& assessment) const;

    [[nodiscard]] size_t policy_count() const;
    [[nodiscard]] uint64_t version() const;
    [[nodiscard]] std::shared_ptr<const RuleSet> snapshot() const;

    /**
     * @brief Check a rule set without activating it
     * @return std::nullopt when valid, otherwise the first problem found
     */
    [[nodiscard]] static std::optional<std::string> validate(const std::vector<Policy>& policies);

    /**
     * @brief Normalize a configured threshold to [0,100]
     *
     * Values <= 1 are fractions of the scale; values in (1,100] are
     * already scores. Negative, non-finite or >100 values are invalid.
     */
    [[nodiscard]] static std::optional<double> normalize_threshold(double raw);

    /// block_critical_threats, sanitize_high_threats, log_medium_threats, allow_safe_prompts
    [[nodiscard]] static std::vector<Policy> default_policies();

private:
    [[nodiscard]] Result<size_t> activate(const std::vector<Policy>& policies, const char* verb);

    std::atomic<std::shared_ptr<const RuleSet>> rules_;
    std::mutex reload_mutex_;
    uint64_t next_version_ = 1;     // Guarded by reload_mutex_
};

} // namespace promptguard
