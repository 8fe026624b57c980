#pragma once

#include "audit/audit_recorder.hpp"
#include "config/config_types.hpp"
#include "core/error.hpp"
#include "core/firewall_stats.hpp"
#include "core/types.hpp"
#include "detector/scorer.hpp"
#include "detector/threat_detector.hpp"
#include "policy/policy_engine.hpp"
#include "sanitizer/sanitizer.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace promptguard {

/**
 * @brief Firewall orchestrator - one decision per prompt
 *
 * Flow:
 * 1. Assess (pattern library + optional external scorer)
 * 2. Policy (first match in evaluation order; oversized input always blocks)
 * 3. Sanitize (SANITIZE only)
 * 4. Decision + stats
 * 5. Audit (non-blocking enqueue)
 *
 * check() and batch_check() never throw and may be called from any
 * number of threads. All state is owned by the instance.
 */
class PromptFirewall {
public:
    /**
     * @brief Build every component from config
     * @throws std::invalid_argument if config.policies fails validation
     */
    explicit PromptFirewall(const FirewallConfig& config);

    /**
     * @brief Build with an injected scorer and/or recorder (nullptr = from config)
     */
    PromptFirewall(const FirewallConfig& config,
                   std::shared_ptr<IScorer> scorer,
                   std::shared_ptr<AuditRecorder> recorder);

    [[nodiscard]] FirewallDecision check(const PromptRequest& request);

    [[nodiscard]] FirewallDecision check(std::string prompt,
                                         std::optional<std::string> user_id = std::nullopt,
                                         std::optional<std::string> session_id = std::nullopt);

    /// One independent decision per prompt, in input order
    [[nodiscard]] std::vector<FirewallDecision> batch_check(const std::vector<std::string>& prompts);

    [[nodiscard]] StatsSnapshot get_stats() const { return stats_.snapshot(); }
    void reset_stats() { stats_.reset(); }

    [[nodiscard]] std::vector<AuditRecord> get_recent_threats(size_t limit = 10) const;

    /// Validate and atomically swap the rule set; the old set stays on error
    [[nodiscard]] Result<size_t> reload_policies(const std::vector<Policy>& policies);

    /// Block until every audit record so far reached the sinks
    void flush_audit();

    [[nodiscard]] const ThreatDetector& detector() const { return detector_; }
    [[nodiscard]] const PolicyEngine& policy_engine() const { return policy_engine_; }
    [[nodiscard]] std::shared_ptr<AuditRecorder> get_audit_recorder() const { return recorder_; }

private:
    [[nodiscard]] static ThreatDetector::Config detector_config(const FirewallConfig& config);
    [[nodiscard]] static std::shared_ptr<IScorer> make_scorer(const ScorerConfig& config);

    ThreatDetector detector_;
    PolicyEngine policy_engine_;
    Sanitizer sanitizer_;
    FirewallStats stats_;
    std::shared_ptr<AuditRecorder> recorder_;
};

} // namespace promptguard
