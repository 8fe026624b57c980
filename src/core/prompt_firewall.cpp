#include "core/prompt_firewall.hpp"
#include "core/utils.hpp"
#include "detector/http_scorer.hpp"

#include <format>
#include <stdexcept>

namespace promptguard {

// ============================================================================
// Construction
// ============================================================================

ThreatDetector::Config PromptFirewall::detector_config(const FirewallConfig& config) {
    ThreatDetector::Config dc;
    dc.max_prompt_length = config.detector.max_prompt_length;
    dc.encoding_detection = config.detector.encoding_detection;
    dc.category_caps = config.detector.category_caps;
    dc.blend = (utils::to_lower(config.scorer.blend) == "weighted")
        ? ScoreBlend::WEIGHTED : ScoreBlend::MAX;
    dc.external_weight = config.scorer.weight;
    dc.scorer_timeout = std::chrono::milliseconds(config.scorer.timeout_ms);
    dc.max_scorer_in_flight = config.scorer.max_in_flight;
    return dc;
}

std::shared_ptr<IScorer> PromptFirewall::make_scorer(const ScorerConfig& config) {
    if (!config.enabled) return nullptr;

    HttpScorer::Config hc;
    hc.endpoint = config.endpoint;
    hc.path = config.path;
    hc.api_key = config.api_key;
    hc.timeout = std::chrono::milliseconds(config.timeout_ms);
    return std::make_shared<HttpScorer>(std::move(hc));
}

PromptFirewall::PromptFirewall(const FirewallConfig& config)
    : PromptFirewall(config, nullptr, nullptr) {}

PromptFirewall::PromptFirewall(const FirewallConfig& config,
                               std::shared_ptr<IScorer> scorer,
                               std::shared_ptr<AuditRecorder> recorder)
    : detector_(detector_config(config),
                scorer ? std::move(scorer) : make_scorer(config.scorer)),
      recorder_(recorder ? std::move(recorder) : std::make_shared<AuditRecorder>(config.audit)) {

    if (config.has_policies) {
        auto loaded = policy_engine_.load_policies(config.policies);
        if (loaded.is_error()) {
            throw std::invalid_argument(loaded.error_message());
        }
    }

    utils::log::info(std::format(
        "Prompt firewall ready: {} patterns, {} policies, scorer {}",
        detector_.library().size(), policy_engine_.policy_count(),
        detector_.has_scorer() ? "enabled" : "disabled"));
}

// ============================================================================
// Decision Path
// ============================================================================

FirewallDecision PromptFirewall::check(const PromptRequest& request) {
    const utils::Timer timer;

    const auto assessment = detector_.assess(request.prompt);

    PolicyEvaluationResult evaluation;
    if (assessment.oversized) {
        evaluation = PolicyEvaluationResult(
            Action::BLOCK, kInputTooLargePolicy,
            std::format("Prompt of {} bytes exceeds limit of {}",
                        request.prompt.size(), detector_.config().max_prompt_length));
    } else {
        evaluation = policy_engine_.evaluate(assessment);
    }

    FirewallDecision decision;
    decision.request_id = request.request_id;
    decision.action = evaluation.action;
    decision.allowed = evaluation.action != Action::BLOCK;
    decision.threat_score = assessment.score;
    decision.threat_level = assessment.level;
    decision.categories = assessment.categories;
    decision.matched_policy = evaluation.matched_policy;
    decision.scorer_degraded = assessment.scorer_degraded;

    switch (decision.action) {
        case Action::BLOCK:
            decision.message = std::format("Request blocked by policy '{}'",
                                           decision.matched_policy);
            utils::log::warn(std::format("Blocked request {} by policy '{}' (score {:.2f})",
                decision.request_id, decision.matched_policy, decision.threat_score));
            break;

        case Action::SANITIZE: {
            auto sanitized = sanitizer_.sanitize(request.prompt, assessment);
            decision.message = std::format("Prompt sanitized: {} redaction(s) applied",
                                           sanitized.redactions);
            decision.sanitized_prompt = std::move(sanitized.text);
            break;
        }

        case Action::LOG:
            decision.message = std::format("Request allowed and logged by policy '{}'",
                                           decision.matched_policy);
            utils::log::info(std::format("Logged request {} by policy '{}' (score {:.2f})",
                decision.request_id, decision.matched_policy, decision.threat_score));
            break;

        case Action::ALLOW:
            decision.message = "Request allowed";
            break;
    }

    decision.processing_time = timer.elapsed_us();
    stats_.record(decision);
    recorder_->record(AuditRecord::from(request, assessment, decision));

    decision.processing_time = timer.elapsed_us();
    return decision;
}

FirewallDecision PromptFirewall::check(std::string prompt,
                                       std::optional<std::string> user_id,
                                       std::optional<std::string> session_id) {
    return check(PromptRequest(std::move(prompt), std::move(user_id), std::move(session_id)));
}

std::vector<FirewallDecision> PromptFirewall::batch_check(const std::vector<std::string>& prompts) {
    std::vector<FirewallDecision> decisions;
    decisions.reserve(prompts.size());
    for (const auto& prompt : prompts) {
        decisions.push_back(check(PromptRequest(prompt)));
    }
    return decisions;
}

// ============================================================================
// Operator Surface
// ============================================================================

std::vector<AuditRecord> PromptFirewall::get_recent_threats(size_t limit) const {
    return recorder_->recent_threats(limit);
}

Result<size_t> PromptFirewall::reload_policies(const std::vector<Policy>& policies) {
    return policy_engine_.reload_policies(policies);
}

void PromptFirewall::flush_audit() {
    recorder_->flush();
}

} // namespace promptguard
