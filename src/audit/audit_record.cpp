#include "audit/audit_record.hpp"
#include "core/utils.hpp"

#include <format>

namespace promptguard {

AuditRecord AuditRecord::from(const PromptRequest& request,
                              const ThreatAssessment& assessment,
                              const FirewallDecision& decision) {
    AuditRecord r;
    r.audit_id = request.request_id;
    r.timestamp = std::chrono::system_clock::now();
    r.received_at = request.received_at;
    r.user_id = request.user_id;
    r.session_id = request.session_id;
    r.prompt = request.prompt;
    r.sanitized_prompt = decision.sanitized_prompt;
    r.action = decision.action;
    r.allowed = decision.allowed;
    r.matched_policy = decision.matched_policy;
    r.threat_score = decision.threat_score;
    r.threat_level = decision.threat_level;
    r.categories = decision.categories;
    r.span_patterns.reserve(assessment.spans.size());
    for (const auto& span : assessment.spans) {
        r.span_patterns.push_back(span.pattern);
    }
    r.scorer_degraded = decision.scorer_degraded;
    r.processing_time = decision.processing_time;
    return r;
}

// ============================================================================
// JSON Serialization - Section Builders
// ============================================================================

namespace {

void append_optional_string(std::string& out, std::string_view key,
                            const std::optional<std::string>& value) {
    if (value) {
        out += std::format("\"{}\":\"{}\",", key, utils::escape_json(*value));
    } else {
        out += std::format("\"{}\":null,", key);
    }
}

void append_event_tracking(std::string& out, const AuditRecord& r) {
    out += std::format("\"audit_id\":\"{}\",\"sequence_num\":{},",
                       r.audit_id, r.sequence_num);
    out += std::format("\"timestamp\":\"{}\",\"received_at\":\"{}\",",
                       utils::format_timestamp(r.timestamp),
                       utils::format_timestamp(r.received_at));
}

void append_request_context(std::string& out, const AuditRecord& r) {
    append_optional_string(out, "user_id", r.user_id);
    append_optional_string(out, "session_id", r.session_id);
    out += std::format("\"prompt\":\"{}\",", utils::escape_json(r.prompt));
    append_optional_string(out, "sanitized_prompt", r.sanitized_prompt);
}

void append_decision(std::string& out, const AuditRecord& r) {
    out += std::format("\"action\":\"{}\",\"allowed\":{},\"matched_policy\":\"{}\",",
                       action_to_string(r.action), utils::booltostr(r.allowed),
                       utils::escape_json(r.matched_policy));
}

void append_assessment(std::string& out, const AuditRecord& r) {
    out += std::format("\"threat_score\":{:.2f},\"threat_level\":\"{}\",\"categories\":{},",
                       r.threat_score, threat_level_to_string(r.threat_level),
                       categories_to_json(r.categories));
    out += "\"span_patterns\":[";
    for (size_t i = 0; i < r.span_patterns.size(); ++i) {
        if (i > 0) out += ',';
        out += std::format("\"{}\"", r.span_patterns[i]);
    }
    out += "],";
    out += std::format("\"scorer_degraded\":{},", utils::booltostr(r.scorer_degraded));
}

void append_performance(std::string& out, const AuditRecord& r) {
    out += std::format("\"processing_time_us\":{},", r.processing_time.count());
}

void append_integrity(std::string& out, const AuditRecord& r) {
    if (!r.record_hash.empty()) {
        out += std::format("\"record_hash\":\"{}\",\"previous_hash\":\"{}\"",
                           r.record_hash, r.previous_hash);
    } else {
        if (!out.empty() && out.back() == ',') out.pop_back();
    }
}

} // anonymous namespace

std::string AuditRecord::to_json() const {
    std::string result;
    result.reserve(512 + prompt.size());
    result += '{';
    append_event_tracking(result, *this);
    append_request_context(result, *this);
    append_decision(result, *this);
    append_assessment(result, *this);
    append_performance(result, *this);
    append_integrity(result, *this);
    result += '}';
    return result;
}

} // namespace promptguard
