#pragma once

#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace promptguard {

// ============================================================================
// Audit Record
// ============================================================================

struct AuditRecord {
    std::string audit_id;               // Request id
    uint64_t sequence_num = 0;          // Monotonic counter for gap detection
    std::chrono::system_clock::time_point timestamp;
    std::chrono::system_clock::time_point received_at;  // Request arrival time

    // Request context
    std::optional<std::string> user_id;
    std::optional<std::string> session_id;
    std::string prompt;
    std::optional<std::string> sanitized_prompt;

    // Decision
    Action action = Action::ALLOW;
    bool allowed = true;
    std::string matched_policy;

    // Assessment
    double threat_score = 0.0;
    ThreatLevel threat_level = ThreatLevel::SAFE;
    uint8_t categories = 0;
    std::vector<std::string> span_patterns;     // Pattern ids, in text order
    bool scorer_degraded = false;

    std::chrono::microseconds processing_time{0};

    // Integrity (hash chain)
    std::string record_hash;
    std::string previous_hash;

    [[nodiscard]] bool is_threat() const {
        return threat_level >= ThreatLevel::HIGH;
    }

    [[nodiscard]] std::string to_json() const;

    [[nodiscard]] static AuditRecord from(const PromptRequest& request,
                                          const ThreatAssessment& assessment,
                                          const FirewallDecision& decision);
};

} // namespace promptguard
