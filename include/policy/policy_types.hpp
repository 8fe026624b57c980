#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace promptguard {

// ============================================================================
// Policy Types
// ============================================================================

struct Policy {
    std::string name;
    bool enabled = true;
    Action action = Action::ALLOW;
    ThreatLevel severity = ThreatLevel::SAFE;   // Minimum level to match
    double threshold = 0.0;                     // Minimum score, [0,100] once normalized
    uint8_t categories = 0;                     // category_mask bits, 0 = any category
    std::optional<int> priority;                // Lower = evaluated first; unset = declaration index
    size_t declaration_index = 0;
    std::string description;

    [[nodiscard]] bool has_category_filter() const { return categories != 0; }

    [[nodiscard]] size_t effective_priority() const {
        return priority ? static_cast<size_t>(*priority) : declaration_index;
    }

    [[nodiscard]] bool matches(const ThreatAssessment& assessment) const {
        if (assessment.level < severity) return false;
        if (assessment.score < threshold) return false;
        return !has_category_filter() || (categories & assessment.categories) != 0;
    }
};

struct PolicyEvaluationResult {
    Action action;
    std::string matched_policy;     // Policy name that made the decision
    std::string reason;             // Human-readable reason

    PolicyEvaluationResult() : action(Action::ALLOW) {}
    PolicyEvaluationResult(Action a, std::string p, std::string r)
        : action(a), matched_policy(std::move(p)), reason(std::move(r)) {}
};

inline constexpr const char* kDefaultAllowPolicy = "default_allow";
inline constexpr const char* kInputTooLargePolicy = "input_too_large";

} // namespace promptguard
