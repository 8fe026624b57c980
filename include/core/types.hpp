#pragma once

#include "core/utils.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace promptguard {

// ============================================================================
// Basic Enums
// ============================================================================

enum class ThreatLevel : uint8_t {
    SAFE,
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

enum class Action : uint8_t {
    ALLOW,
    LOG,
    SANITIZE,
    BLOCK
};

enum class ThreatCategory : uint8_t {
    INJECTION,
    JAILBREAK,
    PII,
    SQL_INJECTION,
    OTHER
};

inline constexpr size_t kThreatCategoryCount = 5;

// Category set as a bitmask: ordered, allocation-free, cheap to intersect.
namespace category_mask {
    inline constexpr uint8_t bit(ThreatCategory c) noexcept {
        return static_cast<uint8_t>(1u << static_cast<int>(c));
    }
    [[nodiscard]] inline constexpr bool test(uint8_t mask, ThreatCategory c) noexcept {
        return (mask & bit(c)) != 0;
    }
}

// ============================================================================
// Severity Bands
// ============================================================================

// safe [0,20) low [20,40) medium [40,65) high [65,85] critical (85,100]
inline constexpr double kLowFloor = 20.0;
inline constexpr double kMediumFloor = 40.0;
inline constexpr double kHighFloor = 65.0;
inline constexpr double kCriticalAbove = 85.0;
inline constexpr double kMaxScore = 100.0;

[[nodiscard]] inline constexpr ThreatLevel threat_level_from_score(double score) noexcept {
    if (score > kCriticalAbove) return ThreatLevel::CRITICAL;
    if (score >= kHighFloor) return ThreatLevel::HIGH;
    if (score >= kMediumFloor) return ThreatLevel::MEDIUM;
    if (score >= kLowFloor) return ThreatLevel::LOW;
    return ThreatLevel::SAFE;
}

[[nodiscard]] inline constexpr double clamp_score(double score) noexcept {
    // NaN compares false everywhere; treat it as no signal
    if (!(score >= 0.0)) return 0.0;
    return score > kMaxScore ? kMaxScore : score;
}

// ============================================================================
// Threat Assessment
// ============================================================================

struct MatchedSpan {
    ThreatCategory category = ThreatCategory::OTHER;
    std::string pattern;        // Stable pattern id (e.g. "email")
    size_t offset = 0;          // Byte offset into the assessed text
    size_t length = 0;
    std::string text;           // Matched substring

    [[nodiscard]] size_t end() const { return offset + length; }
};

struct ThreatAssessment {
    double score = 0.0;                      // Final score, [0,100]
    ThreatLevel level = ThreatLevel::SAFE;
    uint8_t categories = 0;                  // category_mask bits
    std::vector<MatchedSpan> spans;          // Ordered by offset

    double pattern_score = 0.0;
    std::optional<double> external_score;
    bool scorer_degraded = false;            // Scorer configured but unusable for this request
    bool oversized = false;                  // Exceeded max_prompt_length; not scanned

    [[nodiscard]] bool has_category(ThreatCategory c) const {
        return category_mask::test(categories, c);
    }

    [[nodiscard]] std::vector<ThreatCategory> category_list() const {
        std::vector<ThreatCategory> out;
        for (size_t i = 0; i < kThreatCategoryCount; ++i) {
            const auto c = static_cast<ThreatCategory>(i);
            if (has_category(c)) out.push_back(c);
        }
        return out;
    }
};

// ============================================================================
// Request / Decision
// ============================================================================

struct PromptRequest {
    std::string request_id;
    std::string prompt;
    std::optional<std::string> user_id;
    std::optional<std::string> session_id;
    std::chrono::system_clock::time_point received_at;

    PromptRequest() = default;

    explicit PromptRequest(std::string text,
                           std::optional<std::string> user = std::nullopt,
                           std::optional<std::string> session = std::nullopt)
        : request_id(utils::generate_uuid()),
          prompt(std::move(text)),
          user_id(std::move(user)),
          session_id(std::move(session)),
          received_at(std::chrono::system_clock::now()) {}
};

struct FirewallDecision {
    std::string request_id;
    Action action = Action::ALLOW;
    bool allowed = true;
    double threat_score = 0.0;
    ThreatLevel threat_level = ThreatLevel::SAFE;
    uint8_t categories = 0;
    std::string matched_policy;
    std::string message;
    std::optional<std::string> sanitized_prompt;   // Present iff action == SANITIZE
    std::chrono::microseconds processing_time{0};
    bool scorer_degraded = false;

    [[nodiscard]] double processing_time_ms() const {
        return static_cast<double>(processing_time.count()) / 1000.0;
    }

    [[nodiscard]] std::string to_json() const;
};

// ============================================================================
// String conversions
// ============================================================================

inline const char* threat_level_to_string(ThreatLevel level) {
    switch (level) {
        case ThreatLevel::SAFE:     return "safe";
        case ThreatLevel::LOW:      return "low";
        case ThreatLevel::MEDIUM:   return "medium";
        case ThreatLevel::HIGH:     return "high";
        case ThreatLevel::CRITICAL: return "critical";
        default:                    return "unknown";
    }
}

inline const char* action_to_string(Action action) {
    switch (action) {
        case Action::ALLOW:    return "allow";
        case Action::LOG:      return "log";
        case Action::SANITIZE: return "sanitize";
        case Action::BLOCK:    return "block";
        default:               return "unknown";
    }
}

inline const char* threat_category_to_string(ThreatCategory category) {
    switch (category) {
        case ThreatCategory::INJECTION:     return "injection";
        case ThreatCategory::JAILBREAK:     return "jailbreak";
        case ThreatCategory::PII:           return "pii";
        case ThreatCategory::SQL_INJECTION: return "sql_injection";
        case ThreatCategory::OTHER:         return "other";
        default:                            return "other";
    }
}

[[nodiscard]] std::optional<ThreatLevel> parse_threat_level(std::string_view str);
[[nodiscard]] std::optional<Action> parse_action(std::string_view str);
[[nodiscard]] std::optional<ThreatCategory> parse_threat_category(std::string_view str);

// JSON array of category names in enum order, e.g. ["injection","pii"]
[[nodiscard]] std::string categories_to_json(uint8_t categories);

} // namespace promptguard
