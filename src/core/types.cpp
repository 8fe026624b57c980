#include "core/types.hpp"

#include <format>
#include <unordered_map>

namespace promptguard {

std::optional<ThreatLevel> parse_threat_level(std::string_view str) {
    static const std::unordered_map<std::string, ThreatLevel> lookup = {
        {"safe",     ThreatLevel::SAFE},
        {"low",      ThreatLevel::LOW},
        {"medium",   ThreatLevel::MEDIUM},
        {"high",     ThreatLevel::HIGH},
        {"critical", ThreatLevel::CRITICAL},
    };

    const auto it = lookup.find(utils::to_lower(str));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

std::optional<Action> parse_action(std::string_view str) {
    static const std::unordered_map<std::string, Action> lookup = {
        {"allow",    Action::ALLOW},
        {"log",      Action::LOG},
        {"sanitize", Action::SANITIZE},
        {"block",    Action::BLOCK},
    };

    const auto it = lookup.find(utils::to_lower(str));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

std::optional<ThreatCategory> parse_threat_category(std::string_view str) {
    static const std::unordered_map<std::string, ThreatCategory> lookup = {
        {"injection",        ThreatCategory::INJECTION},
        {"prompt_injection", ThreatCategory::INJECTION},
        {"jailbreak",        ThreatCategory::JAILBREAK},
        {"pii",              ThreatCategory::PII},
        {"sql_injection",    ThreatCategory::SQL_INJECTION},
        {"sqli",             ThreatCategory::SQL_INJECTION},
        {"other",            ThreatCategory::OTHER},
    };

    const auto it = lookup.find(utils::to_lower(str));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

std::string categories_to_json(uint8_t categories) {
    std::string out = "[";
    bool first = true;
    for (size_t i = 0; i < kThreatCategoryCount; ++i) {
        const auto c = static_cast<ThreatCategory>(i);
        if (!category_mask::test(categories, c)) continue;
        if (!first) out += ',';
        out += std::format("\"{}\"", threat_category_to_string(c));
        first = false;
    }
    out += ']';
    return out;
}

std::string FirewallDecision::to_json() const {
    const std::string sanitized = sanitized_prompt
        ? std::format("\"{}\"", utils::escape_json(*sanitized_prompt))
        : std::string("null");

    return std::format(
        "{{\"request_id\":\"{}\",\"action\":\"{}\",\"allowed\":{},"
        "\"threat_score\":{:.2f},\"threat_level\":\"{}\",\"categories\":{},"
        "\"matched_policy\":\"{}\",\"message\":\"{}\",\"sanitized_prompt\":{},"
        "\"processing_time_ms\":{:.3f}}}",
        request_id, action_to_string(action), utils::booltostr(allowed),
        threat_score, threat_level_to_string(threat_level), categories_to_json(categories),
        utils::escape_json(matched_policy), utils::escape_json(message), sanitized,
        processing_time_ms());
}

} // namespace promptguard
