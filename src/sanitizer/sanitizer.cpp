#include "sanitizer/sanitizer.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace promptguard {

const char* Sanitizer::redaction_marker(const MatchedSpan& span) {
    switch (span.category) {
        case ThreatCategory::PII: {
            static const std::unordered_map<std::string_view, const char*> pii_markers = {
                {"email",       "[EMAIL_REDACTED]"},
                {"ssn",         "[SSN_REDACTED]"},
                {"credit_card", "[CARD_REDACTED]"},
                {"phone",       "[PHONE_REDACTED]"},
                {"api_key",     "[API_KEY_REDACTED]"},
            };
            const auto it = pii_markers.find(span.pattern);
            return it != pii_markers.end() ? it->second : "[PII_REDACTED]";
        }
        case ThreatCategory::INJECTION:     return "[INSTRUCTION_REMOVED]";
        case ThreatCategory::JAILBREAK:     return "[ROLEPLAY_REMOVED]";
        case ThreatCategory::SQL_INJECTION: return "[SQL_REMOVED]";
        case ThreatCategory::OTHER:
        default:                            return "[ENCODING_REMOVED]";
    }
}

SanitizeResult Sanitizer::sanitize(std::string_view text,
                                   const ThreatAssessment& assessment) const {
    struct Region {
        size_t begin;
        size_t end;
        const char* marker;
    };

    std::vector<const MatchedSpan*> spans;
    spans.reserve(assessment.spans.size());
    for (const auto& s : assessment.spans) {
        if (s.length == 0 || s.offset >= text.size() || s.length > text.size() - s.offset) {
            continue;
        }
        spans.push_back(&s);
    }
    std::stable_sort(spans.begin(), spans.end(), [](const MatchedSpan* a, const MatchedSpan* b) {
        if (a->offset != b->offset) return a->offset < b->offset;
        return a->length > b->length;
    });

    // Merge strictly overlapping spans; touching spans stay separate
    std::vector<Region> regions;
    for (const auto* s : spans) {
        if (!regions.empty() && s->offset < regions.back().end) {
            regions.back().end = std::max(regions.back().end, s->end());
            continue;
        }
        regions.push_back({s->offset, s->end(), redaction_marker(*s)});
    }

    SanitizeResult result;
    result.text.reserve(text.size());
    size_t cursor = 0;
    for (const auto& r : regions) {
        result.text.append(text.substr(cursor, r.begin - cursor));
        result.text.append(r.marker);
        cursor = r.end;
    }
    result.text.append(text.substr(cursor));
    result.redactions = regions.size();
    return result;
}

} // namespace promptguard
