#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>

namespace promptguard {

struct SanitizeResult {
    std::string text;
    size_t redactions = 0;
};

/**
 * @brief Rewrites a prompt by replacing matched spans with fixed markers
 *
 * Spans are taken in text order. Overlapping spans collapse into one
 * redaction covering their union, labelled by the first span (earliest
 * offset, longest on ties); adjacent spans stay separate. Text outside
 * spans is copied byte for byte. Spans outside the text are ignored.
 *
 * No marker matches any detector pattern, so sanitizing is idempotent.
 */
class Sanitizer {
public:
    [[nodiscard]] SanitizeResult sanitize(std::string_view text,
                                          const ThreatAssessment& assessment) const;

    [[nodiscard]] static const char* redaction_marker(const MatchedSpan& span);
};

} // namespace promptguard
