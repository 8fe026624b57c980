#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace promptguard {

/// How an external score combines with the pattern score
enum class ScoreBlend : uint8_t {
    MAX,        // max(pattern, external)
    WEIGHTED    // (1 - w) * pattern + w * external
};

inline const char* score_blend_to_string(ScoreBlend blend) {
    switch (blend) {
        case ScoreBlend::MAX:      return "max";
        case ScoreBlend::WEIGHTED: return "weighted";
        default:                   return "unknown";
    }
}

/**
 * @brief Verdict from an external (typically ML) scoring backend
 */
struct ScorerVerdict {
    double score = 0.0;                         // 0-100
    std::vector<ThreatCategory> categories;
};

/**
 * @brief Abstract interface for an external threat scorer
 *
 * The ThreatDetector calls score() on a helper thread under a timeout.
 * Returning std::nullopt means "unavailable for this input"; the detector
 * then falls back to the pattern-only score. Implementations must be safe
 * to call from several threads at once.
 */
class IScorer {
public:
    virtual ~IScorer() = default;

    [[nodiscard]] virtual std::optional<ScorerVerdict> score(std::string_view text) = 0;

    /// Human-readable backend name for logging (e.g. "http://127.0.0.1:8500/v1/score")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace promptguard
