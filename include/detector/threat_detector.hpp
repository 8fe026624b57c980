#pragma once

#include "core/types.hpp"
#include "detector/pattern_library.hpp"
#include "detector/scorer.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string_view>

namespace promptguard {

/**
 * @brief Scores a prompt for adversarial intent
 *
 * Every validated regex occurrence adds its pattern weight to the
 * category subtotal; subtotals are capped per category and summed into
 * a [0,100] pattern score. An optional external scorer is consulted
 * under a timeout and blended in; any scorer failure falls back to the
 * pattern score and flags the assessment as degraded. Once
 * max_scorer_in_flight calls are outstanding, further calls degrade
 * without starting a helper thread.
 *
 * assess() is const and thread-safe.
 */
class ThreatDetector {
public:
    struct Config {
        size_t max_prompt_length = 32768;
        bool encoding_detection = true;
        // Indexed by ThreatCategory
        std::array<double, kThreatCategoryCount> category_caps{100.0, 90.0, 60.0, 80.0, 40.0};
        ScoreBlend blend = ScoreBlend::MAX;
        double external_weight = 0.5;
        std::chrono::milliseconds scorer_timeout{250};
        // Outstanding scorer calls, including timed-out ones still running
        size_t max_scorer_in_flight = 32;
    };

    ThreatDetector() : ThreatDetector(Config{}) {}
    explicit ThreatDetector(Config config, std::shared_ptr<IScorer> scorer = nullptr);

    [[nodiscard]] ThreatAssessment assess(std::string_view text) const;

    /// Pattern-only assessment (never touches the external scorer)
    [[nodiscard]] ThreatAssessment assess_patterns(std::string_view text) const;

    [[nodiscard]] const PatternLibrary& library() const { return library_; }
    [[nodiscard]] const Config& config() const { return config_; }
    [[nodiscard]] bool has_scorer() const { return scorer_ != nullptr; }

    /// Scorer helper threads that have not yet returned
    [[nodiscard]] size_t scorer_in_flight() const {
        return scorer_in_flight_->load(std::memory_order_relaxed);
    }

private:
    [[nodiscard]] std::optional<ScorerVerdict> call_scorer(std::string_view text) const;
    [[nodiscard]] double blend(double pattern_score, double external_score) const;

    Config config_;
    PatternLibrary library_;
    std::shared_ptr<IScorer> scorer_;
    // Shared with helper threads, which may outlive the detector
    std::shared_ptr<std::atomic<size_t>> scorer_in_flight_;
};

} // namespace promptguard
