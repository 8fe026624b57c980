#pragma once

#include "detector/scorer.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace promptguard {

/**
 * @brief IScorer backed by an HTTP classification service
 *
 * Request:  POST {endpoint}{path}  {"text":"..."}
 * Response: {"score": <0..1 or 0..100>, "categories": ["injection", ...]}
 *
 * Scores <= 1.0 are read as probabilities and scaled to 0-100. Unknown
 * category names are ignored. Transport errors, non-200 statuses and
 * malformed bodies all yield std::nullopt.
 */
class HttpScorer : public IScorer {
public:
    struct Config {
        std::string endpoint = "http://127.0.0.1:8500";
        std::string path = "/v1/score";
        std::string api_key;
        std::chrono::milliseconds timeout{250};
    };

    explicit HttpScorer(Config config);

    [[nodiscard]] std::optional<ScorerVerdict> score(std::string_view text) override;
    [[nodiscard]] std::string name() const override;

    /// Parse a scorer response body (exposed for tests)
    [[nodiscard]] static std::optional<ScorerVerdict> parse_response(const std::string& body);

    struct Stats {
        uint64_t requests;
        uint64_t failures;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    Config config_;

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace promptguard
