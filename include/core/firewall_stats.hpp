#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <mutex>
#include <string>

namespace promptguard {

struct StatsSnapshot {
    uint64_t total_requests = 0;
    uint64_t blocked = 0;
    uint64_t sanitized = 0;
    uint64_t allowed = 0;           // allow + log
    uint64_t logged = 0;            // Subset of allowed
    uint64_t threats_detected = 0;  // HIGH or CRITICAL

    // Percent of total_requests; 0 when there were none
    double block_rate = 0.0;
    double sanitize_rate = 0.0;
    double threat_rate = 0.0;

    [[nodiscard]] std::string to_json() const;
};

/**
 * @brief Decision counters. Updates and snapshots share one lock, so a
 * snapshot never shows a half-applied request.
 */
class FirewallStats {
public:
    void record(const FirewallDecision& decision);

    [[nodiscard]] StatsSnapshot snapshot() const;

    void reset();

private:
    mutable std::mutex mutex_;
    StatsSnapshot counters_;    // Rates unused here
};

} // namespace promptguard
