#include "core/firewall_stats.hpp"

#include <format>

namespace promptguard {

void FirewallStats::record(const FirewallDecision& decision) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++counters_.total_requests;
    switch (decision.action) {
        case Action::BLOCK:    ++counters_.blocked; break;
        case Action::SANITIZE: ++counters_.sanitized; break;
        case Action::LOG:      ++counters_.logged; ++counters_.allowed; break;
        case Action::ALLOW:    ++counters_.allowed; break;
    }
    if (decision.threat_level >= ThreatLevel::HIGH) {
        ++counters_.threats_detected;
    }
}

StatsSnapshot FirewallStats::snapshot() const {
    StatsSnapshot s;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        s = counters_;
    }

    if (s.total_requests > 0) {
        const auto total = static_cast<double>(s.total_requests);
        s.block_rate = static_cast<double>(s.blocked) / total * 100.0;
        s.sanitize_rate = static_cast<double>(s.sanitized) / total * 100.0;
        s.threat_rate = static_cast<double>(s.threats_detected) / total * 100.0;
    }
    return s;
}

void FirewallStats::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_ = StatsSnapshot{};
}

std::string StatsSnapshot::to_json() const {
    return std::format(
        "{{\"total_requests\":{},\"blocked\":{},\"sanitized\":{},\"allowed\":{},"
        "\"logged\":{},\"threats_detected\":{},\"block_rate\":{:.2f},"
        "\"sanitize_rate\":{:.2f},\"threat_rate\":{:.2f}}}",
        total_requests, blocked, sanitized, allowed, logged, threats_detected,
        block_rate, sanitize_rate, threat_rate);
}

} // namespace promptguard
