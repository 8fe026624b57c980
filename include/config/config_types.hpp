#pragma once

#include "policy/policy_types.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace promptguard {

// ============================================================================
// Configuration Types
// ============================================================================

struct DetectorConfig {
    size_t max_prompt_length = 32768;
    bool encoding_detection = true;
    // Indexed by ThreatCategory: injection, jailbreak, pii, sql_injection, other
    std::array<double, kThreatCategoryCount> category_caps{100.0, 90.0, 60.0, 80.0, 40.0};
};

struct ScorerConfig {
    bool enabled = false;
    std::string endpoint = "http://127.0.0.1:8500";
    std::string path = "/v1/score";
    std::string api_key;
    uint32_t timeout_ms = 250;
    uint32_t max_in_flight = 32;      // Concurrent calls; at the cap the call degrades
    std::string blend = "max";        // "max" | "weighted"
    double weight = 0.5;              // External weight for "weighted"
};

struct AuditConfig {
    bool enabled;
    std::string output_file;
    std::string threats_file;         // HIGH/CRITICAL trail; empty = none
    std::chrono::milliseconds batch_flush_interval;
    bool integrity_enabled = true;

    // Syslog sink
    bool syslog_enabled = false;
    std::string syslog_ident = "promptguard";

    size_t recent_threats_capacity = 1000;

    AuditConfig()
        : enabled(true),
          output_file("logs/audit.jsonl"),
          threats_file("logs/threats.jsonl"),
          batch_flush_interval(100) {}
};

struct ConfigWatcherConfig {
    bool enabled = false;
    uint32_t poll_interval_seconds = 5;
};

struct FirewallConfig {
    DetectorConfig detector;
    ScorerConfig scorer;
    AuditConfig audit;
    ConfigWatcherConfig config_watcher;

    // Empty with has_policies == false means "use the built-in defaults"
    std::vector<Policy> policies;
    bool has_policies = false;
};

} // namespace promptguard
