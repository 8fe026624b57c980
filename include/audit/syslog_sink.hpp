#pragma once

#include "audit/audit_sink.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

namespace promptguard {

/**
 * @brief POSIX syslog audit sink, one syslog message per JSON line
 *
 * Lines for HIGH/CRITICAL assessments are sent at threat_priority so a
 * syslog filter can route them separately from routine traffic.
 */
class SyslogSink : public IAuditSink {
public:
    struct Config {
        std::string ident = "promptguard";
        int facility = 128;         // LOG_LOCAL0
        int priority = 6;           // LOG_INFO
        int threat_priority = 4;    // LOG_WARNING
    };

    explicit SyslogSink(const Config& config);
    ~SyslogSink() override;

    [[nodiscard]] bool write(std::string_view json_lines) override;
    void flush() override;
    void shutdown() override;
    [[nodiscard]] std::string name() const override;

    /// Syslog priority for one serialized audit record
    [[nodiscard]] static int priority_for(std::string_view json_line, const Config& config);

    [[nodiscard]] uint64_t records_written() const {
        return records_written_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] uint64_t threat_records_written() const {
        return threat_records_written_.load(std::memory_order_relaxed);
    }

private:
    Config config_;     // openlog() keeps a pointer to ident
    std::atomic<uint64_t> records_written_{0};
    std::atomic<uint64_t> threat_records_written_{0};
    bool open_ = false;
};

} // namespace promptguard
