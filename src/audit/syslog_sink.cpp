#include "audit/syslog_sink.hpp"

#include <syslog.h>

namespace promptguard {

SyslogSink::SyslogSink(const Config& config)
    : config_(config) {
    openlog(config_.ident.c_str(), LOG_NDELAY | LOG_PID, config_.facility);
    open_ = true;
}

SyslogSink::~SyslogSink() {
    shutdown();
}

int SyslogSink::priority_for(std::string_view json_line, const Config& config) {
    // Prompt text is JSON-escaped, so only the real field has bare quotes
    if (json_line.find(R"("threat_level":"critical")") != std::string_view::npos ||
        json_line.find(R"("threat_level":"high")") != std::string_view::npos) {
        return config.threat_priority;
    }
    return config.priority;
}

bool SyslogSink::write(std::string_view json_lines) {
    if (!open_) return false;

    size_t start = 0;
    while (start < json_lines.size()) {
        auto end = json_lines.find('\n', start);
        if (end == std::string_view::npos) end = json_lines.size();
        if (end > start) {
            const auto line = json_lines.substr(start, end - start);
            const int priority = priority_for(line, config_);
            syslog(priority, "%.*s", static_cast<int>(line.size()), line.data());
            records_written_.fetch_add(1, std::memory_order_relaxed);
            if (priority == config_.threat_priority && priority != config_.priority) {
                threat_records_written_.fetch_add(1, std::memory_order_relaxed);
            }
        }
        start = end + 1;
    }
    return true;
}

void SyslogSink::flush() {}

void SyslogSink::shutdown() {
    if (open_) {
        closelog();
        open_ = false;
    }
}

std::string SyslogSink::name() const {
    return "syslog:" + config_.ident;
}

} // namespace promptguard
