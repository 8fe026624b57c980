#pragma once

#include <string>
#include <string_view>

namespace promptguard {

/**
 * @brief Abstract interface for audit output destinations
 *
 * Sinks receive newline-terminated JSON lines from the AuditRecorder's
 * writer thread only, so implementations need no internal locking.
 */
class IAuditSink {
public:
    virtual ~IAuditSink() = default;

    /// Write one or more JSON lines. Returns true on success.
    [[nodiscard]] virtual bool write(std::string_view json_lines) = 0;

    virtual void flush() = 0;

    /// Drain buffers and close handles
    virtual void shutdown() = 0;

    /// e.g. "file:logs/audit.jsonl"
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace promptguard
