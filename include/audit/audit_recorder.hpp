#pragma once

#include "audit/audit_record.hpp"
#include "audit/audit_sink.hpp"
#include "audit/ring_buffer.hpp"
#include "config/config_types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace promptguard {

/**
 * @brief Async audit recorder
 *
 * Decouples audit production from I/O with a lock-free MPSC ring buffer
 * and one background writer thread.
 *
 *   [check() 1] --record()--> [Ring Buffer] --drain()--> [Writer] --> primary sinks (all records)
 *   [check() N] --record()-->                                     --> threat sinks (HIGH/CRITICAL)
 *
 * Each trail carries its own SHA-256 hash chain. HIGH/CRITICAL records
 * are also kept in a bounded in-memory window for get_recent_threats().
 * Nothing here throws into the caller: unopenable sinks are logged and
 * skipped, write failures and overflow drops are counted.
 */
class AuditRecorder {
public:
    using SinkList = std::vector<std::unique_ptr<IAuditSink>>;

    /**
     * @brief Create sinks from config (FileSink for output_file and
     * threats_file, SyslogSink when enabled) and start the writer
     */
    explicit AuditRecorder(const AuditConfig& config);

    /// Use the given sinks instead of building them from config
    AuditRecorder(const AuditConfig& config, SinkList primary_sinks, SinkList threat_sinks);

    ~AuditRecorder();

    AuditRecorder(const AuditRecorder&) = delete;
    AuditRecorder& operator=(const AuditRecorder&) = delete;
    AuditRecorder(AuditRecorder&&) = delete;
    AuditRecorder& operator=(AuditRecorder&&) = delete;

    /**
     * @brief Record a decision (non-blocking)
     *
     * Assigns a monotonic sequence number and enqueues. If the buffer is
     * full the record is dropped and overflow_dropped is incremented.
     */
    void record(AuditRecord record);

    /// Returns once every record enqueued before the call reached the sinks and they were flushed
    void flush();

    /// Drain, flush and close all sinks. Idempotent.
    void shutdown();

    /// HIGH/CRITICAL records, most recent first, at most `limit`
    [[nodiscard]] std::vector<AuditRecord> recent_threats(size_t limit) const;

    struct Stats {
        uint64_t total_recorded;        ///< record() calls accepted
        uint64_t total_written;         ///< Records handed to the primary sinks
        uint64_t threats_written;       ///< Records handed to the threat sinks
        uint64_t overflow_dropped;      ///< Records dropped (buffer full)
        uint64_t flush_count;           ///< Batches written
        uint64_t sink_write_failures;   ///< Failed sink write attempts
        size_t active_sinks;
    };

    [[nodiscard]] Stats get_stats() const;

    [[nodiscard]] bool enabled() const { return config_.enabled; }

    static std::string compute_record_hash(const AuditRecord& record, const std::string& prev_hash);

    static constexpr size_t kRingCapacity = 4096;

private:
    struct Trail {
        SinkList sinks;
        std::string previous_hash;      // Writer thread only
    };

    void start();
    void writer_thread_func();
    size_t drain_and_write();
    void write_trail(Trail& trail, std::vector<AuditRecord>& records);
    void flush_sinks();
    void shutdown_sinks();
    void remember_threat(const AuditRecord& record);

    static constexpr size_t kMaxBatchSize = 512;

    AuditConfig config_;

    Trail primary_;
    Trail threats_;

    std::unique_ptr<MPSCRingBuffer<AuditRecord, kRingCapacity>> ring_buffer_;

    std::thread writer_thread_;
    std::atomic<bool> running_{false};

    // Flush handshake
    mutable std::mutex flush_mutex_;
    std::condition_variable wake_cv_;       // Wakes the writer
    std::condition_variable flushed_cv_;    // Wakes flush() callers
    uint64_t flush_target_ = 0;             // Guarded by flush_mutex_
    uint64_t flushed_upto_ = 0;             // Guarded by flush_mutex_

    // Recent threats window
    mutable std::mutex recent_mutex_;
    std::deque<AuditRecord> recent_threats_;

    // Stats
    std::atomic<uint64_t> sequence_counter_{0};
    std::atomic<uint64_t> total_recorded_{0};
    std::atomic<uint64_t> total_written_{0};
    std::atomic<uint64_t> threats_written_{0};
    std::atomic<uint64_t> flush_count_{0};
    std::atomic<uint64_t> sink_write_failures_{0};
    uint64_t processed_ = 0;                // Writer thread only
};

} // namespace promptguard
