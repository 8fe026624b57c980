#include "audit/audit_recorder.hpp"
#include "audit/file_sink.hpp"
#include "audit/syslog_sink.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <format>

namespace promptguard {

namespace {

void add_file_sink(AuditRecorder::SinkList& sinks, const std::string& path) {
    if (path.empty()) return;
    try {
        sinks.push_back(std::make_unique<FileSink>(FileSink::Config{.output_file = path}));
    } catch (const std::exception& e) {
        utils::log::error(std::format("Audit sink file:{} disabled: {}", path, e.what()));
    }
}

} // anonymous namespace

// ============================================================================
// Construction / Destruction
// ============================================================================

AuditRecorder::AuditRecorder(const AuditConfig& config)
    : config_(config) {
    if (config_.enabled) {
        add_file_sink(primary_.sinks, config_.output_file);
        add_file_sink(threats_.sinks, config_.threats_file);

        if (config_.syslog_enabled) {
            SyslogSink::Config sl_cfg;
            sl_cfg.ident = config_.syslog_ident;
            primary_.sinks.push_back(std::make_unique<SyslogSink>(sl_cfg));
        }
    }
    start();
}

AuditRecorder::AuditRecorder(const AuditConfig& config, SinkList primary_sinks,
                             SinkList threat_sinks)
    : config_(config) {
    primary_.sinks = std::move(primary_sinks);
    threats_.sinks = std::move(threat_sinks);
    start();
}

void AuditRecorder::start() {
    if (!config_.enabled) {
        utils::log::info("Audit trail disabled; keeping recent threats in memory only");
        return;
    }

    for (const auto* trail : {&primary_, &threats_}) {
        for (const auto& sink : trail->sinks) {
            utils::log::info(std::format("Audit sink active: {}", sink->name()));
        }
    }

    ring_buffer_ = std::make_unique<MPSCRingBuffer<AuditRecord, kRingCapacity>>();
    running_.store(true, std::memory_order_release);
    writer_thread_ = std::thread(&AuditRecorder::writer_thread_func, this);
}

AuditRecorder::~AuditRecorder() {
    shutdown();
}

// ============================================================================
// Public Interface
// ============================================================================

void AuditRecorder::record(AuditRecord record) {
    record.sequence_num = sequence_counter_.fetch_add(1, std::memory_order_relaxed);
    total_recorded_.fetch_add(1, std::memory_order_relaxed);

    if (record.is_threat()) {
        remember_threat(record);
    }

    if (!running_.load(std::memory_order_acquire)) {
        return;
    }
    if (!ring_buffer_->try_push(std::move(record))) {
        const auto dropped = ring_buffer_->overflow_count();
        if (dropped == 1 || dropped % 1000 == 0) {
            utils::log::warn(std::format("Audit buffer full: {} records dropped", dropped));
        }
    }
}

void AuditRecorder::flush() {
    if (!running_.load(std::memory_order_acquire)) {
        return;
    }

    const uint64_t target = ring_buffer_->claimed();

    std::unique_lock<std::mutex> lock(flush_mutex_);
    if (flushed_upto_ >= target) {
        return;
    }
    flush_target_ = std::max(flush_target_, target);
    wake_cv_.notify_one();
    flushed_cv_.wait(lock, [this, target] { return flushed_upto_ >= target; });
}

void AuditRecorder::shutdown() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(flush_mutex_);
    }
    wake_cv_.notify_one();

    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }
}

std::vector<AuditRecord> AuditRecorder::recent_threats(size_t limit) const {
    std::lock_guard<std::mutex> lock(recent_mutex_);
    std::vector<AuditRecord> out;
    out.reserve(std::min(limit, recent_threats_.size()));
    for (auto it = recent_threats_.rbegin(); it != recent_threats_.rend() && out.size() < limit; ++it) {
        out.push_back(*it);
    }
    return out;
}

AuditRecorder::Stats AuditRecorder::get_stats() const {
    return Stats{
        .total_recorded = total_recorded_.load(std::memory_order_relaxed),
        .total_written = total_written_.load(std::memory_order_relaxed),
        .threats_written = threats_written_.load(std::memory_order_relaxed),
        .overflow_dropped = ring_buffer_ ? ring_buffer_->overflow_count() : 0,
        .flush_count = flush_count_.load(std::memory_order_relaxed),
        .sink_write_failures = sink_write_failures_.load(std::memory_order_relaxed),
        .active_sinks = primary_.sinks.size() + threats_.sinks.size()
    };
}

void AuditRecorder::remember_threat(const AuditRecord& record) {
    if (config_.recent_threats_capacity == 0) return;

    std::lock_guard<std::mutex> lock(recent_mutex_);
    recent_threats_.push_back(record);
    while (recent_threats_.size() > config_.recent_threats_capacity) {
        recent_threats_.pop_front();
    }
}

// ============================================================================
// Sink Helpers
// ============================================================================

void AuditRecorder::write_trail(Trail& trail, std::vector<AuditRecord>& records) {
    if (trail.sinks.empty()) return;

    std::string output;
    output.reserve(records.size() * 640);
    for (auto& record : records) {
        if (config_.integrity_enabled) {
            record.previous_hash = trail.previous_hash;
            record.record_hash = compute_record_hash(record, trail.previous_hash);
            trail.previous_hash = record.record_hash;
        }
        output += record.to_json();
        output += '\n';
    }

    for (auto& sink : trail.sinks) {
        bool ok = false;
        try {
            ok = sink->write(output);
        } catch (const std::exception& e) {
            utils::log::error(std::format("Audit sink {} threw: {}", sink->name(), e.what()));
        }
        if (!ok && sink_write_failures_.fetch_add(1, std::memory_order_relaxed) == 0) {
            utils::log::error(std::format("Audit sink {} write failed", sink->name()));
        }
    }
}

void AuditRecorder::flush_sinks() {
    for (auto* trail : {&primary_, &threats_}) {
        for (auto& sink : trail->sinks) {
            sink->flush();
        }
    }
}

void AuditRecorder::shutdown_sinks() {
    for (auto* trail : {&primary_, &threats_}) {
        for (auto& sink : trail->sinks) {
            sink->flush();
            sink->shutdown();
        }
    }
}

// ============================================================================
// Background Writer Thread
// ============================================================================

size_t AuditRecorder::drain_and_write() {
    std::vector<AuditRecord> batch;
    std::vector<AuditRecord> threat_batch;
    size_t total = 0;

    while (true) {
        batch.clear();
        const size_t drained = ring_buffer_->drain(batch, kMaxBatchSize);
        if (drained == 0) {
            break;
        }
        total += drained;
        processed_ += drained;

        // Copy before the primary chain stamps its hashes
        threat_batch.clear();
        for (const auto& record : batch) {
            if (record.is_threat()) threat_batch.push_back(record);
        }

        write_trail(primary_, batch);
        total_written_.fetch_add(drained, std::memory_order_relaxed);

        if (!threat_batch.empty() && !threats_.sinks.empty()) {
            write_trail(threats_, threat_batch);
            threats_written_.fetch_add(threat_batch.size(), std::memory_order_relaxed);
        }
        flush_count_.fetch_add(1, std::memory_order_relaxed);
    }
    return total;
}

void AuditRecorder::writer_thread_func() {
    while (true) {
        uint64_t target = 0;
        {
            std::unique_lock<std::mutex> lock(flush_mutex_);
            wake_cv_.wait_for(lock, config_.batch_flush_interval, [this] {
                return flush_target_ > flushed_upto_
                    || !running_.load(std::memory_order_acquire);
            });
            target = flush_target_;
        }
        const bool stopping = !running_.load(std::memory_order_acquire);

        drain_and_write();

        bool pending = false;
        {
            std::lock_guard<std::mutex> lock(flush_mutex_);
            pending = target > flushed_upto_;
        }

        if (pending || stopping) {
            // Claimed positions are always published; wait out in-flight producers
            const uint64_t goal = stopping ? ring_buffer_->claimed() : target;
            while (processed_ < goal) {
                if (drain_and_write() == 0) std::this_thread::yield();
            }
            flush_sinks();
            {
                std::lock_guard<std::mutex> lock(flush_mutex_);
                flushed_upto_ = std::max(flushed_upto_, processed_);
            }
            flushed_cv_.notify_all();
        }

        if (stopping) {
            shutdown_sinks();
            return;
        }
    }
}

// ============================================================================
// Hash Chain
// ============================================================================

std::string AuditRecorder::compute_record_hash(
    const AuditRecord& record, const std::string& prev_hash) {

    // sequence_num|timestamp|audit_id|prompt|action|score|level|previous_hash
    std::string input;
    input.reserve(256 + record.prompt.size());
    input += std::format("{}", record.sequence_num);
    input += '|';
    input += utils::format_timestamp(record.timestamp);
    input += '|';
    input += record.audit_id;
    input += '|';
    input += record.prompt;
    input += '|';
    input += action_to_string(record.action);
    input += '|';
    input += std::format("{:.2f}", record.threat_score);
    input += '|';
    input += threat_level_to_string(record.threat_level);
    input += '|';
    input += prev_hash;

    // SHA-256 via OpenSSL EVP
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) return "";

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    const bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1
                 && EVP_DigestUpdate(ctx, input.data(), input.size()) == 1
                 && EVP_DigestFinal_ex(ctx, hash, &hash_len) == 1;
    EVP_MD_CTX_free(ctx);
    if (!ok) return "";

    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(hash_len * 2);
    for (unsigned int i = 0; i < hash_len; ++i) {
        hex += hex_chars[(hash[i] >> 4) & 0x0F];
        hex += hex_chars[hash[i] & 0x0F];
    }
    return hex;
}

} // namespace promptguard
