#pragma once

#include "audit/audit_sink.hpp"

#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace promptguard::testing {

/**
 * @brief Captured output of a MemorySink; outlives the sink, which the
 * AuditRecorder owns
 */
struct SinkCapture {
    mutable std::mutex mutex;
    std::vector<std::string> lines;
    size_t flushes = 0;
    bool shut_down = false;

    [[nodiscard]] std::vector<std::string> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex);
        return lines;
    }
};

class MemorySink : public IAuditSink {
public:
    explicit MemorySink(std::shared_ptr<SinkCapture> capture, std::string label = "memory")
        : capture_(std::move(capture)), label_(std::move(label)) {}

    [[nodiscard]] bool write(std::string_view json_lines) override {
        std::lock_guard<std::mutex> lock(capture_->mutex);
        std::istringstream in{std::string(json_lines)};
        for (std::string line; std::getline(in, line);) {
            if (!line.empty()) capture_->lines.push_back(std::move(line));
        }
        return true;
    }

    void flush() override {
        std::lock_guard<std::mutex> lock(capture_->mutex);
        ++capture_->flushes;
    }

    void shutdown() override {
        std::lock_guard<std::mutex> lock(capture_->mutex);
        capture_->shut_down = true;
    }

    [[nodiscard]] std::string name() const override { return "mock:" + label_; }

private:
    std::shared_ptr<SinkCapture> capture_;
    std::string label_;
};

/// Rejects every write
class FailingSink : public IAuditSink {
public:
    [[nodiscard]] bool write(std::string_view /*json_lines*/) override { return false; }
    void flush() override {}
    void shutdown() override {}
    [[nodiscard]] std::string name() const override { return "mock:failing"; }
};

} // namespace promptguard::testing
