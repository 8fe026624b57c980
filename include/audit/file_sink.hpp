#pragma once

#include "audit/audit_sink.hpp"

#include <cstddef>
#include <fstream>
#include <string>

namespace promptguard {

/**
 * @brief Append-only JSONL file sink
 *
 * Creates missing parent directories. Throws std::runtime_error from the
 * constructor when the file cannot be opened.
 */
class FileSink : public IAuditSink {
public:
    struct Config {
        std::string output_file = "audit.jsonl";
    };

    explicit FileSink(const Config& config);
    ~FileSink() override;

    [[nodiscard]] bool write(std::string_view json_lines) override;
    void flush() override;
    void shutdown() override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] size_t bytes_written() const { return bytes_written_; }

private:
    Config config_;
    std::ofstream file_stream_;
    size_t bytes_written_ = 0;
};

} // namespace promptguard
