#include "audit/file_sink.hpp"

#include <filesystem>
#include <stdexcept>

namespace promptguard {

FileSink::FileSink(const Config& config)
    : config_(config) {
    const auto parent = std::filesystem::path(config_.output_file).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        // A failure here surfaces as the open failure below
    }

    file_stream_.open(config_.output_file, std::ios::app);
    if (!file_stream_.is_open()) {
        throw std::runtime_error("Failed to open audit file: " + config_.output_file);
    }
}

FileSink::~FileSink() {
    shutdown();
}

bool FileSink::write(std::string_view json_lines) {
    if (!file_stream_.is_open()) return false;
    file_stream_.write(json_lines.data(), static_cast<std::streamsize>(json_lines.size()));
    bytes_written_ += json_lines.size();
    return file_stream_.good();
}

void FileSink::flush() {
    file_stream_.flush();
}

void FileSink::shutdown() {
    if (file_stream_.is_open()) {
        file_stream_.flush();
        file_stream_.close();
    }
}

std::string FileSink::name() const {
    return "file:" + config_.output_file;
}

} // namespace promptguard
