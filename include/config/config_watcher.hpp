#pragma once

#include "config/config_loader.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace promptguard {

/**
 * @brief Polls a TOML config file and hands each valid new version to a callback
 *
 * A change is a different modification time. The file is re-parsed with
 * ConfigLoader; files that fail to load or validate are logged and
 * skipped, so the running configuration stays in place.
 *
 * The callback runs on the watcher thread and must be thread-safe.
 */
class ConfigWatcher {
public:
    using ReloadCallback = std::function<void(const FirewallConfig& new_config)>;

    explicit ConfigWatcher(
        std::string config_path,
        std::chrono::milliseconds poll_interval = std::chrono::seconds{5});

    ~ConfigWatcher();

    ConfigWatcher(const ConfigWatcher&) = delete;
    ConfigWatcher& operator=(const ConfigWatcher&) = delete;

    void set_callback(ReloadCallback callback);

    void start();
    void stop();

    /**
     * @brief Run one poll on the calling thread
     * @return true if a changed, valid config was delivered to the callback
     */
    bool check_now();

    [[nodiscard]] bool is_running() const { return running_.load(); }
    [[nodiscard]] uint64_t reload_count() const { return reloads_.load(); }
    [[nodiscard]] uint64_t failed_reload_count() const { return failed_reloads_.load(); }

private:
    void watch_loop(std::stop_token stop);

    std::string config_path_;
    std::chrono::milliseconds poll_interval_;
    ReloadCallback callback_;

    std::mutex poll_mutex_;                         // Serializes check_now()
    std::filesystem::file_time_type last_mtime_{};  // Guarded by poll_mutex_

    std::mutex wait_mutex_;
    std::condition_variable_any wait_cv_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> reloads_{0};
    std::atomic<uint64_t> failed_reloads_{0};
    std::jthread watch_thread_;
};

} // namespace promptguard
