#pragma once

#include "config/config_loader.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace promptfw {

/**
 * @brief Polls the firewall config file and hands every valid new
 * FirewallConfig to a reload callback (normally PromptFirewall::reload)
 *
 * A change is a new modification time. The changed file goes through
 * ConfigLoader with the watcher's environment; a file that fails to load
 * or validate is reported through last_error() and the callback is not
 * called, so the firewall keeps its current snapshot.
 *
 * The callback runs on the watcher thread.
 */
class ConfigWatcher {
public:
    using ReloadCallback = std::function<void(const FirewallConfig& new_config)>;

    enum class PollOutcome { UNCHANGED, RELOADED, REJECTED, UNREADABLE };

    explicit ConfigWatcher(
        std::string config_path,
        std::chrono::seconds poll_interval = std::chrono::seconds{5},
        std::string environment = "");

    ~ConfigWatcher();

    ConfigWatcher(const ConfigWatcher&) = delete;
    ConfigWatcher& operator=(const ConfigWatcher&) = delete;

    void set_callback(ReloadCallback callback);

    /**
     * @brief Spawn the polling thread (no-op when already running)
     */
    void start();

    /**
     * @brief Stop and join the polling thread
     */
    void stop();

    /**
     * @brief One polling step: stat, and reload when the file changed
     */
    PollOutcome poll_once();

    [[nodiscard]] bool is_running() const { return running_.load(); }
    [[nodiscard]] uint64_t reload_count() const { return reload_count_.load(); }
    [[nodiscard]] uint64_t rejected_count() const { return rejected_count_.load(); }
    [[nodiscard]] std::string last_error() const;
    [[nodiscard]] const std::string& config_path() const { return config_path_; }

private:
    void run(std::stop_token stop);
    void record_error(std::string message);

    const std::string config_path_;
    const std::chrono::seconds poll_interval_;
    const std::string environment_;
    ReloadCallback on_reload_;

    std::filesystem::file_time_type seen_mtime_{};
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> reload_count_{0};
    std::atomic<uint64_t> rejected_count_{0};

    mutable std::mutex error_mutex_;
    std::string last_error_;

    std::jthread poller_;
};

} // namespace promptfw
