#include "config/config_watcher.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace promptfw {

namespace {

// Granularity of the interruptible sleep between polls
constexpr std::chrono::milliseconds kSleepSlice{100};

// Grace period for writers that truncate then fill the file
constexpr std::chrono::milliseconds kSettleDelay{100};

} // anonymous namespace

ConfigWatcher::ConfigWatcher(std::string config_path, std::chrono::seconds poll_interval,
                             std::string environment)
    : config_path_(std::move(config_path)),
      poll_interval_(poll_interval),
      environment_(ConfigLoader::resolve_environment(environment)) {
    std::error_code ec;
    seen_mtime_ = std::filesystem::last_write_time(config_path_, ec);
    if (ec) {
        record_error(std::format("cannot stat {}: {}", config_path_, ec.message()));
        utils::log::warn(std::format("Config watcher: {}", last_error()));
    }
}

ConfigWatcher::~ConfigWatcher() {
    stop();
}

void ConfigWatcher::set_callback(ReloadCallback callback) {
    on_reload_ = std::move(callback);
}

void ConfigWatcher::start() {
    if (running_.exchange(true)) return;
    poller_ = std::jthread([this](std::stop_token stop) { run(std::move(stop)); });
    utils::log::info(std::format("Config watcher: polling {} every {}s (environment: {})",
                                  config_path_, poll_interval_.count(), environment_));
}

void ConfigWatcher::stop() {
    if (!running_.exchange(false)) return;
    if (poller_.joinable()) {
        poller_.request_stop();
        poller_.join();
    }
    utils::log::info("Config watcher stopped");
}

std::string ConfigWatcher::last_error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
}

void ConfigWatcher::record_error(std::string message) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_ = std::move(message);
}

ConfigWatcher::PollOutcome ConfigWatcher::poll_once() {
    std::error_code ec;
    const auto mtime = std::filesystem::last_write_time(config_path_, ec);
    if (ec) {
        record_error(std::format("cannot stat {}: {}", config_path_, ec.message()));
        utils::log::warn(std::format("Config watcher: {}", last_error()));
        return PollOutcome::UNREADABLE;
    }
    if (mtime == seen_mtime_) {
        return PollOutcome::UNCHANGED;
    }
    seen_mtime_ = mtime;

    utils::log::info(std::format("Firewall config changed: {}", config_path_));
    std::this_thread::sleep_for(kSettleDelay);

    auto loaded = ConfigLoader::load_from_file(config_path_, environment_);
    if (!loaded.success) {
        rejected_count_.fetch_add(1);
        record_error(loaded.error_message);
        utils::log::error(std::format("Firewall config rejected, keeping current rules: {}",
                                       loaded.error_message));
        return PollOutcome::REJECTED;
    }

    if (on_reload_) {
        try {
            on_reload_(loaded.config);
        } catch (const std::exception& e) {
            rejected_count_.fetch_add(1);
            record_error(e.what());
            utils::log::error(std::format("Firewall reload callback failed: {}", e.what()));
            return PollOutcome::REJECTED;
        }
    }

    reload_count_.fetch_add(1);
    record_error("");
    utils::log::info(std::format("Firewall config applied: {} patterns",
                                  loaded.config.patterns.size()));
    return PollOutcome::RELOADED;
}

void ConfigWatcher::run(std::stop_token stop) {
    const auto slices = std::max<int64_t>(1, std::chrono::milliseconds(poll_interval_) / kSleepSlice);

    while (!stop.stop_requested()) {
        for (int64_t i = 0; i < slices && !stop.stop_requested(); ++i) {
            std::this_thread::sleep_for(kSleepSlice);
        }
        if (stop.stop_requested()) break;

        poll_once();
    }
}

} // namespace promptfw
