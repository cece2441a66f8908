#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "config/config_watcher.hpp"
#include "firewall/prompt_firewall.hpp"
#include "firewall/verdict_json.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <format>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace promptfw;

// Global instances for signal handling
std::shared_ptr<ConfigWatcher> g_config_watcher;

namespace {

constexpr int kExitAllowed = 0;
constexpr int kExitError = 1;
constexpr int kExitBlocked = 2;

struct CliOptions {
    std::string config_file = "config/prompt_firewall.toml";
    std::string environment;
    bool list_rules = false;
    bool show_patterns = false;
    bool show_config = false;
    bool batch = false;
    bool watch = false;
    bool help = false;
    std::vector<std::string> prompt_words;
};

void print_usage(const char* argv0) {
    std::cout << std::format(
        "Usage: {} [options] [PROMPT...]\n"
        "\n"
        "Options:\n"
        "  --config PATH     TOML config file (default: config/prompt_firewall.toml)\n"
        "  --env NAME        Config environment section (default: $PROMPTFW_ENV or development)\n"
        "  --list-rules      Print the active pattern rules and exit\n"
        "  --show-patterns   With --list-rules, include regex sources\n"
        "  --show-config     Print the active configuration summary and exit\n"
        "  --batch           Filter each stdin line, print one batch result\n"
        "  --watch           Filter stdin lines interactively with config hot-reload\n"
        "  -h, --help        Show this help\n"
        "\n"
        "Without a PROMPT argument the prompt is read from stdin.\n"
        "Exit status: 0 allowed, 2 blocked, 1 error.\n",
        argv0);
}

CliOptions parse_args(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const auto next_value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument(std::format("{} requires a value", arg));
            }
            return argv[++i];
        };

        if (arg == "--config") {
            opts.config_file = next_value();
        } else if (arg == "--env") {
            opts.environment = next_value();
        } else if (arg == "--list-rules") {
            opts.list_rules = true;
        } else if (arg == "--show-patterns") {
            opts.show_patterns = true;
        } else if (arg == "--show-config") {
            opts.show_config = true;
        } else if (arg == "--batch") {
            opts.batch = true;
        } else if (arg == "--watch") {
            opts.watch = true;
        } else if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "--") {
            for (++i; i < argc; ++i) opts.prompt_words.emplace_back(argv[i]);
        } else if (arg.starts_with("--")) {
            throw std::invalid_argument(std::format("Unknown option: {}", arg));
        } else {
            opts.prompt_words.push_back(arg);
        }
    }
    return opts;
}

void apply_log_level(const FirewallConfig& config) {
    if (const auto level = utils::log::parse_level(config.logging.level)) {
        utils::log::set_level(*level);
    }
}

std::vector<std::string> read_lines(std::istream& in) {
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(std::move(line));
    }
    return lines;
}

int run_watch_loop(PromptFirewall& firewall, const CliOptions& opts,
                   const FirewallConfig& config) {
    const auto poll_interval = config.config_watcher.poll_interval_seconds > 0
        ? config.config_watcher.poll_interval_seconds : 5;

    g_config_watcher = std::make_shared<ConfigWatcher>(
        opts.config_file, std::chrono::seconds{poll_interval}, opts.environment);
    g_config_watcher->set_callback([&firewall](const FirewallConfig& new_cfg) {
        apply_log_level(new_cfg);
        firewall.reload(new_cfg);
        utils::log::info(std::format("Rules reloaded: {} patterns", new_cfg.patterns.size()));
    });
    g_config_watcher->start();

    std::string line;
    while (std::getline(std::cin, line)) {
        if (utils::is_blank(line)) continue;
        std::cout << to_json(firewall.filter(line)) << std::endl;
    }

    g_config_watcher->stop();
    return kExitAllowed;
}

} // anonymous namespace

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));
    if (g_config_watcher) {
        g_config_watcher->stop();
    }
    std::exit(kExitAllowed);
}

int main(int argc, char* argv[]) {
    try {
        const auto opts = parse_args(argc, argv);
        if (opts.help) {
            print_usage(argv[0]);
            return kExitAllowed;
        }

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        const auto environment = ConfigLoader::resolve_environment(opts.environment);
        utils::log::info(std::format("Loading configuration from {} (environment: {})",
                                      opts.config_file, environment));
        const auto config = ConfigLoader::load_or_default(opts.config_file, environment);
        apply_log_level(config);

        PromptFirewall firewall(config);
        utils::log::info(std::format("Prompt firewall ready: {} patterns, {}",
            config.patterns.size(), config.enabled ? "enabled" : "disabled"));

        if (opts.list_rules) {
            std::cout << rules_to_json(firewall.active_rules(), config.default_action,
                                       opts.show_patterns) << std::endl;
            return kExitAllowed;
        }
        if (opts.show_config) {
            std::cout << config_summary_json(firewall.active_config()) << std::endl;
            return kExitAllowed;
        }
        if (opts.watch) {
            return run_watch_loop(firewall, opts, config);
        }
        if (opts.batch) {
            const auto batch = firewall.filter_batch(read_lines(std::cin));
            std::cout << to_json(batch) << std::endl;
            return batch.summary.blocked > 0 ? kExitBlocked : kExitAllowed;
        }

        std::string prompt;
        if (!opts.prompt_words.empty()) {
            for (size_t i = 0; i < opts.prompt_words.size(); ++i) {
                if (i > 0) prompt += ' ';
                prompt += opts.prompt_words[i];
            }
        } else {
            prompt.assign(std::istreambuf_iterator<char>(std::cin),
                          std::istreambuf_iterator<char>());
        }

        if (utils::is_blank(prompt)) {
            std::cout << R"({"error":"Prompt cannot be empty"})" << std::endl;
            return kExitError;
        }

        const auto result = firewall.filter(prompt);
        std::cout << to_json(result) << std::endl;
        return result.allowed ? kExitAllowed : kExitBlocked;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return kExitError;
    }
}
