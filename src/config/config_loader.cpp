#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml.hpp>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace promptfw {

// Constexpr config keys (used 2+ times)
static constexpr std::string_view kPatterns         = "patterns";
static constexpr std::string_view kPatternScanner   = "pattern_scanner";
static constexpr std::string_view kMorseCodeScanner = "morse_code_scanner";
static constexpr std::string_view kLogging          = "logging";
static constexpr std::string_view kConfigWatcher    = "config_watcher";
static constexpr std::string_view kDefaultSection   = "default";

// ============================================================================
// TOML Parsing Helpers (env expansion, environment sections, merging)
// ============================================================================

namespace {

/**
 * @brief Substitute ${NAME} and ${NAME:-fallback} from the process environment
 *
 * An unset NAME expands to the fallback, or to nothing without one.
 */
std::string expand_env_vars(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    size_t cursor = 0;
    for (size_t open = input.find("${"); open != std::string_view::npos;
         open = input.find("${", cursor)) {
        const size_t close = input.find('}', open + 2);
        if (close == std::string_view::npos) {
            throw std::runtime_error(
                std::format("Unclosed env var substitution at position {}", open));
        }
        out.append(input.substr(cursor, open - cursor));

        std::string_view ref = input.substr(open + 2, close - open - 2);
        std::string_view fallback;
        if (const size_t sep = ref.find(":-"); sep != std::string_view::npos) {
            fallback = ref.substr(sep + 2);
            ref = ref.substr(0, sep);
        }
        const std::string var_name(ref);
        const char* value = std::getenv(var_name.c_str());
        out.append(value && *value ? std::string_view(value) : fallback);
        cursor = close + 1;
    }
    out.append(input.substr(cursor));
    return out;
}

// Rewrites every string leaf under `node` in place
void expand_env_in_node(toml::node& node) {
    if (auto* str = node.as_string()) {
        if (str->get().find("${") != std::string::npos) {
            *str = expand_env_vars(str->get());
        }
    } else if (auto* tbl = node.as_table()) {
        for (auto&& [key, child] : *tbl) expand_env_in_node(child);
    } else if (auto* arr = node.as_array()) {
        for (auto& child : *arr) expand_env_in_node(child);
    }
}

std::string_view rule_name(const toml::node& node) {
    const auto* tbl = node.as_table();
    if (!tbl) return {};
    const auto* name = tbl->get_as<std::string>("name");
    return name ? std::string_view(name->get()) : std::string_view{};
}

/**
 * @brief Layer environment rules over the defaults
 *
 * A rule whose name matches an existing one replaces it in place; any other
 * rule is appended after the defaults.
 */
void overlay_patterns(toml::array& base, const toml::array& overlay) {
    for (const auto& rule : overlay) {
        const auto name = rule_name(rule);
        auto it = name.empty() ? base.end()
            : std::find_if(base.begin(), base.end(),
                           [&](const toml::node& n) { return rule_name(n) == name; });
        if (it != base.end()) {
            base.replace(it, rule);
        } else {
            base.push_back(rule);
        }
    }
}

/**
 * @brief Overlay an environment section onto the defaults
 *
 * Sub-tables merge key by key, the patterns array goes through
 * overlay_patterns, and every other value is replaced outright.
 */
void merge_section(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        auto* base_node = base.get(key.str());
        if (base_node && base_node->is_table() && val.is_table()) {
            merge_section(*base_node->as_table(), *val.as_table());
        } else if (key.str() == kPatterns && base_node && base_node->is_array() && val.is_array()) {
            overlay_patterns(*base_node->as_array(), *val.as_array());
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

bool is_reserved_key(std::string_view key) {
    return key == kPatterns || key == kPatternScanner || key == kMorseCodeScanner ||
           key == kLogging || key == kConfigWatcher;
}

/**
 * @brief Pick the effective table: [default] merged with [<environment>]
 */
toml::table select_environment(const toml::table& root, const std::string& environment) {
    const auto* defaults = root[kDefaultSection].as_table();
    const toml::table* env_tbl = nullptr;
    if (!environment.empty() && !is_reserved_key(environment)) {
        env_tbl = root[environment].as_table();
    }

    if (!defaults && !env_tbl) {
        return root;
    }

    toml::table effective = defaults ? *defaults : toml::table{};
    if (env_tbl && env_tbl != defaults) {
        merge_section(effective, *env_tbl);
    }
    utils::log::debug(std::format("Config: using {}{} section",
        defaults ? "[default]" : "",
        env_tbl ? std::format(" + [{}]", environment) : ""s));
    return effective;
}

// ---- Extraction helpers ----------------------------------------------------

std::optional<size_t> positive_size(const toml::table& tbl, std::string_view key,
                                    size_t fallback, std::string_view section,
                                    std::vector<std::string>& errors) {
    const auto v = tbl[key].value<int64_t>();
    if (!v) return fallback;
    if (*v <= 0) {
        errors.push_back(std::format("{}.{} must be > 0, got {}", section, key, *v));
        return std::nullopt;
    }
    return static_cast<size_t>(*v);
}

std::vector<PatternRuleConfig> extract_patterns(const toml::table& root) {
    std::vector<PatternRuleConfig> result;
    const auto* arr = root[kPatterns].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (size_t i = 0; i < arr->size(); ++i) {
        const auto* p = (*arr)[i].as_table();
        if (!p) continue;

        PatternRuleConfig rule;
        rule.name = (*p)["name"].value_or(""s);
        rule.pattern = (*p)["pattern"].value_or(""s);
        rule.description = (*p)["description"].value_or(""s);

        if (rule.name.empty() || rule.pattern.empty()) {
            utils::log::warn(std::format(
                "patterns[{}]: skipped, 'name' and 'pattern' are required", i));
            continue;
        }

        if (auto action_str = (*p)["action"].value<std::string>()) {
            rule.action = parse_action(*action_str);
            if (!rule.action) {
                // Unknown actions rank lowest
                utils::log::warn(std::format(
                    "Pattern '{}': unrecognized action '{}', ranked as allow",
                    rule.name, *action_str));
                rule.action = Action::ALLOW;
            }
        }

        result.emplace_back(std::move(rule));
    }
    return result;
}

PatternScannerConfig extract_pattern_scanner(const toml::table& root,
                                             std::vector<std::string>& errors) {
    PatternScannerConfig cfg;
    const auto* section = root[kPatternScanner].as_table();
    if (!section) return cfg;
    const auto& s = *section;

    cfg.enabled = s["enabled"].value_or(true);
    cfg.max_prompt_length = positive_size(s, "max_prompt_length", cfg.max_prompt_length,
                                          kPatternScanner, errors).value_or(0);
    if (auto action_str = s["oversize_action"].value<std::string>()) {
        if (const auto action = parse_action(*action_str)) {
            cfg.oversize_action = *action;
        } else {
            errors.push_back(std::format(
                "pattern_scanner.oversize_action must be one of allow/log/warn/block, got '{}'",
                *action_str));
        }
    }
    return cfg;
}

MorseScannerConfig extract_morse_scanner(const toml::table& root,
                                         std::vector<std::string>& errors) {
    MorseScannerConfig cfg;
    const auto* section = root[kMorseCodeScanner].as_table();
    if (!section) return cfg;
    const auto& m = *section;

    cfg.enabled = m["enabled"].value_or(true);
    cfg.min_morse_length = positive_size(m, "min_morse_length", cfg.min_morse_length,
                                         kMorseCodeScanner, errors).value_or(0);
    cfg.max_decode_length = positive_size(m, "max_decode_length", cfg.max_decode_length,
                                          kMorseCodeScanner, errors).value_or(0);
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* section = root[kLogging].as_table();
    if (!section) return cfg;
    const auto& l = *section;

    cfg.enabled = l["enabled"].value_or(true);
    cfg.level = utils::to_lower(l["level"].value_or("info"s));
    cfg.log_blocked = l["log_blocked"].value_or(true);
    cfg.log_allowed = l["log_allowed"].value_or(false);
    return cfg;
}

ConfigWatcherConfig extract_config_watcher(const toml::table& root) {
    ConfigWatcherConfig cfg;
    const auto* section = root[kConfigWatcher].as_table();
    if (!section) return cfg;

    cfg.enabled = (*section)["enabled"].value_or(false);
    cfg.poll_interval_seconds = (*section)["poll_interval_seconds"].value_or(5);
    return cfg;
}

FirewallConfig extract_all_sections(const toml::table& tbl, std::vector<std::string>& errors) {
    FirewallConfig config;
    config.enabled = tbl["enabled"].value_or(true);

    const std::string default_action = tbl["default_action"].value_or("block"s);
    if (const auto action = parse_action(default_action)) {
        config.default_action = *action;
    } else {
        errors.push_back(std::format(
            "default_action must be one of allow/log/warn/block, got '{}'", default_action));
    }

    config.patterns = extract_patterns(tbl);
    config.pattern_scanner = extract_pattern_scanner(tbl, errors);
    config.morse_code_scanner = extract_morse_scanner(tbl, errors);
    config.logging = extract_logging(tbl);
    config.config_watcher = extract_config_watcher(tbl);
    return config;
}

ConfigLoader::LoadResult validate_and_return(FirewallConfig config,
                                             std::vector<std::string> errors) {
    for (auto& err : ConfigLoader::validate_config(config)) {
        errors.push_back(std::move(err));
    }
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

ConfigLoader::LoadResult load_table(const toml::table& parsed, const std::string& environment) {
    auto tbl = select_environment(parsed, ConfigLoader::resolve_environment(environment));
    expand_env_in_node(tbl);

    std::vector<std::string> errors;
    auto config = extract_all_sections(tbl, errors);
    return validate_and_return(std::move(config), std::move(errors));
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

std::string ConfigLoader::resolve_environment(const std::string& environment) {
    if (!environment.empty()) return environment;
    const char* env_val = std::getenv(kEnvironmentVariable);
    if (env_val && *env_val) return env_val;
    return kDefaultEnvironment;
}

FirewallConfig ConfigLoader::default_config() {
    FirewallConfig config;
    config.enabled = true;
    config.default_action = Action::BLOCK;
    config.logging.enabled = true;
    config.logging.level = "info";
    config.logging.log_blocked = true;
    config.logging.log_allowed = false;
    return config;
}

std::vector<std::string> ConfigLoader::validate_config(const FirewallConfig& config) {
    std::vector<std::string> errors;

    if (config.pattern_scanner.max_prompt_length == 0) {
        errors.push_back("pattern_scanner.max_prompt_length must be > 0");
    } else if (config.pattern_scanner.max_prompt_length > kPromptLengthCeiling) {
        errors.push_back(std::format("pattern_scanner.max_prompt_length must be <= {}, got {}",
                                     kPromptLengthCeiling,
                                     config.pattern_scanner.max_prompt_length));
    }
    if (config.morse_code_scanner.min_morse_length == 0) {
        errors.push_back("morse_code_scanner.min_morse_length must be > 0");
    }
    if (config.morse_code_scanner.max_decode_length == 0) {
        errors.push_back("morse_code_scanner.max_decode_length must be > 0");
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug/info/warn/error, got '{}'", config.logging.level));
    }

    if (config.config_watcher.enabled && config.config_watcher.poll_interval_seconds <= 0) {
        errors.push_back("config_watcher.poll_interval_seconds must be > 0 when enabled");
    }

    return errors;
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path,
                                                      const std::string& environment) {
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        return LoadResult::error(std::format("Config file not found: {}", config_path));
    }

    try {
        const auto parsed = toml::parse_file(config_path);
        return load_table(parsed, environment);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content,
                                                        const std::string& environment) {
    try {
        const auto parsed = toml::parse(toml_content);
        return load_table(parsed, environment);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

FirewallConfig ConfigLoader::load_or_default(const std::string& config_path,
                                             const std::string& environment) {
    auto result = load_from_file(config_path, environment);
    if (!result.success) {
        utils::log::warn(std::format("{} - using built-in default configuration",
                                      result.error_message));
        return default_config();
    }
    return std::move(result.config);
}

} // namespace promptfw
