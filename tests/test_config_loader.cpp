#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_message.hpp>
#include "config/config_loader.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>

using namespace promptfw;

// ============================================================================
// Helper: Write a TOML string to a temp file
// ============================================================================

static std::string write_temp_toml(const std::string& content, const std::string& suffix = "") {
    auto path = std::filesystem::temp_directory_path() /
                ("promptfw_config" + suffix + "_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
                 ".toml");
    std::ofstream f(path);
    f << content;
    f.close();
    return path.string();
}

// ============================================================================
// Defaults
// ============================================================================

TEST_CASE("ConfigLoader defaults", "[config]") {
    SECTION("Empty document yields defaults") {
        auto result = ConfigLoader::load_from_string("", "development");
        REQUIRE(result.success);
        const auto& cfg = result.config;
        REQUIRE(cfg.enabled);
        REQUIRE(cfg.default_action == Action::BLOCK);
        REQUIRE(cfg.patterns.empty());
        REQUIRE(cfg.pattern_scanner.enabled);
        REQUIRE(cfg.morse_code_scanner.enabled);
        REQUIRE(cfg.morse_code_scanner.min_morse_length == 10);
        REQUIRE(cfg.morse_code_scanner.max_decode_length == 1000);
        REQUIRE(cfg.logging.enabled);
        REQUIRE(cfg.logging.level == "info");
        REQUIRE(cfg.logging.log_blocked);
        REQUIRE_FALSE(cfg.logging.log_allowed);
        REQUIRE_FALSE(cfg.config_watcher.enabled);
    }

    SECTION("default_config matches the documented built-in") {
        auto cfg = ConfigLoader::default_config();
        REQUIRE(cfg.enabled);
        REQUIRE(cfg.default_action == Action::BLOCK);
        REQUIRE(cfg.patterns.empty());
        REQUIRE(ConfigLoader::validate_config(cfg).empty());
    }
}

// ============================================================================
// Extraction
// ============================================================================

TEST_CASE("ConfigLoader extracts patterns and scanner settings", "[config]") {
    auto result = ConfigLoader::load_from_string(R"(
        enabled = true
        default_action = "warn"

        [[patterns]]
        name = "SQL Injection"
        pattern = '(?i)drop\s+table'
        action = "block"
        description = "SQL injection attempt"

        [[patterns]]
        name = "No Action"
        pattern = "secret"

        [pattern_scanner]
        enabled = false

        [morse_code_scanner]
        enabled = true
        min_morse_length = 12
        max_decode_length = 200

        [logging]
        level = "DEBUG"
        log_allowed = true
    )", "development");

    REQUIRE(result.success);
    const auto& cfg = result.config;
    REQUIRE(cfg.default_action == Action::WARN);
    REQUIRE(cfg.patterns.size() == 2);
    REQUIRE(cfg.patterns[0].name == "SQL Injection");
    REQUIRE(cfg.patterns[0].pattern == "(?i)drop\\s+table");
    REQUIRE(cfg.patterns[0].action == Action::BLOCK);
    REQUIRE(cfg.patterns[0].description == "SQL injection attempt");
    REQUIRE_FALSE(cfg.patterns[1].action.has_value());
    REQUIRE_FALSE(cfg.pattern_scanner.enabled);
    REQUIRE(cfg.morse_code_scanner.min_morse_length == 12);
    REQUIRE(cfg.morse_code_scanner.max_decode_length == 200);
    REQUIRE(cfg.logging.level == "debug");
    REQUIRE(cfg.logging.log_allowed);
}

TEST_CASE("ConfigLoader tolerates incomplete rules", "[config]") {
    auto result = ConfigLoader::load_from_string(R"(
        [[patterns]]
        name = "Missing pattern"

        [[patterns]]
        name = "Odd action"
        pattern = "x"
        action = "quarantine"
    )", "development");

    REQUIRE(result.success);
    REQUIRE(result.config.patterns.size() == 1);
    REQUIRE(result.config.patterns[0].name == "Odd action");
    REQUIRE(result.config.patterns[0].action == Action::ALLOW);
}

TEST_CASE("ConfigLoader extracts config_watcher settings", "[config]") {
    auto result = ConfigLoader::load_from_string(R"(
        [config_watcher]
        enabled = true
        poll_interval_seconds = 15
    )", "development");

    REQUIRE(result.success);
    REQUIRE(result.config.config_watcher.enabled);
    REQUIRE(result.config.config_watcher.poll_interval_seconds == 15);
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("ConfigLoader rejects invalid values", "[config]") {
    SECTION("Unknown default_action") {
        auto result = ConfigLoader::load_from_string(R"(default_action = "deny")", "development");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_message.find("default_action") != std::string::npos);
    }

    SECTION("Non-positive morse thresholds") {
        auto result = ConfigLoader::load_from_string(R"(
            [morse_code_scanner]
            min_morse_length = 0
            max_decode_length = -5
        )", "development");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_message.find("min_morse_length") != std::string::npos);
        REQUIRE(result.error_message.find("max_decode_length") != std::string::npos);
    }

    SECTION("Unknown logging level") {
        auto result = ConfigLoader::load_from_string(R"(
            [logging]
            level = "verbose"
        )", "development");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_message.find("logging.level") != std::string::npos);
    }

    SECTION("Watcher with zero poll interval") {
        auto result = ConfigLoader::load_from_string(R"(
            [config_watcher]
            enabled = true
            poll_interval_seconds = 0
        )", "development");
        REQUIRE_FALSE(result.success);
    }

    SECTION("Malformed TOML") {
        auto result = ConfigLoader::load_from_string("[[broken\nnot toml", "development");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_message.find("Failed to parse config") != std::string::npos);
    }
}

// ============================================================================
// Environment sections
// ============================================================================

TEST_CASE("ConfigLoader merges [default] with the environment section", "[config][env]") {
    const std::string doc = R"(
        [default]
        default_action = "block"

        [default.logging]
        level = "info"

        [[default.patterns]]
        name = "Base"
        pattern = "base"

        [development.logging]
        level = "debug"

        [production]
        enabled = true
        [production.logging]
        level = "error"
        [[production.patterns]]
        name = "Prod Only"
        pattern = "prod"
        action = "warn"
    )";

    SECTION("development overrides scalars") {
        auto result = ConfigLoader::load_from_string(doc, "development");
        REQUIRE(result.success);
        REQUIRE(result.config.logging.level == "debug");
        REQUIRE(result.config.patterns.size() == 1);
    }

    SECTION("production appends patterns") {
        auto result = ConfigLoader::load_from_string(doc, "production");
        REQUIRE(result.success);
        REQUIRE(result.config.logging.level == "error");
        REQUIRE(result.config.patterns.size() == 2);
        REQUIRE(result.config.patterns[0].name == "Base");
        REQUIRE(result.config.patterns[1].name == "Prod Only");
    }

    SECTION("Unknown environment uses [default] alone") {
        auto result = ConfigLoader::load_from_string(doc, "staging");
        REQUIRE(result.success);
        REQUIRE(result.config.logging.level == "info");
        REQUIRE(result.config.patterns.size() == 1);
    }
}

TEST_CASE("resolve_environment precedence", "[config][env]") {
    REQUIRE(ConfigLoader::resolve_environment("production") == "production");

    ::setenv(kEnvironmentVariable, "test", 1);
    REQUIRE(ConfigLoader::resolve_environment("") == "test");

    ::unsetenv(kEnvironmentVariable);
    REQUIRE(ConfigLoader::resolve_environment("") == kDefaultEnvironment);
}

// ============================================================================
// ${VAR} expansion
// ============================================================================

TEST_CASE("ConfigLoader expands environment variables", "[config][env]") {
    ::setenv("PROMPTFW_TEST_LEVEL", "warn", 1);
    ::setenv("PROMPTFW_TEST_WORD", "forbidden", 1);

    auto result = ConfigLoader::load_from_string(R"(
        [logging]
        level = "${PROMPTFW_TEST_LEVEL}"

        [[patterns]]
        name = "Word"
        pattern = "(?i)${PROMPTFW_TEST_WORD}"
    )", "development");

    REQUIRE(result.success);
    REQUIRE(result.config.logging.level == "warn");
    REQUIRE(result.config.patterns[0].pattern == "(?i)forbidden");

    SECTION("Unclosed substitution is an error") {
        auto bad = ConfigLoader::load_from_string(R"(
            [logging]
            level = "${UNCLOSED"
        )", "development");
        REQUIRE_FALSE(bad.success);
    }

    ::unsetenv("PROMPTFW_TEST_LEVEL");
    ::unsetenv("PROMPTFW_TEST_WORD");
}

// ============================================================================
// Files and fallback
// ============================================================================

TEST_CASE("ConfigLoader loads from file", "[config]") {
    auto path = write_temp_toml(R"(
        default_action = "log"
        [[patterns]]
        name = "File Rule"
        pattern = "file"
    )", "_file");

    auto result = ConfigLoader::load_from_file(path, "development");
    REQUIRE(result.success);
    REQUIRE(result.config.default_action == Action::LOG);
    REQUIRE(result.config.patterns.size() == 1);

    std::filesystem::remove(path);
}

TEST_CASE("ConfigLoader falls back to defaults", "[config]") {
    SECTION("Missing file is an error for load_from_file") {
        auto result = ConfigLoader::load_from_file("/nonexistent/promptfw.toml", "development");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_message.find("Config file not found") != std::string::npos);
    }

    SECTION("load_or_default masks a missing file") {
        auto cfg = ConfigLoader::load_or_default("/nonexistent/promptfw.toml", "development");
        REQUIRE(cfg.enabled);
        REQUIRE(cfg.default_action == Action::BLOCK);
        REQUIRE(cfg.patterns.empty());
    }

    SECTION("load_or_default masks an invalid file") {
        auto path = write_temp_toml("default_action = \"nope\"", "_invalid");
        auto cfg = ConfigLoader::load_or_default(path, "development");
        REQUIRE(cfg.default_action == Action::BLOCK);
        std::filesystem::remove(path);
    }
}

TEST_CASE("Shipped sample configuration loads", "[config]") {
    const std::string path = std::string(PROMPTFW_SOURCE_DIR) + "/config/prompt_firewall.toml";

    for (const char* env : {"development", "test", "production"}) {
        auto result = ConfigLoader::load_from_file(path, env);
        INFO(result.error_message);
        REQUIRE(result.success);
        REQUIRE(result.config.patterns.size() >= 8);
    }
}

// ============================================================================
// Pattern scanner limits
// ============================================================================

TEST_CASE("ConfigLoader reads and validates the prompt length limit", "[config]") {
    SECTION("Defaults") {
        auto result = ConfigLoader::load_from_string("", "development");
        REQUIRE(result.success);
        REQUIRE(result.config.pattern_scanner.max_prompt_length == 10000);
        REQUIRE(result.config.pattern_scanner.oversize_action == Action::WARN);
    }

    SECTION("Explicit values") {
        auto result = ConfigLoader::load_from_string(R"(
            [pattern_scanner]
            max_prompt_length = 4096
            oversize_action = "block"
        )", "development");
        REQUIRE(result.success);
        REQUIRE(result.config.pattern_scanner.max_prompt_length == 4096);
        REQUIRE(result.config.pattern_scanner.oversize_action == Action::BLOCK);
    }

    SECTION("Zero is rejected") {
        auto result = ConfigLoader::load_from_string(R"(
            [pattern_scanner]
            max_prompt_length = 0
        )", "development");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_message.find("max_prompt_length") != std::string::npos);
    }

    SECTION("Values above the ceiling are rejected") {
        auto result = ConfigLoader::load_from_string(std::format(R"(
            [pattern_scanner]
            max_prompt_length = {}
        )", kPromptLengthCeiling + 1), "development");
        REQUIRE_FALSE(result.success);
    }

    SECTION("Unknown oversize action is rejected") {
        auto result = ConfigLoader::load_from_string(R"(
            [pattern_scanner]
            oversize_action = "shrug"
        )", "development");
        REQUIRE_FALSE(result.success);
    }
}

TEST_CASE("ConfigLoader expansion supports fallbacks", "[config][env]") {
    ::unsetenv("PROMPTFW_TEST_UNSET");
    ::setenv("PROMPTFW_TEST_SET", "error", 1);

    auto result = ConfigLoader::load_from_string(R"(
        default_action = "${PROMPTFW_TEST_UNSET:-warn}"
        [logging]
        level = "${PROMPTFW_TEST_SET:-debug}"
        [[patterns]]
        name = "Nested ${PROMPTFW_TEST_UNSET:-rule}"
        pattern = "x${PROMPTFW_TEST_UNSET}y"
    )", "development");

    REQUIRE(result.success);
    REQUIRE(result.config.default_action == Action::WARN);
    REQUIRE(result.config.logging.level == "error");
    REQUIRE(result.config.patterns[0].name == "Nested rule");
    REQUIRE(result.config.patterns[0].pattern == "xy");

    ::unsetenv("PROMPTFW_TEST_SET");
}

TEST_CASE("Environment rules override default rules by name", "[config][env]") {
    auto result = ConfigLoader::load_from_string(R"(
        [[default.patterns]]
        name = "Credentials"
        pattern = "password"
        action = "log"

        [[default.patterns]]
        name = "Shell"
        pattern = "rm -rf"
        action = "block"

        [[production.patterns]]
        name = "Credentials"
        pattern = "password|secret"
        action = "block"

        [[production.patterns]]
        name = "Exfiltration"
        pattern = "upload"
        action = "warn"
    )", "production");

    REQUIRE(result.success);
    const auto& patterns = result.config.patterns;
    REQUIRE(patterns.size() == 3);
    REQUIRE(patterns[0].name == "Credentials");
    REQUIRE(patterns[0].pattern == "password|secret");
    REQUIRE(patterns[0].action == Action::BLOCK);
    REQUIRE(patterns[1].name == "Shell");
    REQUIRE(patterns[2].name == "Exfiltration");
}
