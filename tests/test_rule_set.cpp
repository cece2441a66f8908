#include <catch2/catch_test_macros.hpp>
#include "scanner/rule_set.hpp"

using namespace promptfw;

TEST_CASE("compile_pattern handles inline flags", "[rule_set]") {
    SECTION("(?i) compiles case-insensitive") {
        auto r = compile_pattern("(?i)drop\\s+table");
        REQUIRE(r.is_ok());
        REQUIRE(std::regex_search("x; DROP   Table users", r.value()));
    }

    SECTION("Without a flag group matching is case-sensitive") {
        auto r = compile_pattern("drop\\s+table");
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(std::regex_search("DROP TABLE", r.value()));
        REQUIRE(std::regex_search("drop table", r.value()));
    }

    SECTION("Non-capturing group is not a flag group") {
        auto r = compile_pattern("(?:ab)+c");
        REQUIRE(r.is_ok());
        REQUIRE(std::regex_search("ababc", r.value()));
    }

    SECTION("Unsupported inline flag is a pattern error") {
        auto r = compile_pattern("(?x)abc");
        REQUIRE(r.is_error());
        REQUIRE(r.error_category() == ErrorCategory::UNSUPPORTED_FLAG);
    }

    SECTION("Unbalanced pattern is a pattern error") {
        auto r = compile_pattern("(unclosed");
        REQUIRE(r.is_error());
        REQUIRE(r.error_category() == ErrorCategory::INVALID_REGEX);
    }

    SECTION("Empty pattern is rejected") {
        auto r = compile_pattern("");
        REQUIRE(r.is_error());
        REQUIRE(r.error_category() == ErrorCategory::EMPTY_PATTERN);
    }
}

TEST_CASE("RuleSet compiles rules in order and neutralizes invalid ones", "[rule_set]") {
    std::vector<PatternRuleConfig> patterns = {
        {"First", "(?i)first", Action::WARN, "first rule"},
        {"Broken", "([a-z", Action::BLOCK, "bad regex"},
        {"Defaulted", "third", std::nullopt, "uses default action"},
    };

    auto set = RuleSet::compile(patterns, Action::LOG);
    REQUIRE(set->size() == 3);
    REQUIRE(set->invalid_count() == 1);

    const auto& rules = set->rules();
    REQUIRE(rules[0].name == "First");
    REQUIRE(rules[0].valid());
    REQUIRE(rules[0].action == Action::WARN);

    REQUIRE(rules[1].name == "Broken");
    REQUIRE_FALSE(rules[1].valid());
    REQUIRE_FALSE(rules[1].compile_error.empty());

    REQUIRE(rules[2].valid());
    REQUIRE(rules[2].action == Action::LOG);
    REQUIRE(rules[2].source == "third");
}

TEST_CASE("RuleSet from empty list", "[rule_set]") {
    auto set = RuleSet::compile({}, Action::BLOCK);
    REQUIRE(set->size() == 0);
    REQUIRE(set->invalid_count() == 0);
}
