#include <catch2/catch_test_macros.hpp>
#include "firewall/verdict_json.hpp"

#include <string>

using namespace promptfw;

namespace {

ScanMatch regex_match() {
    ScanMatch m;
    m.name = "SQL Injection";
    m.action = Action::BLOCK;
    m.description = "Says \"drop\"";
    m.metadata.scanner_type = "regex";
    m.metadata.pattern = "(?i)drop\\s+table";
    return m;
}

ScanMatch morse_match() {
    ScanMatch m;
    m.name = "Morse Code Role Override";
    m.action = Action::WARN;
    m.description = "Detected role override attempt hidden in morse code";
    m.metadata.scanner_type = "morse_code";
    m.metadata.morse_sequence = "-.-- --- ..-";
    m.metadata.decoded_text = "YOU";
    m.metadata.original_position = 1;
    m.metadata.byte_offset = 7;
    return m;
}

bool has(const std::string& json, const std::string& fragment) {
    return json.find(fragment) != std::string::npos;
}

} // anonymous namespace

TEST_CASE("Empty verdict renders with null message", "[json]") {
    FilterResult result;
    REQUIRE(to_json(result) ==
            R"({"allowed":true,"action":"allow","message":null,"matched_patterns":[],"scanner_results":[]})");
}

TEST_CASE("Match metadata renders only present fields", "[json]") {
    SECTION("Regex match") {
        REQUIRE(to_json(regex_match().metadata) ==
                R"({"scanner_type":"regex","pattern":"(?i)drop\\s+table"})");
    }

    SECTION("Morse match") {
        REQUIRE(to_json(morse_match().metadata) ==
                R"({"scanner_type":"morse_code","morse_sequence":"-.-- --- ..-","decoded_text":"YOU","original_position":1,"byte_offset":7})");
    }
}

TEST_CASE("Blocked verdict renders matches and scanner results", "[json]") {
    FilterResult result;
    result.allowed = false;
    result.action = Action::BLOCK;
    result.message = "Prompt blocked due to security policy violations: SQL Injection";
    result.matched_patterns.emplace_back(regex_match());
    result.matched_patterns.emplace_back(morse_match());
    result.scanner_results.emplace_back("Pattern Scanner", std::vector<ScanMatch>{regex_match()});
    result.scanner_results.emplace_back("Morse Code Scanner", std::vector<ScanMatch>{morse_match()});

    const auto json = to_json(result);
    REQUIRE(json.starts_with(R"({"allowed":false,"action":"block","message":"Prompt blocked)"));
    REQUIRE(has(json, R"({"name":"SQL Injection","pattern":"(?i)drop\\s+table","action":"block","description":"Says \"drop\"")"));
    REQUIRE(has(json, R"({"name":"Morse Code Role Override","pattern":null,"action":"warn")"));
    REQUIRE(has(json, R"("scanner_results":[{"scanner_name":"Pattern Scanner","matches":[{"name":"SQL Injection")"));
    REQUIRE(has(json, R"({"scanner_name":"Morse Code Scanner","matches":[)"));
}

TEST_CASE("Faulted scanner result carries its error", "[json]") {
    ScanResult result("Faulty");
    result.error = "boom";
    REQUIRE(to_json(result) == R"({"scanner_name":"Faulty","matches":[],"error":"boom"})");
}

TEST_CASE("Batch result renders entries and summary", "[json]") {
    BatchFilterResult batch;

    BatchEntry ok;
    ok.index = 0;
    ok.result = FilterResult{};
    batch.results.push_back(ok);

    BatchEntry bad;
    bad.index = 1;
    bad.error = "Prompt cannot be empty";
    batch.results.push_back(bad);

    batch.summary = BatchSummary{2, 1, 0, 1};

    REQUIRE(to_json(batch) ==
            R"({"results":[{"index":0,"allowed":true,"action":"allow","message":null,"matched_patterns":[],"scanner_results":[]},)"
            R"({"index":1,"error":"Prompt cannot be empty","allowed":false,"action":"error"}],)"
            R"("summary":{"total":2,"allowed":1,"blocked":0,"errors":1}})");
}

TEST_CASE("Rule listing withholds regex source by default", "[json]") {
    std::vector<PatternRuleConfig> rules = {
        {"SQL Injection", "(?i)drop\\s+table", Action::BLOCK, "SQL"},
        {"Defaulted", "secret", std::nullopt, ""},
    };

    const auto hidden = rules_to_json(rules, Action::WARN);
    REQUIRE(hidden ==
            R"({"patterns":[{"name":"SQL Injection","action":"block","description":"SQL"},)"
            R"({"name":"Defaulted","action":"warn","description":""}],"count":2})");

    const auto shown = rules_to_json(rules, Action::WARN, true);
    REQUIRE(has(shown, R"("pattern":"(?i)drop\\s+table")"));
    REQUIRE(has(shown, R"("pattern":"secret")"));
}

TEST_CASE("Config summary", "[json]") {
    FirewallConfig cfg;
    cfg.patterns.push_back({"A", "a", std::nullopt, ""});

    const auto json = config_summary_json(cfg);
    REQUIRE(json.starts_with(R"({"enabled":true,"default_action":"block","patterns_count":1,)"));
    REQUIRE(has(json, R"("pattern_scanner":{"enabled":true,"max_prompt_length":10000,"oversize_action":"warn"})"));
    REQUIRE(has(json, R"("morse_code_scanner":{"enabled":true,"min_morse_length":10,"max_decode_length":1000})"));
    REQUIRE(has(json, R"("logging":{"enabled":true,"level":"info","log_blocked":true,"log_allowed":false})"));
    REQUIRE(json.ends_with(R"("config_watcher":{"enabled":false,"poll_interval_seconds":5}})"));
}
