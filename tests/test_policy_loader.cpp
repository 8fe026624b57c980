#include <catch2/catch_test_macros.hpp>
#include "policy/policy_loader.hpp"

using namespace promptguard;

TEST_CASE("PolicyLoader parses a full policy", "[policy][loader]") {
    const auto result = PolicyLoader::load_from_string(R"(
        [[policies]]
        name = "block_sql"
        action = "block"
        severity = "high"
        threshold = 0.7
        categories = ["sql_injection", "injection"]
        priority = 3
        description = "SQL never reaches the model"

        [[policies]]
        name = "log_everything"
        enabled = false
        action = "LOG"
        severity = "Low"
        threshold = 25
    )");

    REQUIRE(result.success);
    REQUIRE(result.policies.size() == 2);

    const auto& p = result.policies[0];
    REQUIRE(p.name == "block_sql");
    REQUIRE(p.enabled);
    REQUIRE(p.action == Action::BLOCK);
    REQUIRE(p.severity == ThreatLevel::HIGH);
    REQUIRE(p.threshold == 0.7);
    REQUIRE(category_mask::test(p.categories, ThreatCategory::SQL_INJECTION));
    REQUIRE(category_mask::test(p.categories, ThreatCategory::INJECTION));
    REQUIRE_FALSE(category_mask::test(p.categories, ThreatCategory::PII));
    REQUIRE(p.priority == 3);
    REQUIRE(p.declaration_index == 0);
    REQUIRE(p.description == "SQL never reaches the model");

    const auto& q = result.policies[1];
    REQUIRE_FALSE(q.enabled);
    REQUIRE(q.action == Action::LOG);
    REQUIRE(q.severity == ThreatLevel::LOW);
    REQUIRE(q.threshold == 25.0);
    REQUIRE_FALSE(q.priority.has_value());
    REQUIRE(q.declaration_index == 1);
    REQUIRE_FALSE(q.has_category_filter());
}

TEST_CASE("PolicyLoader rejects malformed policies", "[policy][loader]") {
    SECTION("missing policies array") {
        const auto r = PolicyLoader::load_from_string("[audit]\nenabled = true\n");
        REQUIRE_FALSE(r.success);
        REQUIRE(r.error_message.find("No [[policies]]") != std::string::npos);
    }

    SECTION("missing name") {
        const auto r = PolicyLoader::load_from_string(R"(
            [[policies]]
            action = "block"
            severity = "high"
        )");
        REQUIRE_FALSE(r.success);
        REQUIRE(r.error_message.find("must have a name") != std::string::npos);
    }

    SECTION("unknown action") {
        const auto r = PolicyLoader::load_from_string(R"(
            [[policies]]
            name = "p"
            action = "quarantine"
            severity = "high"
        )");
        REQUIRE_FALSE(r.success);
        REQUIRE(r.error_message.find("Invalid action 'quarantine'") != std::string::npos);
    }

    SECTION("missing severity") {
        const auto r = PolicyLoader::load_from_string(R"(
            [[policies]]
            name = "p"
            action = "block"
        )");
        REQUIRE_FALSE(r.success);
    }

    SECTION("unknown category") {
        const auto r = PolicyLoader::load_from_string(R"(
            [[policies]]
            name = "p"
            action = "block"
            severity = "high"
            categories = ["toxicity"]
        )");
        REQUIRE_FALSE(r.success);
        REQUIRE(r.error_message.find("Invalid category 'toxicity'") != std::string::npos);
    }

    SECTION("repeated category") {
        const auto r = PolicyLoader::load_from_string(R"(
            [[policies]]
            name = "p"
            action = "block"
            severity = "high"
            categories = ["pii", "pii"]
        )");
        REQUIRE_FALSE(r.success);
        REQUIRE(r.error_message.find("duplicate category 'pii'") != std::string::npos);
    }

    SECTION("threshold out of range") {
        const auto r = PolicyLoader::load_from_string(R"(
            [[policies]]
            name = "p"
            action = "block"
            severity = "high"
            threshold = 250
        )");
        REQUIRE_FALSE(r.success);
    }

    SECTION("negative priority") {
        const auto r = PolicyLoader::load_from_string(R"(
            [[policies]]
            name = "p"
            action = "block"
            severity = "high"
            priority = -2
        )");
        REQUIRE_FALSE(r.success);
    }

    SECTION("TOML syntax error") {
        const auto r = PolicyLoader::load_from_string("[[policies]\nname = ");
        REQUIRE_FALSE(r.success);
        REQUIRE(r.error_message.find("TOML parse error") != std::string::npos);
    }
}

TEST_CASE("PolicyLoader load_from_file reports missing files", "[policy][loader]") {
    const auto r = PolicyLoader::load_from_file("/nonexistent/promptguard.toml");
    REQUIRE_FALSE(r.success);
    REQUIRE(r.error_message.find("Cannot open config file") != std::string::npos);
}
