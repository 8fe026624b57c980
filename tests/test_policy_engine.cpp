#include <catch2/catch_test_macros.hpp>
#include "policy/policy_engine.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace promptguard;

// Helper to build an assessment at a given score
static ThreatAssessment make_assessment(double score,
                                        std::initializer_list<ThreatCategory> categories = {}) {
    ThreatAssessment a;
    a.score = score;
    a.pattern_score = score;
    a.level = threat_level_from_score(score);
    for (const auto c : categories) a.categories |= category_mask::bit(c);
    return a;
}

// Helper to build a policy
static Policy make_policy(const std::string& name, Action action, ThreatLevel severity,
                          double threshold = 0.0,
                          std::initializer_list<ThreatCategory> categories = {}) {
    Policy p;
    p.name = name;
    p.action = action;
    p.severity = severity;
    p.threshold = threshold;
    for (const auto c : categories) p.categories |= category_mask::bit(c);
    return p;
}

// ============================================================================
// Default rule set
// ============================================================================

TEST_CASE("PolicyEngine defaults map bands to actions", "[policy]") {
    PolicyEngine engine;
    REQUIRE(engine.policy_count() == 4);

    SECTION("critical blocks") {
        const auto r = engine.evaluate(make_assessment(100.0));
        REQUIRE(r.action == Action::BLOCK);
        REQUIRE(r.matched_policy == "block_critical_threats");
    }

    SECTION("high sanitizes") {
        const auto r = engine.evaluate(make_assessment(70.0));
        REQUIRE(r.action == Action::SANITIZE);
        REQUIRE(r.matched_policy == "sanitize_high_threats");
        REQUIRE(r.reason == "Score 70.00 (high) matched policy 'sanitize_high_threats'");
    }

    SECTION("85 is still high") {
        REQUIRE(engine.evaluate(make_assessment(85.0)).action == Action::SANITIZE);
    }

    SECTION("medium logs") {
        const auto r = engine.evaluate(make_assessment(45.0));
        REQUIRE(r.action == Action::LOG);
        REQUIRE(r.matched_policy == "log_medium_threats");
    }

    SECTION("low and safe allow") {
        REQUIRE(engine.evaluate(make_assessment(25.0)).matched_policy == "allow_safe_prompts");
        REQUIRE(engine.evaluate(make_assessment(0.0)).action == Action::ALLOW);
    }
}

TEST_CASE("PolicyEngine falls back to default allow", "[policy]") {
    PolicyEngine engine;
    auto loaded = engine.load_policies({
        make_policy("block_critical", Action::BLOCK, ThreatLevel::CRITICAL)
    });
    REQUIRE(loaded.is_ok());

    const auto r = engine.evaluate(make_assessment(50.0));
    REQUIRE(r.action == Action::ALLOW);
    REQUIRE(r.matched_policy == "default_allow");
    REQUIRE(r.reason == "No policy matched - default allow");

    SECTION("empty rule set allows everything") {
        REQUIRE(engine.load_policies({}).is_ok());
        REQUIRE(engine.policy_count() == 0);
        REQUIRE(engine.evaluate(make_assessment(100.0)).matched_policy == "default_allow");
    }
}

// ============================================================================
// Matching
// ============================================================================

TEST_CASE("PolicyEngine threshold normalization", "[policy]") {
    REQUIRE(PolicyEngine::normalize_threshold(0.0) == 0.0);
    REQUIRE(PolicyEngine::normalize_threshold(0.5) == 50.0);
    REQUIRE(PolicyEngine::normalize_threshold(1.0) == 100.0);
    REQUIRE(PolicyEngine::normalize_threshold(50.0) == 50.0);
    REQUIRE(PolicyEngine::normalize_threshold(100.0) == 100.0);
    REQUIRE_FALSE(PolicyEngine::normalize_threshold(-0.1).has_value());
    REQUIRE_FALSE(PolicyEngine::normalize_threshold(100.5).has_value());

    SECTION("fractional and score thresholds behave the same") {
        PolicyEngine a;
        PolicyEngine b;
        REQUIRE(a.load_policies({make_policy("p", Action::LOG, ThreatLevel::SAFE, 0.3)}).is_ok());
        REQUIRE(b.load_policies({make_policy("p", Action::LOG, ThreatLevel::SAFE, 30.0)}).is_ok());
        for (double score : {29.0, 30.0, 31.0}) {
            REQUIRE(a.evaluate(make_assessment(score)).action
                    == b.evaluate(make_assessment(score)).action);
        }
        REQUIRE(a.evaluate(make_assessment(29.0)).action == Action::ALLOW);
        REQUIRE(a.evaluate(make_assessment(30.0)).action == Action::LOG);
    }
}

TEST_CASE("PolicyEngine category filters", "[policy]") {
    PolicyEngine engine;
    REQUIRE(engine.load_policies({
        make_policy("block_sql", Action::BLOCK, ThreatLevel::MEDIUM, 0.0,
                    {ThreatCategory::SQL_INJECTION}),
        make_policy("log_rest", Action::LOG, ThreatLevel::MEDIUM)
    }).is_ok());

    REQUIRE(engine.evaluate(make_assessment(50.0, {ThreatCategory::SQL_INJECTION})).action
            == Action::BLOCK);
    REQUIRE(engine.evaluate(make_assessment(50.0, {ThreatCategory::PII, ThreatCategory::SQL_INJECTION}))
                .matched_policy == "block_sql");
    REQUIRE(engine.evaluate(make_assessment(50.0, {ThreatCategory::PII})).action == Action::LOG);
    REQUIRE(engine.evaluate(make_assessment(10.0, {ThreatCategory::SQL_INJECTION})).action
            == Action::ALLOW);
}

TEST_CASE("PolicyEngine evaluation order", "[policy]") {
    SECTION("declaration order without priorities") {
        PolicyEngine engine;
        REQUIRE(engine.load_policies({
            make_policy("first_log", Action::LOG, ThreatLevel::HIGH, 0.0, {ThreatCategory::PII}),
            make_policy("then_block", Action::BLOCK, ThreatLevel::HIGH, 0.0, {ThreatCategory::INJECTION})
        }).is_ok());
        const auto r = engine.evaluate(make_assessment(90.0, {ThreatCategory::PII, ThreatCategory::INJECTION}));
        REQUIRE(r.matched_policy == "first_log");
    }

    SECTION("explicit priority wins over declaration order") {
        auto log = make_policy("log_pii", Action::LOG, ThreatLevel::HIGH, 0.0, {ThreatCategory::PII});
        auto block = make_policy("block_injection", Action::BLOCK, ThreatLevel::HIGH, 0.0,
                                 {ThreatCategory::INJECTION});
        log.priority = 10;
        block.priority = 1;

        PolicyEngine engine;
        REQUIRE(engine.load_policies({log, block}).is_ok());
        const auto r = engine.evaluate(make_assessment(90.0, {ThreatCategory::PII, ThreatCategory::INJECTION}));
        REQUIRE(r.matched_policy == "block_injection");

        const auto snap = engine.snapshot();
        REQUIRE(snap->policies[0].name == "block_injection");
        REQUIRE(snap->policies[1].name == "log_pii");
    }

    SECTION("equal priorities keep declaration order") {
        auto a = make_policy("a", Action::LOG, ThreatLevel::HIGH, 0.0, {ThreatCategory::PII});
        auto b = make_policy("b", Action::BLOCK, ThreatLevel::HIGH, 0.0, {ThreatCategory::JAILBREAK});
        a.priority = 5;
        b.priority = 5;
        PolicyEngine engine;
        REQUIRE(engine.load_policies({a, b}).is_ok());
        REQUIRE(engine.snapshot()->policies[0].name == "a");
    }

    SECTION("disabled policies are skipped") {
        auto off = make_policy("off", Action::BLOCK, ThreatLevel::SAFE);
        off.enabled = false;
        PolicyEngine engine;
        REQUIRE(engine.load_policies({off, make_policy("on", Action::LOG, ThreatLevel::SAFE)}).is_ok());
        REQUIRE(engine.policy_count() == 1);
        REQUIRE(engine.snapshot()->declared == 2);
        REQUIRE(engine.evaluate(make_assessment(99.0)).matched_policy == "on");
    }
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("PolicyEngine rejects invalid rule sets", "[policy]") {
    SECTION("duplicate names") {
        const auto problem = PolicyEngine::validate({
            make_policy("dup", Action::BLOCK, ThreatLevel::CRITICAL),
            make_policy("dup", Action::LOG, ThreatLevel::CRITICAL)
        });
        REQUIRE(problem.has_value());
        REQUIRE(problem->find("Duplicate policy name 'dup'") != std::string::npos);
    }

    SECTION("empty name") {
        REQUIRE(PolicyEngine::validate({make_policy("", Action::BLOCK, ThreatLevel::HIGH)}).has_value());
    }

    SECTION("threshold out of range") {
        REQUIRE(PolicyEngine::validate({make_policy("p", Action::BLOCK, ThreatLevel::HIGH, 150.0)}).has_value());
        REQUIRE(PolicyEngine::validate({make_policy("p", Action::BLOCK, ThreatLevel::HIGH, -1.0)}).has_value());
    }

    SECTION("negative priority") {
        auto p = make_policy("p", Action::BLOCK, ThreatLevel::HIGH);
        p.priority = -1;
        REQUIRE(PolicyEngine::validate({p}).has_value());
    }

    SECTION("valid set") {
        REQUIRE_FALSE(PolicyEngine::validate(PolicyEngine::default_policies()).has_value());
    }
}

TEST_CASE("PolicyEngine detects shadowed policies", "[policy]") {
    SECTION("broader earlier policy with a different action") {
        const auto problem = PolicyEngine::validate({
            make_policy("allow_all", Action::ALLOW, ThreatLevel::SAFE),
            make_policy("block_critical", Action::BLOCK, ThreatLevel::CRITICAL)
        });
        REQUIRE(problem.has_value());
        REQUIRE(problem->find("block_critical") != std::string::npos);
        REQUIRE(problem->find("allow_all") != std::string::npos);
    }

    SECTION("category superset shadows a narrower filter") {
        REQUIRE(PolicyEngine::validate({
            make_policy("log_pii_sql", Action::LOG, ThreatLevel::HIGH, 0.0,
                        {ThreatCategory::PII, ThreatCategory::SQL_INJECTION}),
            make_policy("block_sql", Action::BLOCK, ThreatLevel::HIGH, 0.0,
                        {ThreatCategory::SQL_INJECTION})
        }).has_value());
    }

    SECTION("higher threshold earlier does not shadow") {
        REQUIRE_FALSE(PolicyEngine::validate({
            make_policy("block_90", Action::BLOCK, ThreatLevel::HIGH, 90.0),
            make_policy("sanitize_70", Action::SANITIZE, ThreatLevel::HIGH, 70.0)
        }).has_value());
    }

    SECTION("severity band floor is compared with the later threshold") {
        // Every score of 90 or more is critical
        const auto problem = PolicyEngine::validate({
            make_policy("block_critical", Action::BLOCK, ThreatLevel::CRITICAL),
            make_policy("log_high_90", Action::LOG, ThreatLevel::HIGH, 90.0)
        });
        REQUIRE(problem.has_value());
        REQUIRE(problem->find("log_high_90") != std::string::npos);
    }

    SECTION("earlier threshold above a later band floor does not shadow") {
        REQUIRE_FALSE(PolicyEngine::validate({
            make_policy("block_critical_95", Action::BLOCK, ThreatLevel::CRITICAL, 95.0),
            make_policy("log_high_90", Action::LOG, ThreatLevel::HIGH, 90.0)
        }).has_value());
    }

    SECTION("critical band does not cover a score of exactly 85") {
        REQUIRE_FALSE(PolicyEngine::validate({
            make_policy("block_critical", Action::BLOCK, ThreatLevel::CRITICAL),
            make_policy("sanitize_85", Action::SANITIZE, ThreatLevel::HIGH, 85.0)
        }).has_value());
    }

    SECTION("same action is redundant but allowed") {
        REQUIRE_FALSE(PolicyEngine::validate({
            make_policy("block_high", Action::BLOCK, ThreatLevel::HIGH),
            make_policy("block_critical", Action::BLOCK, ThreatLevel::CRITICAL)
        }).has_value());
    }

    SECTION("priority decides which one is earlier") {
        auto broad = make_policy("allow_all", Action::ALLOW, ThreatLevel::SAFE);
        auto narrow = make_policy("block_critical", Action::BLOCK, ThreatLevel::CRITICAL);
        broad.priority = 100;
        narrow.priority = 0;
        REQUIRE_FALSE(PolicyEngine::validate({broad, narrow}).has_value());
    }
}

// ============================================================================
// Reload (RCU)
// ============================================================================

TEST_CASE("PolicyEngine rejected reload keeps the previous rule set", "[policy][reload]") {
    PolicyEngine engine;
    const auto before = engine.version();

    auto result = engine.reload_policies({
        make_policy("x", Action::BLOCK, ThreatLevel::HIGH),
        make_policy("x", Action::LOG, ThreatLevel::LOW)
    });
    REQUIRE(result.is_error());
    REQUIRE(result.error_category() == ErrorCategory::POLICY_ERROR);
    REQUIRE(engine.version() == before);
    REQUIRE(engine.policy_count() == 4);
    REQUIRE(engine.evaluate(make_assessment(100.0)).matched_policy == "block_critical_threats");
}

TEST_CASE("PolicyEngine successful reload bumps the version", "[policy][reload]") {
    PolicyEngine engine;
    const auto before = engine.version();

    auto result = engine.reload_policies({make_policy("block_all", Action::BLOCK, ThreatLevel::SAFE)});
    REQUIRE(result.is_ok());
    REQUIRE(result.value() == 1);
    REQUIRE(engine.version() > before);
    REQUIRE(engine.evaluate(make_assessment(0.0)).action == Action::BLOCK);
}

TEST_CASE("PolicyEngine concurrent reload and evaluate", "[policy][reload]") {
    PolicyEngine engine;
    const std::vector<Policy> block_all = {make_policy("block_all", Action::BLOCK, ThreatLevel::SAFE)};
    const std::vector<Policy> log_all = {make_policy("log_all", Action::LOG, ThreatLevel::SAFE)};
    REQUIRE(engine.load_policies(block_all).is_ok());

    std::atomic<bool> stop{false};
    std::atomic<int> inconsistent{0};

    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&] {
            while (!stop.load()) {
                const auto r = engine.evaluate(make_assessment(50.0));
                // Every decision comes from exactly one complete rule set
                const bool ok = (r.action == Action::BLOCK && r.matched_policy == "block_all")
                             || (r.action == Action::LOG && r.matched_policy == "log_all");
                if (!ok) inconsistent.fetch_add(1);
            }
        });
    }

    for (int i = 0; i < 200; ++i) {
        REQUIRE(engine.reload_policies(i % 2 == 0 ? log_all : block_all).is_ok());
    }
    stop.store(true);
    for (auto& t : readers) t.join();

    REQUIRE(inconsistent.load() == 0);
}
