#pragma once

#include "core/types.hpp"

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace promptguard {

/**
 * @brief One category-tagged matcher in the detection library
 *
 * Every occurrence of `regex` in the prompt (that passes `validate`, when
 * set) contributes `weight` to its category's subtotal.
 */
struct ThreatPattern {
    std::string id;
    ThreatCategory category = ThreatCategory::OTHER;
    std::regex regex;
    double weight = 0.0;
    bool (*validate)(std::string_view match) = nullptr;
};

/**
 * @brief Fixed, precompiled library of threat patterns
 *
 * Built once at construction and immutable afterwards, so a single
 * instance can be shared by any number of concurrent readers.
 *
 * Categories:
 * - injection:     instruction override, system prompt probing, secret exfiltration
 * - jailbreak:     persona/roleplay framings, "DAN"/developer mode
 * - pii:           SSN, credit card (Luhn), email, phone, API keys
 * - sql_injection: tautologies, stacked DROP/DELETE, UNION SELECT, quote-comment
 * - other:         URL-encoded and HTML-entity obfuscation runs
 */
class PatternLibrary {
public:
    struct Config {
        bool encoding_detection = true;
    };

    PatternLibrary() : PatternLibrary(Config{}) {}
    explicit PatternLibrary(const Config& config);

    [[nodiscard]] const std::vector<ThreatPattern>& patterns() const { return patterns_; }
    [[nodiscard]] size_t size() const { return patterns_.size(); }

    /// Pattern by id, or nullptr
    [[nodiscard]] const ThreatPattern* find(std::string_view id) const;

    // Validators (exposed for tests)
    [[nodiscard]] static bool luhn_validate(std::string_view number);
    [[nodiscard]] static bool validate_ssn(std::string_view value);

private:
    void add(std::string id, ThreatCategory category, const char* pattern,
             double weight, bool case_sensitive = false,
             bool (*validate)(std::string_view) = nullptr);

    std::vector<ThreatPattern> patterns_;
};

} // namespace promptguard
