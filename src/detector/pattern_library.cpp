#include "detector/pattern_library.hpp"

#include <cctype>

namespace promptguard {

// ============================================================================
// Validators
// ============================================================================

/**
 * @brief Luhn algorithm validation for credit card numbers
 * Cuts false positives on arbitrary 13-19 digit runs (order ids, timestamps)
 */
bool PatternLibrary::luhn_validate(std::string_view number) {
    std::string digits;
    digits.reserve(number.size());
    for (const char c : number) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits += c;
        }
    }

    if (digits.size() < 13 || digits.size() > 19) {
        return false;
    }

    int sum = 0;
    bool double_digit = false;

    // Process from right to left
    for (int i = static_cast<int>(digits.size()) - 1; i >= 0; --i) {
        int digit = digits[i] - '0';

        if (double_digit) {
            digit *= 2;
            if (digit > 9) {
                digit -= 9;
            }
        }

        sum += digit;
        double_digit = !double_digit;
    }

    return (sum % 10) == 0;
}

/**
 * @brief Validate SSN is not obviously fake
 * SSN cannot start with 000, 666, or 900-999
 */
bool PatternLibrary::validate_ssn(std::string_view value) {
    std::string digits;
    digits.reserve(9);
    for (const char c : value) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits += c;
        }
    }

    if (digits.size() != 9) {
        return false;
    }

    // Area number (first 3) cannot be 000, 666, or 900-999
    const int area = (digits[0] - '0') * 100 + (digits[1] - '0') * 10 + (digits[2] - '0');
    if (area == 0 || area == 666 || area >= 900) {
        return false;
    }

    // Group number (middle 2) cannot be 00
    if (digits[3] == '0' && digits[4] == '0') {
        return false;
    }

    // Serial number (last 4) cannot be 0000
    return digits.compare(5, 4, "0000") != 0;
}

// ============================================================================
// Library
// ============================================================================

void PatternLibrary::add(std::string id, ThreatCategory category, const char* pattern,
                         double weight, bool case_sensitive,
                         bool (*validate)(std::string_view)) {
    auto flags = std::regex::ECMAScript | std::regex::optimize;
    if (!case_sensitive) flags |= std::regex::icase;

    ThreatPattern p;
    p.id = std::move(id);
    p.category = category;
    p.regex = std::regex(pattern, flags);
    p.weight = weight;
    p.validate = validate;
    patterns_.emplace_back(std::move(p));
}

PatternLibrary::PatternLibrary(const Config& config) {
    using C = ThreatCategory;

    // Every repetition is bounded: libstdc++'s matcher recurses once per
    // repetition, so an open-ended quantifier overflows the stack on long
    // runs. Every pattern also ends on a word boundary or a non-word
    // character, so replacing a match never splits a word.

    // ---- Instruction override / prompt injection --------------------------
    add("instruction_override", C::INJECTION,
        R"(\bignore\s{1,8}(?:all\s{1,8})?(?:of\s{1,8})?(?:the\s{1,8}|your\s{1,8}|my\s{1,8})?(?:previous|prior|above|earlier|preceding)\s{1,8}(?:instructions?|prompts?|rules|directions|commands)\b)",
        70.0);
    add("disregard_above", C::INJECTION,
        R"(\bdisregard\s{1,8}(?:all\s{1,8})?(?:of\s{1,8})?(?:the\s{1,8}|your\s{1,8})?(?:previous|prior|above|earlier|preceding)(?:\s{1,8}(?:instructions?|prompts?|rules|text))?\b)",
        70.0);
    add("forget_everything", C::INJECTION,
        R"(\bforget\s{1,8}(?:everything|what\s{1,8}you\s{1,8}were\s{1,8}told|(?:all\s{1,8})?(?:(?:your|the|previous|prior)\s{1,8}){1,4}(?:instructions|rules|guidelines))\b)",
        45.0);
    add("new_instructions", C::INJECTION,
        R"(\bnew\s{1,8}instructions?\s{0,8}:)",
        40.0);
    add("system_prompt_probe", C::INJECTION,
        R"(\bsystem\s{1,8}prompt\b|\b(?:reveal|show|print|repeat)\s{1,8}(?:me\s{1,8})?(?:your|the)\s{1,8}(?:initial\s{1,8}|hidden\s{1,8}|original\s{1,8})?instructions\b)",
        35.0);
    add("reveal_secrets", C::INJECTION,
        R"(\breveal\s{1,8}(?:the\s{1,8}|your\s{1,8}|all\s{1,8})?(?:secrets?|passwords?|credentials|api\s{1,8}keys?|hidden\s{1,8}instructions)\b)",
        30.0);

    // ---- Jailbreak framings ------------------------------------------------
    add("persona_override", C::JAILBREAK,
        R"(\byou\s{1,8}are\s{1,8}now\b)",
        40.0);
    add("pretend_persona", C::JAILBREAK,
        R"(\bpretend\s{1,8}(?:that\s{1,8})?(?:you\s{1,8}are|you're|to\s{1,8}be)\b)",
        40.0);
    add("roleplay_as", C::JAILBREAK,
        R"(\brole[- ]?play\s{1,8}as\b)",
        40.0);
    add("dan_persona", C::JAILBREAK,
        R"(\bDAN\b)",
        50.0, /*case_sensitive=*/true);
    add("unlocked_mode", C::JAILBREAK,
        R"(\b(?:developer|god|unrestricted|jailbreak)\s{1,8}mode\b)",
        50.0);
    add("jailbreak_keyword", C::JAILBREAK,
        R"(\bjailbr(?:ea|o)k(?:ed|ing|s)?\b)",
        45.0);

    // ---- PII shapes --------------------------------------------------------
    add("ssn", C::PII,
        R"(\b\d{3}-\d{2}-\d{4}\b)",
        35.0, false, &PatternLibrary::validate_ssn);
    add("credit_card", C::PII,
        R"(\b\d{4}[ -]?\d{4}[ -]?\d{4}[ -]?\d{1,7}\b)",
        35.0, false, &PatternLibrary::luhn_validate);
    add("email", C::PII,
        R"(\b[a-zA-Z0-9](?:[a-zA-Z0-9._%+-]{0,62}[a-zA-Z0-9])?@[a-zA-Z0-9](?:[a-zA-Z0-9.-]{0,126}[a-zA-Z0-9])?\.[a-zA-Z]{2,8}\b)",
        30.0);
    add("phone", C::PII,
        R"((?:\+1[ .-]?)?(?:\(\d{3}\)\s?|\b\d{3}[ .-])\d{3}[ .-]\d{4}\b)",
        25.0);
    add("api_key", C::PII,
        R"(\b(?:sk|pk|rk)-(?:live-|test-|proj-)?[A-Za-z0-9_-]{20,128}(?![\w-])|\bAKIA[0-9A-Z]{16}\b|\bgh[pousr]_[A-Za-z0-9]{30,128}\b|\bxox[abpr]-[A-Za-z0-9-]{10,128}(?![\w-]))",
        40.0, /*case_sensitive=*/true);

    // ---- SQL injection shapes ---------------------------------------------
    add("sql_tautology", C::SQL_INJECTION,
        R"('\s{0,8}(?:or|and)\s{1,8}(?:'[^']{0,64}'\s{0,8}=\s{0,8}'[^']{0,64}(?![^'])|\w{1,64}\s{0,8}=\s{0,8}\w{1,64}\b|true\b)|\b(?:or|and)\s{1,8}(\d{1,20})\s{0,8}=\s{0,8}\1\b)",
        45.0);
    add("sql_drop", C::SQL_INJECTION,
        R"((?:';?|;)\s{0,8}(?:drop\s{1,8}(?:table|database)|delete\s{1,8}from|truncate\s{1,8}table|insert\s{1,8}into|update\s{1,8}\w{1,64}\s{1,8}set)\b)",
        60.0);
    add("sql_union", C::SQL_INJECTION,
        R"(\bunion\s{1,8}(?:all\s{1,8})?select\b)",
        50.0);
    add("sql_comment", C::SQL_INJECTION,
        R"('\s{0,8}(?:--|#|/\*))",
        20.0);

    // ---- Encoding obfuscation ---------------------------------------------
    if (config.encoding_detection) {
        add("url_encoded_run", C::OTHER,
            R"((?:%[0-9a-fA-F]{2}){3,256}(?!\w))",
            20.0);
        add("html_entity_run", C::OTHER,
            R"((?:&#[xX]?[0-9a-fA-F]{1,6};){3,128})",
            20.0);
    }
}

const ThreatPattern* PatternLibrary::find(std::string_view id) const {
    for (const auto& p : patterns_) {
        if (p.id == id) return &p;
    }
    return nullptr;
}

} // namespace promptguard
