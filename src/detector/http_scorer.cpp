#include "detector/http_scorer.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <glaze/glaze.hpp>

#include <cmath>
#include <format>

namespace promptguard {

HttpScorer::HttpScorer(Config config)
    : config_(std::move(config)) {}

std::string HttpScorer::name() const {
    return config_.endpoint + config_.path;
}

// ============================================================================
// Response Parsing
// ============================================================================

std::optional<ScorerVerdict> HttpScorer::parse_response(const std::string& body) {
    glz::json_t doc;
    if (auto ec = glz::read_json(doc, body); ec) {
        return std::nullopt;
    }
    if (!doc.is_object()) return std::nullopt;

    const auto& obj = doc.get_object();
    const auto score_it = obj.find("score");
    if (score_it == obj.end() || !score_it->second.is_number()) {
        return std::nullopt;
    }

    double score = score_it->second.get<double>();
    if (!std::isfinite(score) || score < 0.0) return std::nullopt;
    if (score <= 1.0) score *= 100.0;  // probability

    ScorerVerdict verdict;
    verdict.score = clamp_score(score);

    const auto cat_it = obj.find("categories");
    if (cat_it != obj.end() && cat_it->second.is_array()) {
        for (const auto& elem : cat_it->second.get_array()) {
            if (!elem.is_string()) continue;
            if (auto c = parse_threat_category(elem.get<std::string>())) {
                verdict.categories.push_back(*c);
            }
        }
    }
    return verdict;
}

// ============================================================================
// Scoring
// ============================================================================

std::optional<ScorerVerdict> HttpScorer::score(std::string_view text) {
    requests_.fetch_add(1, std::memory_order_relaxed);

    if (config_.endpoint.empty()) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    const auto json_body = std::format(R"({{"text":"{}"}})", utils::escape_json(text));

    httplib::Client cli(config_.endpoint);
    cli.set_connection_timeout(config_.timeout);
    cli.set_read_timeout(config_.timeout);
    cli.set_write_timeout(config_.timeout);

    httplib::Headers headers;
    if (!config_.api_key.empty()) {
        headers.emplace("Authorization", "Bearer " + config_.api_key);
    }

    const auto res = cli.Post(config_.path, headers, json_body, "application/json");
    if (!res) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Scorer {} unreachable: {}",
            name(), httplib::to_string(res.error())));
        return std::nullopt;
    }

    if (res->status != httplib::StatusCode::OK_200) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Scorer {} returned HTTP {}", name(), res->status));
        return std::nullopt;
    }

    auto verdict = parse_response(res->body);
    if (!verdict) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Scorer {} returned a malformed body", name()));
    }
    return verdict;
}

HttpScorer::Stats HttpScorer::get_stats() const {
    return {
        requests_.load(std::memory_order_relaxed),
        failures_.load(std::memory_order_relaxed)
    };
}

} // namespace promptguard
