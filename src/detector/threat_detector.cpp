#include "detector/threat_detector.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <future>
#include <system_error>
#include <thread>

namespace promptguard {

namespace {

bool is_blank(std::string_view text) {
    return std::all_of(text.begin(), text.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
}

ThreatAssessment oversized_assessment() {
    ThreatAssessment a;
    a.score = kMaxScore;
    a.pattern_score = kMaxScore;
    a.level = ThreatLevel::CRITICAL;
    a.categories = category_mask::bit(ThreatCategory::OTHER);
    a.oversized = true;
    return a;
}

} // anonymous namespace

ThreatDetector::ThreatDetector(Config config, std::shared_ptr<IScorer> scorer)
    : config_(std::move(config)),
      library_(PatternLibrary::Config{.encoding_detection = config_.encoding_detection}),
      scorer_(std::move(scorer)),
      scorer_in_flight_(std::make_shared<std::atomic<size_t>>(0)) {
    for (auto& cap : config_.category_caps) {
        cap = clamp_score(cap);
    }
    config_.external_weight = std::clamp(config_.external_weight, 0.0, 1.0);
}

// ============================================================================
// Pattern Scan
// ============================================================================

ThreatAssessment ThreatDetector::assess_patterns(std::string_view text) const {
    if (text.size() > config_.max_prompt_length) {
        return oversized_assessment();
    }

    ThreatAssessment result;
    if (is_blank(text)) {
        return result;
    }

    struct Hit {
        MatchedSpan span;
        size_t pattern_index;
    };
    std::vector<Hit> hits;
    std::array<double, kThreatCategoryCount> subtotals{};

    const auto& patterns = library_.patterns();
    for (size_t i = 0; i < patterns.size(); ++i) {
        const auto& p = patterns[i];
        try {
            const std::cregex_iterator end;
            for (std::cregex_iterator it(text.data(), text.data() + text.size(), p.regex);
                 it != end; ++it) {
                const auto& m = *it;
                if (m.length(0) == 0) continue;

                const auto offset = static_cast<size_t>(m.position(0));
                const auto length = static_cast<size_t>(m.length(0));
                const auto matched = text.substr(offset, length);
                if (p.validate && !p.validate(matched)) continue;

                subtotals[static_cast<size_t>(p.category)] += p.weight;
                hits.push_back({MatchedSpan{p.category, p.id, offset, length, std::string(matched)}, i});
            }
        } catch (const std::regex_error& e) {
            // Matches found before the failure still count
            utils::log::warn(std::format("Pattern '{}' aborted on a {}-byte prompt: {}",
                                         p.id, text.size(), e.what()));
        }
    }

    // (offset asc, longer first, library order)
    std::sort(hits.begin(), hits.end(), [](const Hit& a, const Hit& b) {
        if (a.span.offset != b.span.offset) return a.span.offset < b.span.offset;
        if (a.span.length != b.span.length) return a.span.length > b.span.length;
        return a.pattern_index < b.pattern_index;
    });

    double total = 0.0;
    for (size_t c = 0; c < kThreatCategoryCount; ++c) {
        if (subtotals[c] <= 0.0) continue;
        total += std::min(subtotals[c], config_.category_caps[c]);
        result.categories |= category_mask::bit(static_cast<ThreatCategory>(c));
    }

    result.spans.reserve(hits.size());
    for (auto& h : hits) {
        result.spans.push_back(std::move(h.span));
    }

    result.pattern_score = clamp_score(total);
    result.score = result.pattern_score;
    result.level = threat_level_from_score(result.score);
    return result;
}

// ============================================================================
// Full Assessment
// ============================================================================

ThreatAssessment ThreatDetector::assess(std::string_view text) const {
    auto result = assess_patterns(text);
    if (!scorer_ || result.oversized || is_blank(text)) {
        return result;
    }

    const auto verdict = call_scorer(text);
    if (!verdict) {
        result.scorer_degraded = true;
        return result;
    }

    const double external = clamp_score(verdict->score);
    result.external_score = external;
    result.score = clamp_score(blend(result.pattern_score, external));
    result.level = threat_level_from_score(result.score);
    for (const auto c : verdict->categories) {
        result.categories |= category_mask::bit(c);
    }
    return result;
}

double ThreatDetector::blend(double pattern_score, double external_score) const {
    switch (config_.blend) {
        case ScoreBlend::WEIGHTED:
            return (1.0 - config_.external_weight) * pattern_score
                 + config_.external_weight * external_score;
        case ScoreBlend::MAX:
        default:
            return std::max(pattern_score, external_score);
    }
}

// ============================================================================
// External Scorer (bounded by scorer_timeout)
// ============================================================================

std::optional<ScorerVerdict> ThreatDetector::call_scorer(std::string_view text) const {
    using VerdictPromise = std::promise<std::optional<ScorerVerdict>>;

    const size_t prev = scorer_in_flight_->fetch_add(1, std::memory_order_relaxed);
    if (prev >= config_.max_scorer_in_flight) {
        scorer_in_flight_->fetch_sub(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Scorer {} has {} calls outstanding, using pattern score",
                                     scorer_->name(), prev));
        return std::nullopt;
    }

    // The helper owns the scorer, the promise, the in-flight counter and a
    // copy of the text, so it may outlive this call (and this detector).
    auto promise = std::make_shared<VerdictPromise>();
    auto future = promise->get_future();

    try {
        std::thread([scorer = scorer_, promise, in_flight = scorer_in_flight_,
                     input = std::string(text)]() {
            std::optional<ScorerVerdict> verdict;
            try {
                verdict = scorer->score(input);
            } catch (const std::exception& e) {
                utils::log::warn(std::format("Scorer {} threw: {}", scorer->name(), e.what()));
            } catch (...) {
                utils::log::warn(std::format("Scorer {} threw a non-standard exception",
                                             scorer->name()));
            }
            in_flight->fetch_sub(1, std::memory_order_relaxed);
            promise->set_value(std::move(verdict));
        }).detach();
    } catch (const std::system_error& e) {
        scorer_in_flight_->fetch_sub(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Scorer thread could not start: {}", e.what()));
        return std::nullopt;
    }

    if (future.wait_for(config_.scorer_timeout) != std::future_status::ready) {
        utils::log::warn(std::format("Scorer {} timed out after {}ms, using pattern score",
            scorer_->name(), config_.scorer_timeout.count()));
        return std::nullopt;
    }

    auto verdict = future.get();
    if (!verdict) {
        utils::log::warn(std::format("Scorer {} unavailable, using pattern score",
                                     scorer_->name()));
    }
    return verdict;
}

} // namespace promptguard
