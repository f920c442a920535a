/// @file convergence_scorer.cpp
/// @brief ConvergenceScorer implementation.

#include "sre/ranking/convergence_scorer.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <string>
#include <utility>

#include "sre/foundation/engine_logger.hpp"
#include "sre/ranking/outcome_weighting.hpp"

namespace sre::ranking {

using sre::foundation::LogCategory;

namespace {

constexpr double kCoverageWeight = 0.4;
constexpr double kSeparationWeight = 0.4;
constexpr double kStabilityWeight = 0.2;
constexpr double kCurveExponent = 0.7;

constexpr uint32_t kWellCoveredComparisons = 3;
constexpr double kQuantityPerItem = 1.5;

constexpr double kMinStrengthRange = 0.01;
constexpr double kAdequateStrengthRange = 4.0;
constexpr double kRangeWeight = 0.3;
constexpr double kUniformityWeight = 0.2;
constexpr double kConfidenceWeight = 0.5;

constexpr std::size_t kStabilityHead = 5;

constexpr double kDuelsPerItem = 2.5;

std::set<ItemId> asSet(const std::vector<ItemId>& ids) {
    return {ids.begin(), ids.end()};
}

std::vector<ItemId> head(const std::vector<ItemId>& ids, std::size_t n) {
    return {ids.begin(), ids.begin() + static_cast<std::ptrdiff_t>(std::min(n, ids.size()))};
}

} // namespace

ConvergenceScorer::ConvergenceScorer(SolverConfig solverConfig,
                                     ConvergenceConfig config)
    : solver_(solverConfig), config_(config) {}

// -- Factors ------------------------------------------------------------------

ComparisonCounts ConvergenceScorer::comparisonCounts(
    const std::vector<Outcome>& outcomes, const StrengthMap& strengths) {
    ComparisonCounts counts;
    counts.reserve(strengths.size());
    for (const auto& [id, strength] : strengths) {
        counts[id] = 0;
    }

    auto isKnown = [&strengths](const ItemId& id) { return strengths.count(id) > 0; };
    for (const auto& outcome : outcomes) {
        if (classifyOutcome(outcome, isKnown) != OutcomeValidity::Determinate) {
            continue;
        }
        ++counts[outcome.itemA];
        ++counts[outcome.itemB];
    }
    return counts;
}

double ConvergenceScorer::coverage(const ComparisonCounts& counts,
                                   std::size_t determinateOutcomes,
                                   std::size_t itemCount) {
    if (itemCount == 0) {
        return 0.0;
    }

    auto wellCovered = std::count_if(counts.begin(), counts.end(), [](const auto& entry) {
        return entry.second >= kWellCoveredComparisons;
    });
    double breadth = static_cast<double>(wellCovered) / static_cast<double>(itemCount);
    double quantity = std::min(
        1.0, static_cast<double>(determinateOutcomes) /
                 (static_cast<double>(itemCount) * kQuantityPerItem));

    return std::sqrt(std::clamp(breadth, 0.0, 1.0) * quantity);
}

double ConvergenceScorer::separation(const StrengthMap& strengths,
                                     const ComparisonCounts& counts) {
    if (strengths.size() < 2) {
        return 0.0;
    }

    std::vector<double> sorted;
    sorted.reserve(strengths.size());
    for (const auto& [id, strength] : strengths) {
        sorted.push_back(strength);
    }
    std::sort(sorted.begin(), sorted.end());

    double range = sorted.back() - sorted.front();
    if (range < kMinStrengthRange) {
        return 0.0;
    }

    double rangeScore = std::min(1.0, range / kAdequateStrengthRange);

    // Uniformity: 1 / (1 + CV^2) of the gaps between neighbours.
    auto gapCount = static_cast<double>(sorted.size() - 1);
    double meanGap = range / gapCount;
    double variance = 0.0;
    for (std::size_t i = 1; i < sorted.size(); ++i) {
        double diff = (sorted[i] - sorted[i - 1]) - meanGap;
        variance += diff * diff;
    }
    variance /= gapCount;
    double uniformity = 1.0 / (1.0 + variance / (meanGap * meanGap));

    double confidence = 0.0;
    for (const auto& [id, strength] : strengths) {
        auto it = counts.find(id);
        uint32_t n = (it == counts.end()) ? 0 : it->second;
        confidence += std::min(1.0, static_cast<double>(n) / kWellCoveredComparisons);
    }
    confidence /= static_cast<double>(strengths.size());

    double result = kRangeWeight * rangeScore + kUniformityWeight * uniformity +
                    kConfidenceWeight * confidence;
    return std::clamp(result, 0.0, 1.0);
}

double ConvergenceScorer::stability(const std::vector<Outcome>& outcomes,
                                    const StrengthMap& strengths) const {
    const std::size_t required =
        static_cast<std::size_t>(config_.lookback) + config_.topN;
    if (outcomes.size() < required || strengths.size() < 2) {
        return 0.0;
    }

    std::vector<ItemId> items;
    items.reserve(strengths.size());
    for (const auto& [id, strength] : strengths) {
        items.push_back(id);
    }
    std::sort(items.begin(), items.end());

    std::vector<Outcome> history(
        outcomes.begin(),
        outcomes.end() - static_cast<std::ptrdiff_t>(config_.lookback));

    auto previous = solver_.solve(items, history);
    if (previous.degraded) {
        SRE_LOG_WARN(LogCategory::Scoring,
                     "Truncated-history solve degraded; stability graded on neutral strengths");
    }

    return gradeStability(topRanking(previous.strengths, config_.topN),
                          topRanking(strengths, config_.topN), config_.topN);
}

// -- Grading ------------------------------------------------------------------

double ConvergenceScorer::gradeStability(const std::vector<ItemId>& previous,
                                         const std::vector<ItemId>& current,
                                         std::size_t topN) {
    if (previous.empty() || current.empty() || topN == 0) {
        return 0.0;
    }
    if (previous == current) {
        return 1.0;
    }

    auto prevSet = asSet(previous);
    auto currSet = asSet(current);
    bool sameMembers = prevSet == currSet;

    auto prevHead = head(previous, kStabilityHead);
    auto currHead = head(current, kStabilityHead);
    bool sameHeadOrder = prevHead == currHead;
    bool sameHeadMembers = asSet(prevHead) == asSet(currHead);

    if (sameHeadOrder && sameMembers) {
        return 0.95;
    }
    if (sameMembers && sameHeadMembers) {
        return 0.85;
    }
    if (sameMembers) {
        return 0.75;
    }
    if (sameHeadMembers) {
        return 0.6;
    }

    std::size_t overlap = 0;
    for (const auto& id : currSet) {
        overlap += prevSet.count(id);
    }
    return static_cast<double>(overlap) / static_cast<double>(topN) * 0.5;
}

std::vector<ItemId> ConvergenceScorer::topRanking(const StrengthMap& strengths,
                                                  std::size_t n) {
    std::vector<std::pair<ItemId, double>> ordered(strengths.begin(), strengths.end());
    std::sort(ordered.begin(), ordered.end(), [](const auto& lhs, const auto& rhs) {
        if (lhs.second != rhs.second) {
            return lhs.second > rhs.second;
        }
        return lhs.first < rhs.first;
    });

    std::vector<ItemId> ids;
    ids.reserve(std::min(n, ordered.size()));
    for (std::size_t i = 0; i < ordered.size() && i < n; ++i) {
        ids.push_back(ordered[i].first);
    }
    return ids;
}

// -- Combination --------------------------------------------------------------

int ConvergenceScorer::combine(double coverage, double separation, double stability) {
    double raw = kCoverageWeight * coverage + kSeparationWeight * separation +
                 kStabilityWeight * stability;
    raw = std::clamp(raw, 0.0, 1.0);
    double curved = std::pow(raw, kCurveExponent);
    return static_cast<int>(std::floor(std::min(100.0, curved * 100.0)));
}

int ConvergenceScorer::applyGuardRails(int score, uint32_t minComparisons,
                                       double stability) {
    int cap = 100;
    if (minComparisons < 2) {
        cap = 65;
    } else if (minComparisons < 3) {
        cap = 85;
    }

    int minimum = 0;
    if (stability >= 0.95 && minComparisons >= 2) {
        minimum = 92;
    } else if (stability >= 0.85) {
        minimum = 90;
    } else if (stability >= 0.75) {
        minimum = 88;
    }

    return std::min(std::max(score, minimum), cap);
}

double ConvergenceScorer::progress(std::size_t totalDuels, std::size_t totalItems) {
    if (totalItems == 0) {
        return 1.0;
    }
    double target = static_cast<double>(totalItems) * kDuelsPerItem;
    return std::min(1.0, static_cast<double>(totalDuels) / target);
}

// -- Entry point --------------------------------------------------------------

ConvergenceResult ConvergenceScorer::score(const std::vector<Outcome>& outcomes,
                                           std::size_t itemCount,
                                           const StrengthMap& strengths) const {
    ConvergenceResult result;
    if (itemCount <= 1) {
        result.score = 100;
        result.coverage = 1.0;
        result.separation = 1.0;
        result.stability = 1.0;
        return result;
    }
    if (outcomes.empty()) {
        return result;
    }

    auto counts = comparisonCounts(outcomes, strengths);
    std::size_t determinate = 0;
    for (const auto& [id, n] : counts) {
        determinate += n;
    }
    determinate /= 2;

    // Items of the run that have no strength entry count as uncompared.
    uint32_t minComparisons = 0;
    if (strengths.size() >= itemCount && !counts.empty()) {
        minComparisons = std::numeric_limits<uint32_t>::max();
        for (const auto& [id, n] : counts) {
            minComparisons = std::min(minComparisons, n);
        }
    }

    result.coverage = coverage(counts, determinate, itemCount);
    result.separation = separation(strengths, counts);
    result.stability = stability(outcomes, strengths);
    result.score = applyGuardRails(
        combine(result.coverage, result.separation, result.stability),
        minComparisons, result.stability);

    SRE_LOG_DEBUG(LogCategory::Scoring,
                  "Convergence " + std::to_string(result.score) +
                      " (coverage=" + std::to_string(result.coverage) +
                      ", separation=" + std::to_string(result.separation) +
                      ", stability=" + std::to_string(result.stability) +
                      ", min_comparisons=" + std::to_string(minComparisons) + ")");
    return result;
}

} // namespace sre::ranking
