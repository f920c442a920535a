/// @file outcome_weighting.cpp
/// @brief Confidence weighting and outcome expansion.

#include "sre/ranking/outcome_weighting.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace sre::ranking {

double confidenceWeight(std::optional<int64_t> decisionLatencyMs) noexcept {
    if (!decisionLatencyMs.has_value()) {
        return 1.0;
    }
    if (*decisionLatencyMs < kFastDecisionMs) {
        return 1.5;
    }
    if (*decisionLatencyMs > kSlowDecisionMs) {
        return 0.5;
    }
    return 1.0;
}

uint32_t repetitions(double weight) noexcept {
    auto reps = std::lround(weight * 2.0);
    return static_cast<uint32_t>(std::max<long>(1, reps));
}

ExpandedOutcomes expandOutcomes(const std::vector<ItemId>& items,
                                const std::vector<Outcome>& outcomes) {
    std::unordered_map<ItemId, std::size_t> index;
    index.reserve(items.size());
    for (std::size_t i = 0; i < items.size(); ++i) {
        index.emplace(items[i], i);
    }
    auto isKnown = [&index](const ItemId& id) { return index.count(id) > 0; };

    ExpandedOutcomes expanded;
    for (const auto& outcome : outcomes) {
        switch (classifyOutcome(outcome, isKnown)) {
            case OutcomeValidity::Malformed:
                ++expanded.stats.malformed;
                continue;
            case OutcomeValidity::NoPreference:
                ++expanded.stats.skipped;
                continue;
            case OutcomeValidity::Determinate:
                break;
        }

        ++expanded.stats.determinate;
        auto reps = repetitions(confidenceWeight(outcome.decisionLatencyMs));
        auto a = index.at(outcome.itemA);
        auto b = index.at(outcome.itemB);

        if (outcome.isTie) {
            for (uint32_t r = 0; r < reps; ++r) {
                expanded.records.push_back({a, b});
                expanded.records.push_back({b, a});
            }
            continue;
        }

        auto winner = (*outcome.winner == outcome.itemA) ? a : b;
        auto loser = (winner == a) ? b : a;
        for (uint32_t r = 0; r < reps; ++r) {
            expanded.records.push_back({winner, loser});
        }
    }
    return expanded;
}

} // namespace sre::ranking
