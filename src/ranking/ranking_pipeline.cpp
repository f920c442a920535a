/// @file ranking_pipeline.cpp
/// @brief Shared ranking computation.

#include "ranking_pipeline.hpp"

#include <unordered_set>

#include "sre/ranking/outcome_weighting.hpp"
#include "sre/ranking/rating_scale.hpp"

namespace sre::ranking::detail {

PipelineResult runPipeline(const std::vector<Item>& items,
                           const std::vector<Outcome>& outcomes,
                           const StrengthSolver& solver,
                           const ConvergenceScorer& scorer,
                           double defaultStrength) {
    PipelineResult result;

    std::unordered_set<ItemId> known;
    StrengthMap warmStart;
    for (const auto& item : items) {
        known.insert(item.id);
        if (item.strength.has_value()) {
            warmStart[item.id] = *item.strength;
        }
    }
    auto isKnown = [&known](const ItemId& id) { return known.count(id) > 0; };

    std::unordered_set<ItemId> compared;
    for (const auto& outcome : outcomes) {
        if (classifyOutcome(outcome, isKnown) == OutcomeValidity::Determinate) {
            compared.insert(outcome.itemA);
            compared.insert(outcome.itemB);
        }
    }

    std::vector<ItemId> active;
    for (const auto& item : items) {
        if (compared.count(item.id) > 0) {
            active.push_back(item.id);
        }
    }

    auto solved = solver.solve(active, outcomes, warmStart);
    result.iterations = solved.iterations;
    result.converged = solved.converged;
    result.degraded = solved.degraded;

    for (const auto& item : items) {
        double strength = defaultStrength;
        if (items.size() <= 1) {
            strength = 0.0;
        } else if (auto it = solved.strengths.find(item.id); it != solved.strengths.end()) {
            strength = it->second;
        } else if (item.strength.has_value()) {
            strength = *item.strength;
        }
        result.strengths[item.id] = strength;

        StrengthUpdate update;
        update.id = item.id;
        update.strength = strength;
        update.rating = RatingScale::rating(strength);
        result.updates.push_back(std::move(update));
    }

    // The solver only knows active items; classify against the full set.
    result.stats = ExpansionStats{};
    for (const auto& outcome : outcomes) {
        switch (classifyOutcome(outcome, isKnown)) {
            case OutcomeValidity::Determinate:  ++result.stats.determinate; break;
            case OutcomeValidity::NoPreference: ++result.stats.skipped; break;
            case OutcomeValidity::Malformed:    ++result.stats.malformed; break;
        }
    }

    result.convergence = scorer.score(outcomes, result.strengths.size(), result.strengths);
    return result;
}

} // namespace sre::ranking::detail
