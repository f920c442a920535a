#pragma once

/// @file ranking_pipeline.hpp
/// @brief Solve -> rate -> score sequence shared by CollectionRanker and
///        GlobalAggregator (internal header).

#include <vector>

#include "sre/ranking/convergence_scorer.hpp"
#include "sre/ranking/ranking_types.hpp"
#include "sre/ranking/strength_solver.hpp"

namespace sre::ranking::detail {

struct PipelineResult {
    std::vector<StrengthUpdate> updates;  ///< One per item, in item order.
    StrengthMap strengths;
    ConvergenceResult convergence;
    uint32_t iterations = 0;
    bool converged = false;
    bool degraded = false;
    ExpansionStats stats;
};

/// Run one ranking computation over @p items.
///
/// Items with at least one determinate outcome are solved jointly,
/// warm-started from their stored strength. Items without any keep their
/// stored strength, or @p defaultStrength when they never had one.
[[nodiscard]] PipelineResult runPipeline(const std::vector<Item>& items,
                                         const std::vector<Outcome>& outcomes,
                                         const StrengthSolver& solver,
                                         const ConvergenceScorer& scorer,
                                         double defaultStrength);

} // namespace sre::ranking::detail
