#pragma once

/// @file convergence_scorer.hpp
/// @brief Coverage / separation / stability scoring of a ranking and the
///        guard-railed 0-100 convergence score built from them.

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

#include "sre/ranking/ranking_types.hpp"
#include "sre/ranking/strength_solver.hpp"

namespace sre::ranking {

struct ConvergenceConfig {
    /// Most recent outcomes dropped to build the comparison ranking.
    uint32_t lookback = 5;
    /// Ranking depth compared by the stability factor. Stability also
    /// needs at least lookback + topN outcomes.
    uint32_t topN = 10;
};

/// Per-item count of determinate outcomes.
using ComparisonCounts = std::unordered_map<ItemId, uint32_t>;

/// Scores how settled a ranking is.
///
/// score = floor(100 * (0.4 coverage + 0.4 separation + 0.2 stability)^0.7)
/// followed by guard rails on the thinnest-covered item:
///
/// | min comparisons | cap |
/// |-----------------|-----|
/// | < 2             | 65  |
/// | < 3             | 85  |
///
/// and floors from stability (92 / 90 / 88 at 0.95 / 0.85 / 0.75). A cap
/// always wins over a floor.
class ConvergenceScorer {
public:
    explicit ConvergenceScorer(SolverConfig solverConfig = {},
                               ConvergenceConfig config = {});

    /// Full convergence result for a run.
    ///
    /// @param outcomes   The run's outcomes in chronological order.
    /// @param itemCount  Number of items in the run.
    /// @param strengths  Solver output for the run's items.
    [[nodiscard]] ConvergenceResult score(const std::vector<Outcome>& outcomes,
                                          std::size_t itemCount,
                                          const StrengthMap& strengths) const;

    /// Stability of the current top-N against the ranking re-solved
    /// without the latest lookback outcomes. 0.0 when history is too short.
    [[nodiscard]] double stability(const std::vector<Outcome>& outcomes,
                                   const StrengthMap& strengths) const;

    /// Determinate outcomes per item of @p strengths (zero entries kept).
    [[nodiscard]] static ComparisonCounts comparisonCounts(
        const std::vector<Outcome>& outcomes, const StrengthMap& strengths);

    /// sqrt(fraction of items with >= 3 comparisons *
    ///      min(1, determinate / (itemCount * 1.5)))
    [[nodiscard]] static double coverage(const ComparisonCounts& counts,
                                         std::size_t determinateOutcomes,
                                         std::size_t itemCount);

    /// Weighted range adequacy (0.3), gap uniformity (0.2) and per-item
    /// confidence (0.5). 0.0 when the strength range is below 0.01.
    [[nodiscard]] static double separation(const StrengthMap& strengths,
                                           const ComparisonCounts& counts);

    /// Grade two top-N lists (previous, current) into a stability value.
    [[nodiscard]] static double gradeStability(const std::vector<ItemId>& previous,
                                               const std::vector<ItemId>& current,
                                               std::size_t topN = 10);

    /// Ids ordered by strength, strongest first, ties broken by id.
    [[nodiscard]] static std::vector<ItemId> topRanking(const StrengthMap& strengths,
                                                        std::size_t n);

    /// Curved combination of the three factors, 0-100.
    [[nodiscard]] static int combine(double coverage, double separation,
                                     double stability);

    /// Apply low-data caps and stability floors to a combined score.
    [[nodiscard]] static int applyGuardRails(int score, uint32_t minComparisons,
                                             double stability);

    /// Share of the nominal duel budget (2.5 per item) already spent.
    [[nodiscard]] static double progress(std::size_t totalDuels,
                                         std::size_t totalItems);

    [[nodiscard]] const ConvergenceConfig& config() const noexcept { return config_; }

private:
    StrengthSolver solver_;
    ConvergenceConfig config_;
};

} // namespace sre::ranking
