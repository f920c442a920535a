#pragma once

/// @file strength_solver.hpp
/// @brief Regularized Bradley-Terry strength estimation from weighted
///        pairwise outcomes.

#include <cstdint>
#include <unordered_map>
#include <vector>

#include "sre/ranking/outcome_weighting.hpp"
#include "sre/ranking/ranking_types.hpp"

namespace sre::ranking {

/// Item id -> natural-log strength.
using StrengthMap = std::unordered_map<ItemId, double>;

struct SolverConfig {
    /// Virtual wins added in each direction between every pair of items.
    /// Keeps items with one-sided histories finite.
    double regularization = 0.01;
    uint32_t maxIterations = 100;
    /// Largest per-item change (probability space) that counts as converged.
    double tolerance = 1e-8;
};

struct SolveResult {
    StrengthMap strengths;
    uint32_t iterations = 0;
    bool converged = false;
    /// The iteration broke down numerically and strengths were reset to 0.0.
    bool degraded = false;
    ExpansionStats stats;
};

/// Regularized maximum-likelihood solver for the Bradley-Terry model.
///
/// The estimate is the fixed point of the minorization-maximization
/// update, for every item i,
///
///   p_i <- (W_i + a(n-1)) / sum_{j != i} (N_ij + 2a) / (p_i + p_j)
///
/// where W_i is i's weighted win count, N_ij the number of directed
/// records between i and j and a the regularization. Each iteration takes
/// a damped Newton step on the regularized log-likelihood in log space and
/// uses the MM update instead whenever that step does not improve the
/// likelihood. Both only ascend, so they share the fixed point; the Newton
/// step reaches it within the default iteration budget even when an item
/// never lost. An iteration costs O(n^3).
///
/// Strengths are kept at mean 0 (geometric mean 1 in probability space).
///
/// The solver is pure and single-threaded. Independent runs may execute
/// concurrently; a single run must not be split across threads.
class StrengthSolver {
public:
    explicit StrengthSolver(SolverConfig config = {});

    /// Estimate strengths for @p items.
    ///
    /// - No items: empty map.
    /// - One item: 0.0, no iteration.
    /// - No determinate outcome: every item at 0.0.
    /// - Numerical breakdown: every item at 0.0 and degraded set; never
    ///   throws.
    ///
    /// @param warmStart  Prior log-strengths to seed the iteration.
    ///                   Missing or non-finite entries start at 0.0.
    ///                   Affects speed only, not the fixed point.
    [[nodiscard]] SolveResult solve(const std::vector<ItemId>& items,
                                    const std::vector<Outcome>& outcomes,
                                    const StrengthMap& warmStart = {}) const;

    [[nodiscard]] const SolverConfig& config() const noexcept { return config_; }

private:
    SolverConfig config_;
};

} // namespace sre::ranking
