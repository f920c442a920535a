#pragma once

/// @file collection_ranker.hpp
/// @brief Per-session ranking: solve, rate, score and persist one scope.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "sre/foundation/rank_result.hpp"
#include "sre/ranking/convergence_scorer.hpp"
#include "sre/ranking/ranking_store.hpp"
#include "sre/ranking/ranking_types.hpp"
#include "sre/ranking/strength_solver.hpp"

namespace sre::ranking {

struct RankerConfig {
    SolverConfig solver;
    ConvergenceConfig convergence;
    /// rankIfDue() re-ranks on every N-th recorded outcome.
    uint32_t rerankEvery = 5;
};

/// What a ranking run computed and persisted.
struct RankingReport {
    std::vector<StrengthUpdate> updates;
    ConvergenceResult convergence;
    std::size_t outcomeCount = 0;
    std::size_t skippedOutcomes = 0;    ///< "No preference" outcomes.
    std::size_t malformedOutcomes = 0;  ///< Dropped as inconsistent.
    uint32_t iterations = 0;
    bool degraded = false;
};

/// Ranks the items of one scope from its recorded outcomes.
///
/// A run reads items and outcomes from the store, warm-starts the solver
/// from the stored strengths, and writes every strength, rating and the
/// convergence score back in a single writeStrengths() call. Re-running
/// without new outcomes reproduces the same values to within the solver
/// tolerance.
///
/// Runs on different scopes may execute concurrently. Concurrent runs on
/// the same scope are the caller's to serialize (last writer wins).
///
/// @code
///   CollectionRanker ranker(store);
///   auto report = ranker.rank(RankingScope::session("s-42"));
///   if (report) {
///       publish(report.value().convergence.score);
///   }
/// @endcode
class CollectionRanker {
public:
    explicit CollectionRanker(IRankingStore& store, RankerConfig config = {});

    /// Rank @p scope and persist the result.
    [[nodiscard]] foundation::RankResult<RankingReport> rank(
        const RankingScope& scope) const;

    /// Rank @p scope only when its outcome count hits the re-rank cadence.
    /// Returns std::nullopt when no run was due.
    [[nodiscard]] foundation::RankResult<std::optional<RankingReport>> rankIfDue(
        const RankingScope& scope) const;

    [[nodiscard]] const RankerConfig& config() const noexcept { return config_; }

private:
    IRankingStore& store_;
    RankerConfig config_;
    StrengthSolver solver_;
    ConvergenceScorer scorer_;
};

} // namespace sre::ranking
