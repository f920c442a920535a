#pragma once

/// @file global_aggregator.hpp
/// @brief Artist-wide ranking over every session's outcomes, serialized
///        per artist through the lock service.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sre/foundation/rank_result.hpp"
#include "sre/ranking/convergence_scorer.hpp"
#include "sre/ranking/lock_service.hpp"
#include "sre/ranking/ranking_store.hpp"
#include "sre/ranking/ranking_types.hpp"
#include "sre/ranking/strength_solver.hpp"

namespace sre::ranking {

struct AggregatorConfig {
    SolverConfig solver;
    ConvergenceConfig convergence;

    /// Minimum time between two scheduled runs for one artist.
    std::chrono::seconds updateInterval{120};

    /// Lifetime of the per-artist lock. A completed run leaves the lock to
    /// expire, so this is also the cooldown after a run.
    std::chrono::milliseconds lockTtl{120000};

    /// Strength given to items of an artist with no outcomes yet.
    double defaultStrength = 0.0;
};

enum class AggregationStatus : uint8_t {
    Completed,      ///< Strengths re-estimated from outcomes.
    Initialized,    ///< No outcomes yet; defaults written.
    SkippedLocked,  ///< Another run holds the artist's lock.
    NoItems         ///< The artist has no items.
};

[[nodiscard]] constexpr const char* aggregationStatusName(AggregationStatus status) noexcept {
    switch (status) {
        case AggregationStatus::Completed:     return "completed";
        case AggregationStatus::Initialized:   return "initialized";
        case AggregationStatus::SkippedLocked: return "skipped_locked";
        case AggregationStatus::NoItems:       return "no_items";
    }
    return "unknown";
}

struct AggregationReport {
    AggregationStatus status = AggregationStatus::Completed;
    std::vector<StrengthUpdate> updates;  ///< Carries votesCount per item.
    ConvergenceResult convergence;
    std::size_t outcomeCount = 0;
    bool degraded = false;
};

/// Global (per-artist) ranking.
///
/// Gathers every item and outcome of an artist across sessions, solves
/// them jointly warm-started from the stored global strengths, counts
/// votes per item and persists strengths, ratings, vote counts and the
/// processed-outcome bookkeeping.
///
/// At most one run per artist executes at a time across all instances
/// sharing the ILockService. A run that fails releases the lock so a
/// retry can follow; a run that succeeds keeps it until the TTL expires.
///
/// Strengths and the processed-outcome bookkeeping are two store writes,
/// not one unit. If the bookkeeping write fails after the strengths
/// landed, the run reports the error and releases the lock; the strengths
/// stay written and the next run recomputes them from the same outcomes.
///
/// Thread-safe: different artists may be aggregated concurrently.
class GlobalAggregator {
public:
    GlobalAggregator(IRankingStore& store, ILockService& locks,
                     AggregatorConfig config = {});
    ~GlobalAggregator();

    GlobalAggregator(const GlobalAggregator&) = delete;
    GlobalAggregator& operator=(const GlobalAggregator&) = delete;

    /// Run the artist's global ranking now (subject to the lock).
    [[nodiscard]] foundation::RankResult<AggregationReport> aggregate(
        const std::string& artist);

    /// Run only when outcomes are pending and the update interval passed.
    /// Returns std::nullopt when no run was due.
    [[nodiscard]] foundation::RankResult<std::optional<AggregationReport>> maybeAggregate(
        const std::string& artist,
        AggregationClock::time_point now = AggregationClock::now());

    [[nodiscard]] const AggregatorConfig& config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sre::ranking
