#pragma once

/// @file outcome_weighting.hpp
/// @brief Decision-latency confidence weights and expansion of outcomes
///        into directed win records.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "sre/ranking/ranking_types.hpp"

namespace sre::ranking {

/// Latency below which a judgment counts as high confidence.
inline constexpr int64_t kFastDecisionMs = 3000;

/// Latency above which a judgment counts as low confidence.
inline constexpr int64_t kSlowDecisionMs = 10000;

/// Confidence weight of a judgment from its decision latency.
///
/// <3000 ms -> 1.5, >10000 ms -> 0.5, otherwise (or unknown) -> 1.0.
[[nodiscard]] double confidenceWeight(std::optional<int64_t> decisionLatencyMs) noexcept;

/// Number of directed records materialized for a weight:
/// max(1, round(weight * 2)). Normal -> 2, high -> 3, low -> 1.
[[nodiscard]] uint32_t repetitions(double weight) noexcept;

/// "winner beat loser", as indices into the run's item list.
struct DirectedRecord {
    std::size_t winner = 0;
    std::size_t loser = 0;
};

/// Bookkeeping of what an expansion kept and dropped.
struct ExpansionStats {
    std::size_t determinate = 0;  ///< Outcomes that produced records.
    std::size_t skipped = 0;      ///< Explicit "no preference" outcomes.
    std::size_t malformed = 0;    ///< Dropped as inconsistent or unknown.
};

struct ExpandedOutcomes {
    std::vector<DirectedRecord> records;
    ExpansionStats stats;
};

/// Expand outcomes over @p items into weighted directed records.
///
/// A decisive outcome yields repetitions(weight) records for its winner;
/// a tie yields that many records in each direction. Malformed outcomes
/// (unknown item, self-comparison, winner not a participant, tie with a
/// winner) are counted and dropped individually.
[[nodiscard]] ExpandedOutcomes expandOutcomes(const std::vector<ItemId>& items,
                                              const std::vector<Outcome>& outcomes);

/// Classification used by both the expansion and the scorer.
enum class OutcomeValidity : uint8_t {
    Determinate,
    NoPreference,
    Malformed
};

/// Classify @p outcome; @p isKnown tells whether an id belongs to the run.
template <typename KnownFn>
[[nodiscard]] OutcomeValidity classifyOutcome(const Outcome& outcome, KnownFn&& isKnown) {
    if (outcome.itemA == outcome.itemB ||
        !isKnown(outcome.itemA) || !isKnown(outcome.itemB)) {
        return OutcomeValidity::Malformed;
    }
    if (outcome.isTie) {
        return outcome.winner.has_value() ? OutcomeValidity::Malformed
                                          : OutcomeValidity::Determinate;
    }
    if (!outcome.winner.has_value()) {
        return OutcomeValidity::NoPreference;
    }
    return outcome.references(*outcome.winner) ? OutcomeValidity::Determinate
                                               : OutcomeValidity::Malformed;
}

} // namespace sre::ranking
