#pragma once

/// @file ranking_store.hpp
/// @brief Persistence collaborator interface and in-memory implementation.
///
/// The engine only reads items and outcomes and writes back strengths,
/// ratings, vote counts and convergence scores. Creating and editing
/// items and outcomes belongs to the CRUD layer behind this interface.

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "sre/foundation/rank_result.hpp"
#include "sre/ranking/ranking_types.hpp"

namespace sre::ranking {

using AggregationClock = std::chrono::system_clock;

/// Bookkeeping of the last completed global run for an artist.
struct AggregationStats {
    std::size_t processedOutcomes = 0;
    AggregationClock::time_point lastUpdatedAt;
};

/// Abstract persistence collaborator.
///
/// Implementations must be thread-safe when shared across threads, and
/// writeStrengths() must apply all updates or none.
class IRankingStore {
public:
    virtual ~IRankingStore() = default;

    [[nodiscard]] virtual foundation::RankResult<std::vector<Item>> getItems(
        const RankingScope& scope) const = 0;

    /// Outcomes of the scope in recording order.
    [[nodiscard]] virtual foundation::RankResult<std::vector<Outcome>> getOutcomes(
        const RankingScope& scope) const = 0;

    [[nodiscard]] virtual foundation::RankResult<std::size_t> getOutcomeCount(
        const RankingScope& scope) const = 0;

    /// Persist a run's results atomically.
    virtual foundation::RankResult<void> writeStrengths(
        const RankingScope& scope,
        const std::vector<StrengthUpdate>& updates,
        std::optional<int> convergenceScore) = 0;

    [[nodiscard]] virtual foundation::RankResult<std::optional<AggregationClock::time_point>>
    getLastAggregationTime(const std::string& artist) const = 0;

    [[nodiscard]] virtual foundation::RankResult<std::optional<AggregationStats>>
    getAggregationStats(const std::string& artist) const = 0;

    virtual foundation::RankResult<void> writeAggregationStats(
        const std::string& artist,
        std::size_t outcomeCount,
        AggregationClock::time_point at) = 0;
};

/// Thread-safe in-memory store for tests, tooling and development.
///
/// Sessions belong to one artist. Each item keeps a per-session strength
/// and a global (artist-wide) strength with its vote count. Artist
/// matching is case-insensitive.
class InMemoryRankingStore : public IRankingStore {
public:
    /// Register a session. Re-creating an existing session only updates
    /// its artist label.
    void createSession(const std::string& sessionId, const std::string& artist);

    /// Add an item to a session (and to the artist catalogue).
    foundation::RankResult<void> addItem(const std::string& sessionId,
                                         const ItemId& id,
                                         std::optional<double> strength = std::nullopt);

    /// Record an outcome for a session. The record is stored as given;
    /// validation is the engine's job.
    foundation::RankResult<void> addOutcome(const std::string& sessionId,
                                            Outcome outcome);

    [[nodiscard]] foundation::RankResult<std::vector<Item>> getItems(
        const RankingScope& scope) const override;

    [[nodiscard]] foundation::RankResult<std::vector<Outcome>> getOutcomes(
        const RankingScope& scope) const override;

    [[nodiscard]] foundation::RankResult<std::size_t> getOutcomeCount(
        const RankingScope& scope) const override;

    foundation::RankResult<void> writeStrengths(
        const RankingScope& scope,
        const std::vector<StrengthUpdate>& updates,
        std::optional<int> convergenceScore) override;

    [[nodiscard]] foundation::RankResult<std::optional<AggregationClock::time_point>>
    getLastAggregationTime(const std::string& artist) const override;

    [[nodiscard]] foundation::RankResult<std::optional<AggregationStats>>
    getAggregationStats(const std::string& artist) const override;

    foundation::RankResult<void> writeAggregationStats(
        const std::string& artist,
        std::size_t outcomeCount,
        AggregationClock::time_point at) override;

    /// Last convergence score written for a session.
    [[nodiscard]] std::optional<int> convergenceScore(const std::string& sessionId) const;

    /// Global vote count of an item (0 if never aggregated).
    [[nodiscard]] uint32_t votesCount(const ItemId& id) const;

    /// Number of successful writeStrengths() calls.
    [[nodiscard]] std::size_t writeCount() const;

private:
    struct SessionRecord {
        std::string artistKey;
        std::vector<ItemId> itemOrder;
        std::unordered_map<ItemId, Item> items;
        std::optional<int> convergence;
    };

    struct GlobalItemRecord {
        std::string artistKey;
        Item item;
        uint32_t votes = 0;
    };

    struct LoggedOutcome {
        std::string sessionId;
        Outcome outcome;
    };

    /// Collect outcomes of a scope; caller holds mutex_.
    foundation::RankResult<std::vector<Outcome>> collectOutcomes(
        const RankingScope& scope) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, SessionRecord> sessions_;
    std::vector<ItemId> globalOrder_;
    std::unordered_map<ItemId, GlobalItemRecord> globalItems_;
    std::vector<LoggedOutcome> outcomeLog_;
    std::unordered_map<std::string, AggregationStats> aggregationStats_;
    std::size_t writes_ = 0;
};

} // namespace sre::ranking
