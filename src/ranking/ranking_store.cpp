/// @file ranking_store.cpp
/// @brief InMemoryRankingStore implementation.

#include "sre/ranking/ranking_store.hpp"

#include "sre/ranking/aggregation_policy.hpp"

namespace sre::ranking {

using sre::foundation::ErrorCode;
using sre::foundation::RankError;
using sre::foundation::RankResult;

void InMemoryRankingStore::createSession(const std::string& sessionId,
                                         const std::string& artist) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_[sessionId].artistKey = normalizeArtist(artist);
}

RankResult<void> InMemoryRankingStore::addItem(const std::string& sessionId,
                                               const ItemId& id,
                                               std::optional<double> strength) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) {
        return RankResult<void>::err(
            RankError(ErrorCode::ScopeNotFound, "unknown session: " + sessionId));
    }

    auto& session = it->second;
    if (session.items.count(id) == 0) {
        session.itemOrder.push_back(id);
    }
    Item item;
    item.id = id;
    item.strength = strength;
    session.items[id] = item;

    if (globalItems_.count(id) == 0) {
        globalOrder_.push_back(id);
        GlobalItemRecord record;
        record.artistKey = session.artistKey;
        record.item.id = id;
        globalItems_.emplace(id, std::move(record));
    }
    return RankResult<void>::ok();
}

RankResult<void> InMemoryRankingStore::addOutcome(const std::string& sessionId,
                                                  Outcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.count(sessionId) == 0) {
        return RankResult<void>::err(
            RankError(ErrorCode::ScopeNotFound, "unknown session: " + sessionId));
    }
    outcomeLog_.push_back({sessionId, std::move(outcome)});
    return RankResult<void>::ok();
}

RankResult<std::vector<Item>> InMemoryRankingStore::getItems(
    const RankingScope& scope) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Item> items;

    if (scope.kind() == RankingScope::Kind::Session) {
        auto it = sessions_.find(scope.key());
        if (it == sessions_.end()) {
            return RankResult<std::vector<Item>>::err(
                RankError(ErrorCode::ScopeNotFound, "unknown session: " + scope.key()));
        }
        for (const auto& id : it->second.itemOrder) {
            items.push_back(it->second.items.at(id));
        }
        return RankResult<std::vector<Item>>::ok(std::move(items));
    }

    auto artistKey = normalizeArtist(scope.key());
    for (const auto& id : globalOrder_) {
        const auto& record = globalItems_.at(id);
        if (record.artistKey == artistKey) {
            items.push_back(record.item);
        }
    }
    return RankResult<std::vector<Item>>::ok(std::move(items));
}

RankResult<std::vector<Outcome>> InMemoryRankingStore::collectOutcomes(
    const RankingScope& scope) const {
    std::vector<Outcome> outcomes;

    if (scope.kind() == RankingScope::Kind::Session) {
        if (sessions_.count(scope.key()) == 0) {
            return RankResult<std::vector<Outcome>>::err(
                RankError(ErrorCode::ScopeNotFound, "unknown session: " + scope.key()));
        }
        for (const auto& logged : outcomeLog_) {
            if (logged.sessionId == scope.key()) {
                outcomes.push_back(logged.outcome);
            }
        }
        return RankResult<std::vector<Outcome>>::ok(std::move(outcomes));
    }

    auto artistKey = normalizeArtist(scope.key());
    for (const auto& logged : outcomeLog_) {
        if (sessions_.at(logged.sessionId).artistKey == artistKey) {
            outcomes.push_back(logged.outcome);
        }
    }
    return RankResult<std::vector<Outcome>>::ok(std::move(outcomes));
}

RankResult<std::vector<Outcome>> InMemoryRankingStore::getOutcomes(
    const RankingScope& scope) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return collectOutcomes(scope);
}

RankResult<std::size_t> InMemoryRankingStore::getOutcomeCount(
    const RankingScope& scope) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto outcomes = collectOutcomes(scope);
    if (!outcomes) {
        return RankResult<std::size_t>::err(outcomes.error());
    }
    return RankResult<std::size_t>::ok(outcomes.value().size());
}

RankResult<void> InMemoryRankingStore::writeStrengths(
    const RankingScope& scope,
    const std::vector<StrengthUpdate>& updates,
    std::optional<int> convergenceScore) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (scope.kind() == RankingScope::Kind::Session) {
        auto it = sessions_.find(scope.key());
        if (it == sessions_.end()) {
            return RankResult<void>::err(
                RankError(ErrorCode::ScopeNotFound, "unknown session: " + scope.key()));
        }
        auto& session = it->second;

        // Validate everything before touching anything.
        for (const auto& update : updates) {
            if (session.items.count(update.id) == 0) {
                return RankResult<void>::err(
                    RankError(ErrorCode::WriteFailed,
                              "item " + update.id + " is not part of " + scope.describe(),
                              update.id));
            }
        }
        for (const auto& update : updates) {
            auto& item = session.items.at(update.id);
            item.strength = update.strength;
            item.rating = update.rating;
        }
        if (convergenceScore.has_value()) {
            session.convergence = convergenceScore;
        }
        ++writes_;
        return RankResult<void>::ok();
    }

    auto artistKey = normalizeArtist(scope.key());
    for (const auto& update : updates) {
        auto it = globalItems_.find(update.id);
        if (it == globalItems_.end() || it->second.artistKey != artistKey) {
            return RankResult<void>::err(
                RankError(ErrorCode::WriteFailed,
                          "item " + update.id + " is not part of " + scope.describe(),
                          update.id));
        }
    }
    for (const auto& update : updates) {
        auto& record = globalItems_.at(update.id);
        record.item.strength = update.strength;
        record.item.rating = update.rating;
        if (update.votesCount.has_value()) {
            record.votes = *update.votesCount;
        }
    }
    ++writes_;
    return RankResult<void>::ok();
}

RankResult<std::optional<AggregationClock::time_point>>
InMemoryRankingStore::getLastAggregationTime(const std::string& artist) const {
    using ResultT = RankResult<std::optional<AggregationClock::time_point>>;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = aggregationStats_.find(normalizeArtist(artist));
    if (it == aggregationStats_.end()) {
        return ResultT::ok(std::nullopt);
    }
    return ResultT::ok(it->second.lastUpdatedAt);
}

RankResult<std::optional<AggregationStats>>
InMemoryRankingStore::getAggregationStats(const std::string& artist) const {
    using ResultT = RankResult<std::optional<AggregationStats>>;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = aggregationStats_.find(normalizeArtist(artist));
    if (it == aggregationStats_.end()) {
        return ResultT::ok(std::nullopt);
    }
    return ResultT::ok(it->second);
}

RankResult<void> InMemoryRankingStore::writeAggregationStats(
    const std::string& artist,
    std::size_t outcomeCount,
    AggregationClock::time_point at) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& stats = aggregationStats_[normalizeArtist(artist)];
    stats.processedOutcomes = outcomeCount;
    stats.lastUpdatedAt = at;
    return RankResult<void>::ok();
}

std::optional<int> InMemoryRankingStore::convergenceScore(
    const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second.convergence;
}

uint32_t InMemoryRankingStore::votesCount(const ItemId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = globalItems_.find(id);
    return it == globalItems_.end() ? 0 : it->second.votes;
}

std::size_t InMemoryRankingStore::writeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return writes_;
}

} // namespace sre::ranking
