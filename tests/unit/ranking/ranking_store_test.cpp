/// @file ranking_store_test.cpp
/// @brief Unit tests for InMemoryRankingStore, InMemoryLockService, the
///        aggregation policy helpers and leaderboard construction.

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "sre/ranking/aggregation_policy.hpp"
#include "sre/ranking/lock_service.hpp"
#include "sre/ranking/ranking_store.hpp"
#include "sre/ranking/ranking_types.hpp"

using namespace sre::ranking;
using namespace std::chrono_literals;
using sre::foundation::ErrorCode;

namespace {

Outcome win(const std::string& winner, const std::string& loser) {
    Outcome o;
    o.itemA = winner;
    o.itemB = loser;
    o.winner = winner;
    return o;
}

StrengthUpdate update(const std::string& id, double strength, double rating) {
    StrengthUpdate u;
    u.id = id;
    u.strength = strength;
    u.rating = rating;
    return u;
}

} // namespace

// ============================================================================
// InMemoryRankingStore Tests
// ============================================================================

class RankingStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_.createSession("s1", "Demo Artist");
        store_.createSession("s2", "demo artist");
        store_.createSession("other", "Someone Else");
        ASSERT_TRUE(store_.addItem("s1", "a").hasValue());
        ASSERT_TRUE(store_.addItem("s1", "b", 0.4).hasValue());
        ASSERT_TRUE(store_.addItem("s2", "c").hasValue());
        ASSERT_TRUE(store_.addItem("other", "x").hasValue());
        ASSERT_TRUE(store_.addOutcome("s1", win("a", "b")).hasValue());
        ASSERT_TRUE(store_.addOutcome("s2", win("c", "a")).hasValue());
        ASSERT_TRUE(store_.addOutcome("other", win("x", "x")).hasValue());
    }

    InMemoryRankingStore store_;
};

TEST_F(RankingStoreTest, SessionItemsKeepInsertionOrder) {
    auto items = store_.getItems(RankingScope::session("s1"));
    ASSERT_TRUE(items.hasValue());
    ASSERT_EQ(items.value().size(), 2u);
    EXPECT_EQ(items.value()[0].id, "a");
    EXPECT_FALSE(items.value()[0].strength.has_value());
    EXPECT_EQ(items.value()[1].id, "b");
    EXPECT_DOUBLE_EQ(items.value()[1].strength.value(), 0.4);
}

TEST_F(RankingStoreTest, ArtistScopeIsCaseInsensitive) {
    auto items = store_.getItems(RankingScope::artist("DEMO ARTIST"));
    ASSERT_TRUE(items.hasValue());
    EXPECT_EQ(items.value().size(), 3u);

    auto outcomes = store_.getOutcomes(RankingScope::artist("demo artist"));
    ASSERT_TRUE(outcomes.hasValue());
    ASSERT_EQ(outcomes.value().size(), 2u);
    EXPECT_EQ(outcomes.value()[0].winner.value(), "a");
    EXPECT_EQ(outcomes.value()[1].winner.value(), "c");
}

TEST_F(RankingStoreTest, OutcomeCountPerScope) {
    EXPECT_EQ(store_.getOutcomeCount(RankingScope::session("s1")).value(), 1u);
    EXPECT_EQ(store_.getOutcomeCount(RankingScope::artist("Demo Artist")).value(), 2u);
    EXPECT_EQ(store_.getOutcomeCount(RankingScope::artist("nobody")).value(), 0u);
}

TEST_F(RankingStoreTest, UnknownSessionIsScopeNotFound) {
    auto items = store_.getItems(RankingScope::session("missing"));
    ASSERT_TRUE(items.hasError());
    EXPECT_EQ(items.error().code(), ErrorCode::ScopeNotFound);

    EXPECT_EQ(store_.addItem("missing", "z").error().code(), ErrorCode::ScopeNotFound);
    EXPECT_EQ(store_.addOutcome("missing", win("a", "b")).error().code(),
              ErrorCode::ScopeNotFound);
    EXPECT_EQ(store_.getOutcomeCount(RankingScope::session("missing")).error().code(),
              ErrorCode::ScopeNotFound);
}

TEST_F(RankingStoreTest, WriteStrengthsUpdatesSession) {
    auto scope = RankingScope::session("s1");
    auto written = store_.writeStrengths(
        scope, {update("a", 1.0, 1673.7), update("b", -1.0, 1326.3)}, 42);
    ASSERT_TRUE(written.hasValue());

    auto items = store_.getItems(scope).value();
    EXPECT_DOUBLE_EQ(items[0].strength.value(), 1.0);
    EXPECT_DOUBLE_EQ(items[0].rating, 1673.7);
    EXPECT_DOUBLE_EQ(items[1].strength.value(), -1.0);
    EXPECT_EQ(store_.convergenceScore("s1"), 42);
    EXPECT_EQ(store_.writeCount(), 1u);
}

TEST_F(RankingStoreTest, WriteStrengthsIsAllOrNothing) {
    auto scope = RankingScope::session("s1");
    auto written = store_.writeStrengths(
        scope, {update("a", 1.0, 1673.7), update("c", -1.0, 1326.3)}, 42);

    ASSERT_TRUE(written.hasError());
    EXPECT_EQ(written.error().code(), ErrorCode::WriteFailed);
    ASSERT_NE(written.error().context<std::string>(), nullptr);
    EXPECT_EQ(*written.error().context<std::string>(), "c");

    auto items = store_.getItems(scope).value();
    EXPECT_FALSE(items[0].strength.has_value());
    EXPECT_FALSE(store_.convergenceScore("s1").has_value());
    EXPECT_EQ(store_.writeCount(), 0u);
}

TEST_F(RankingStoreTest, SessionAndGlobalStrengthsAreSeparate) {
    auto session = RankingScope::session("s1");
    auto artist = RankingScope::artist("Demo Artist");

    StrengthUpdate global = update("a", 2.0, 1847.4);
    global.votesCount = 7;
    ASSERT_TRUE(store_.writeStrengths(artist, {global}, std::nullopt).hasValue());

    EXPECT_FALSE(store_.getItems(session).value()[0].strength.has_value());
    EXPECT_DOUBLE_EQ(store_.getItems(artist).value()[0].strength.value(), 2.0);
    EXPECT_EQ(store_.votesCount("a"), 7u);
}

TEST_F(RankingStoreTest, GlobalWriteRejectsOtherArtistsItems) {
    auto written = store_.writeStrengths(RankingScope::artist("Demo Artist"),
                                         {update("x", 0.0, 1500.0)}, std::nullopt);
    ASSERT_TRUE(written.hasError());
    EXPECT_EQ(written.error().code(), ErrorCode::WriteFailed);
}

TEST_F(RankingStoreTest, AggregationStatsRoundTrip) {
    auto before = store_.getAggregationStats("Demo Artist");
    ASSERT_TRUE(before.hasValue());
    EXPECT_FALSE(before.value().has_value());
    EXPECT_FALSE(store_.getLastAggregationTime("Demo Artist").value().has_value());

    auto at = AggregationClock::now();
    ASSERT_TRUE(store_.writeAggregationStats("DEMO ARTIST", 2, at).hasValue());

    auto after = store_.getAggregationStats("demo artist");
    ASSERT_TRUE(after.value().has_value());
    EXPECT_EQ(after.value()->processedOutcomes, 2u);
    EXPECT_EQ(after.value()->lastUpdatedAt, at);
    EXPECT_EQ(store_.getLastAggregationTime("Demo Artist").value(), at);
}

// ============================================================================
// InMemoryLockService Tests
// ============================================================================

class LockServiceTest : public ::testing::Test {
protected:
    InMemoryLockService locks_;
};

TEST_F(LockServiceTest, SecondAcquireFailsWhileHeld) {
    EXPECT_TRUE(locks_.tryAcquire("k", 10s));
    EXPECT_FALSE(locks_.tryAcquire("k", 10s));
    EXPECT_TRUE(locks_.isHeld("k"));
}

TEST_F(LockServiceTest, ReleaseFreesKey) {
    ASSERT_TRUE(locks_.tryAcquire("k", 10s));
    locks_.release("k");
    EXPECT_FALSE(locks_.isHeld("k"));
    EXPECT_TRUE(locks_.tryAcquire("k", 10s));
}

TEST_F(LockServiceTest, ExpiredLockIsReclaimable) {
    ASSERT_TRUE(locks_.tryAcquire("k", 1ms));
    std::this_thread::sleep_for(10ms);
    EXPECT_FALSE(locks_.isHeld("k"));
    EXPECT_TRUE(locks_.tryAcquire("k", 10s));
}

TEST_F(LockServiceTest, KeysAreIndependent) {
    EXPECT_TRUE(locks_.tryAcquire(globalUpdateLockKey("A"), 10s));
    EXPECT_TRUE(locks_.tryAcquire(globalUpdateLockKey("B"), 10s));
    EXPECT_FALSE(locks_.tryAcquire(globalUpdateLockKey("a"), 10s));
}

TEST_F(LockServiceTest, ReleasingUnheldKeyIsNoop) {
    locks_.release("never");
    EXPECT_FALSE(locks_.isHeld("never"));
}

TEST_F(LockServiceTest, ConcurrentAcquireHasOneWinner) {
    constexpr int kThreads = 8;
    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([this, &winners]() {
            if (locks_.tryAcquire("contended", 10s)) {
                winners.fetch_add(1);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(winners.load(), 1);
}

// ============================================================================
// Aggregation Policy Tests
// ============================================================================

class AggregationPolicyTest : public ::testing::Test {
protected:
    AggregationClock::time_point now_ = AggregationClock::now();
};

TEST_F(AggregationPolicyTest, ArtistKeyIsLowercased) {
    EXPECT_EQ(normalizeArtist("Demi Lovato"), "demi lovato");
    EXPECT_EQ(globalUpdateLockKey("Demi Lovato"), "global_update_lock:demi lovato");
}

TEST_F(AggregationPolicyTest, PendingComparisons) {
    static_assert(pendingComparisons(10, 4) == 6);
    EXPECT_EQ(pendingComparisons(10, 4), 6u);
    EXPECT_EQ(pendingComparisons(3, 5), 0u);
    EXPECT_EQ(pendingComparisons(0, 0), 0u);
}

TEST_F(AggregationPolicyTest, NothingPendingNeverTriggers) {
    EXPECT_FALSE(shouldTriggerGlobalUpdate(std::nullopt, 0, 120s, now_));
    EXPECT_FALSE(shouldTriggerGlobalUpdate(now_ - 1h, 0, 120s, now_));
}

TEST_F(AggregationPolicyTest, NeverUpdatedTriggers) {
    EXPECT_TRUE(shouldTriggerGlobalUpdate(std::nullopt, 1, 120s, now_));
}

TEST_F(AggregationPolicyTest, IntervalGatesUpdates) {
    EXPECT_FALSE(shouldTriggerGlobalUpdate(now_ - 60s, 5, 120s, now_));
    EXPECT_TRUE(shouldTriggerGlobalUpdate(now_ - 120s, 5, 120s, now_));
    EXPECT_TRUE(shouldTriggerGlobalUpdate(now_ - 10min, 5, 120s, now_));
}

TEST_F(AggregationPolicyTest, SessionRerankCadence) {
    static_assert(shouldRerankSession(5, 5));
    EXPECT_TRUE(shouldRerankSession(10, 5));
    EXPECT_FALSE(shouldRerankSession(6, 5));
    EXPECT_FALSE(shouldRerankSession(0, 5));
    EXPECT_FALSE(shouldRerankSession(5, 0));
    EXPECT_TRUE(shouldRerankSession(3, 1));
}

// ============================================================================
// Leaderboard Tests
// ============================================================================

class LeaderboardTest : public ::testing::Test {};

TEST_F(LeaderboardTest, OrdersByRatingAndAssignsRanks) {
    std::vector<StrengthUpdate> updates = {
        update("mid", 0.0, 1500.0), update("top", 1.0, 1673.7),
        update("low", -1.0, 1326.3)};
    auto board = buildLeaderboard(updates);

    ASSERT_EQ(board.size(), 3u);
    EXPECT_EQ(board[0].id, "top");
    EXPECT_EQ(board[0].rank, 1u);
    EXPECT_EQ(board[1].id, "mid");
    EXPECT_EQ(board[2].id, "low");
    EXPECT_EQ(board[2].rank, 3u);
    EXPECT_EQ(board[0].votesCount, 0u);
}

TEST_F(LeaderboardTest, TiesBrokenById) {
    auto board = buildLeaderboard({update("b", 0.0, 1500.0), update("a", 0.0, 1500.0)});
    ASSERT_EQ(board.size(), 2u);
    EXPECT_EQ(board[0].id, "a");
    EXPECT_EQ(board[1].id, "b");
}

TEST_F(LeaderboardTest, LimitTruncates) {
    StrengthUpdate voted = update("top", 1.0, 1673.7);
    voted.votesCount = 12;
    auto board = buildLeaderboard({update("mid", 0.0, 1500.0), voted}, 1);
    ASSERT_EQ(board.size(), 1u);
    EXPECT_EQ(board[0].id, "top");
    EXPECT_EQ(board[0].votesCount, 12u);
}
