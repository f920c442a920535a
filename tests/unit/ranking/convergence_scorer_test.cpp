/// @file convergence_scorer_test.cpp
/// @brief Unit tests for ConvergenceScorer.

#include <gtest/gtest.h>

#include <cmath>
#include <string>
#include <vector>

#include "sre/ranking/convergence_scorer.hpp"
#include "sre/ranking/strength_solver.hpp"

using namespace sre::ranking;

namespace {

Outcome win(const std::string& winner, const std::string& loser) {
    Outcome o;
    o.itemA = winner;
    o.itemB = loser;
    o.winner = winner;
    return o;
}

/// Every pair once, the earlier id in @p order always winning.
std::vector<Outcome> orderedRoundRobin(const std::vector<ItemId>& order) {
    std::vector<Outcome> outcomes;
    for (std::size_t i = 0; i < order.size(); ++i) {
        for (std::size_t j = i + 1; j < order.size(); ++j) {
            outcomes.push_back(win(order[i], order[j]));
        }
    }
    return outcomes;
}

} // namespace

// ============================================================================
// Combination and guard rails
// ============================================================================

class ConvergenceCombineTest : public ::testing::Test {};

TEST_F(ConvergenceCombineTest, Extremes) {
    EXPECT_EQ(ConvergenceScorer::combine(1.0, 1.0, 1.0), 100);
    EXPECT_EQ(ConvergenceScorer::combine(0.0, 0.0, 0.0), 0);
}

TEST_F(ConvergenceCombineTest, CurveLiftsMidValues) {
    // 0.5^0.7 = 0.6156
    EXPECT_EQ(ConvergenceScorer::combine(0.5, 0.5, 0.5), 61);
    // 0.4^0.7 = 0.5266
    EXPECT_EQ(ConvergenceScorer::combine(1.0, 0.0, 0.0), 52);
}

TEST_F(ConvergenceCombineTest, CapsForThinCoverage) {
    EXPECT_EQ(ConvergenceScorer::applyGuardRails(90, 0, 0.0), 65);
    EXPECT_EQ(ConvergenceScorer::applyGuardRails(90, 1, 0.0), 65);
    EXPECT_EQ(ConvergenceScorer::applyGuardRails(90, 2, 0.0), 85);
    EXPECT_EQ(ConvergenceScorer::applyGuardRails(90, 3, 0.0), 90);
}

TEST_F(ConvergenceCombineTest, FloorsFromStability) {
    EXPECT_EQ(ConvergenceScorer::applyGuardRails(50, 3, 0.95), 92);
    EXPECT_EQ(ConvergenceScorer::applyGuardRails(50, 3, 0.85), 90);
    EXPECT_EQ(ConvergenceScorer::applyGuardRails(50, 3, 0.75), 88);
    EXPECT_EQ(ConvergenceScorer::applyGuardRails(50, 3, 0.6), 50);
    EXPECT_EQ(ConvergenceScorer::applyGuardRails(97, 3, 0.95), 97);
}

TEST_F(ConvergenceCombineTest, CapWinsOverFloor) {
    EXPECT_EQ(ConvergenceScorer::applyGuardRails(50, 1, 1.0), 65);
    EXPECT_EQ(ConvergenceScorer::applyGuardRails(50, 2, 1.0), 85);
}

// ============================================================================
// Stability grading
// ============================================================================

class StabilityGradeTest : public ::testing::Test {
protected:
    const std::vector<ItemId> base_ = {"a", "b", "c", "d", "e", "f", "g"};
};

TEST_F(StabilityGradeTest, IdenticalRankingIsFullyStable) {
    EXPECT_DOUBLE_EQ(ConvergenceScorer::gradeStability(base_, base_), 1.0);
}

TEST_F(StabilityGradeTest, TailReorderKeepsHead) {
    std::vector<ItemId> current = {"a", "b", "c", "d", "e", "g", "f"};
    EXPECT_DOUBLE_EQ(ConvergenceScorer::gradeStability(base_, current), 0.95);
}

TEST_F(StabilityGradeTest, HeadReorderWithinSameMembers) {
    std::vector<ItemId> current = {"b", "a", "c", "d", "e", "f", "g"};
    EXPECT_DOUBLE_EQ(ConvergenceScorer::gradeStability(base_, current), 0.85);
}

TEST_F(StabilityGradeTest, SameMembersDifferentHead) {
    std::vector<ItemId> current = {"f", "b", "c", "d", "e", "a", "g"};
    EXPECT_DOUBLE_EQ(ConvergenceScorer::gradeStability(base_, current), 0.75);
}

TEST_F(StabilityGradeTest, SameHeadMembersDifferentTail) {
    std::vector<ItemId> current = {"a", "b", "c", "d", "e", "f", "h"};
    EXPECT_DOUBLE_EQ(ConvergenceScorer::gradeStability(base_, current), 0.6);
}

TEST_F(StabilityGradeTest, PartialOverlap) {
    std::vector<ItemId> previous = {"a", "b", "c", "d", "e", "f", "g", "h", "i", "j"};
    std::vector<ItemId> current = {"k", "l", "m", "n", "o", "a", "b", "c", "d", "e"};
    EXPECT_DOUBLE_EQ(ConvergenceScorer::gradeStability(previous, current, 10), 0.25);
}

TEST_F(StabilityGradeTest, EmptyListIsUnstable) {
    EXPECT_DOUBLE_EQ(ConvergenceScorer::gradeStability({}, base_), 0.0);
}

TEST_F(StabilityGradeTest, TopRankingBreaksTiesById) {
    StrengthMap strengths = {{"b", 0.0}, {"a", 0.0}, {"c", 1.0}};
    auto top = ConvergenceScorer::topRanking(strengths, 10);
    ASSERT_EQ(top.size(), 3u);
    EXPECT_EQ(top[0], "c");
    EXPECT_EQ(top[1], "a");
    EXPECT_EQ(top[2], "b");

    EXPECT_EQ(ConvergenceScorer::topRanking(strengths, 1).size(), 1u);
}

// ============================================================================
// Coverage and separation
// ============================================================================

class ConvergenceFactorTest : public ::testing::Test {};

TEST_F(ConvergenceFactorTest, CoverageFullRoundRobin) {
    ComparisonCounts counts = {{"a", 3}, {"b", 3}, {"c", 3}, {"d", 3}};
    EXPECT_DOUBLE_EQ(ConvergenceScorer::coverage(counts, 6, 4), 1.0);
}

TEST_F(ConvergenceFactorTest, CoveragePartial) {
    ComparisonCounts counts = {{"a", 3}, {"b", 3}, {"c", 2}};
    // sqrt(2/3 * 4/4.5)
    EXPECT_NEAR(ConvergenceScorer::coverage(counts, 4, 3),
                std::sqrt((2.0 / 3.0) * (4.0 / 4.5)), 1e-12);
}

TEST_F(ConvergenceFactorTest, ComparisonCountsIgnoreNonDeterminate) {
    StrengthMap strengths = {{"a", 0.0}, {"b", 0.0}, {"c", 0.0}};
    Outcome skipped;
    skipped.itemA = "a";
    skipped.itemB = "c";

    auto counts = ConvergenceScorer::comparisonCounts(
        {win("a", "b"), skipped, win("a", "ghost")}, strengths);
    EXPECT_EQ(counts.at("a"), 1u);
    EXPECT_EQ(counts.at("b"), 1u);
    EXPECT_EQ(counts.at("c"), 0u);
}

TEST_F(ConvergenceFactorTest, SeparationFlatRankingIsZero) {
    StrengthMap strengths = {{"a", 0.001}, {"b", 0.0}, {"c", -0.001}};
    ComparisonCounts counts = {{"a", 5}, {"b", 5}, {"c", 5}};
    EXPECT_DOUBLE_EQ(ConvergenceScorer::separation(strengths, counts), 0.0);
}

TEST_F(ConvergenceFactorTest, SeparationEvenSpreadWellCompared) {
    StrengthMap strengths = {{"a", -2.0}, {"b", -1.0}, {"c", 0.0}, {"d", 1.0}, {"e", 2.0}};
    ComparisonCounts counts = {{"a", 3}, {"b", 4}, {"c", 3}, {"d", 5}, {"e", 3}};
    EXPECT_NEAR(ConvergenceScorer::separation(strengths, counts), 1.0, 1e-12);
}

TEST_F(ConvergenceFactorTest, SeparationWithoutComparisonsLosesConfidence) {
    StrengthMap strengths = {{"a", -2.0}, {"b", -1.0}, {"c", 0.0}, {"d", 1.0}, {"e", 2.0}};
    EXPECT_NEAR(ConvergenceScorer::separation(strengths, {}), 0.5, 1e-12);
}

TEST_F(ConvergenceFactorTest, SeparationUnevenGapsLowerUniformity) {
    StrengthMap even = {{"a", 0.0}, {"b", 1.0}, {"c", 2.0}};
    StrengthMap uneven = {{"a", 0.0}, {"b", 1.9}, {"c", 2.0}};
    ComparisonCounts counts = {{"a", 3}, {"b", 3}, {"c", 3}};
    EXPECT_GT(ConvergenceScorer::separation(even, counts),
              ConvergenceScorer::separation(uneven, counts));
}

TEST_F(ConvergenceFactorTest, Progress) {
    EXPECT_DOUBLE_EQ(ConvergenceScorer::progress(0, 0), 1.0);
    EXPECT_DOUBLE_EQ(ConvergenceScorer::progress(5, 4), 0.5);
    EXPECT_DOUBLE_EQ(ConvergenceScorer::progress(100, 4), 1.0);
}

// ============================================================================
// End-to-end score
// ============================================================================

class ConvergenceScoreTest : public ::testing::Test {
protected:
    StrengthSolver solver_;
    ConvergenceScorer scorer_;
};

TEST_F(ConvergenceScoreTest, SingleItemIsFullyConverged) {
    auto result = scorer_.score({}, 1, {{"solo", 0.0}});
    EXPECT_EQ(result.score, 100);
    EXPECT_DOUBLE_EQ(result.coverage, 1.0);
    EXPECT_DOUBLE_EQ(result.separation, 1.0);
    EXPECT_DOUBLE_EQ(result.stability, 1.0);
}

TEST_F(ConvergenceScoreTest, NoOutcomesIsZero) {
    auto result = scorer_.score({}, 3, {{"a", 0.0}, {"b", 0.0}, {"c", 0.0}});
    EXPECT_EQ(result.score, 0);
    EXPECT_DOUBLE_EQ(result.coverage, 0.0);
    EXPECT_DOUBLE_EQ(result.separation, 0.0);
    EXPECT_DOUBLE_EQ(result.stability, 0.0);
}

TEST_F(ConvergenceScoreTest, ShortHistoryIsCappedAndUnstable) {
    std::vector<Outcome> outcomes = {win("a", "b"), win("b", "c"), win("a", "c")};
    auto solved = solver_.solve({"a", "b", "c"}, outcomes);
    auto result = scorer_.score(outcomes, 3, solved.strengths);

    EXPECT_DOUBLE_EQ(result.stability, 0.0);
    EXPECT_DOUBLE_EQ(result.coverage, 0.0);  // nobody has 3 comparisons
    EXPECT_LE(result.score, 85);
    EXPECT_GT(result.separation, 0.0);
}

TEST_F(ConvergenceScoreTest, MissingStrengthCountsAsUncompared) {
    std::vector<Outcome> outcomes = orderedRoundRobin({"a", "b", "c", "d"});
    auto solved = solver_.solve({"a", "b", "c", "d"}, outcomes);
    auto full = scorer_.score(outcomes, 4, solved.strengths);

    // A fifth item the run knows about but never compared.
    auto partial = scorer_.score(outcomes, 5, solved.strengths);
    EXPECT_LE(partial.score, 65);
    EXPECT_LT(partial.coverage, full.coverage);
}

TEST_F(ConvergenceScoreTest, ConsistentReplayIsStable) {
    std::vector<ItemId> order = {"s0", "s1", "s2", "s3", "s4", "s5"};
    auto outcomes = orderedRoundRobin(order);
    auto second = orderedRoundRobin(order);
    outcomes.insert(outcomes.end(), second.begin(), second.end());
    // The latest lookback window only confirms the order.
    for (std::size_t i = 0; i < 5; ++i) {
        outcomes.push_back(win(order[i], "s5"));
    }
    ASSERT_EQ(outcomes.size(), 35u);

    auto solved = solver_.solve(order, outcomes);
    auto result = scorer_.score(outcomes, order.size(), solved.strengths);

    EXPECT_DOUBLE_EQ(result.stability, 1.0);
    EXPECT_DOUBLE_EQ(result.coverage, 1.0);
    EXPECT_GE(result.score, 92);
}

TEST_F(ConvergenceScoreTest, StabilityNeedsEnoughHistory) {
    ConvergenceConfig cfg;
    cfg.lookback = 2;
    cfg.topN = 3;
    ConvergenceScorer scorer({}, cfg);

    std::vector<Outcome> outcomes = {win("a", "b"), win("b", "c"), win("a", "c"),
                                     win("a", "b")};
    auto solved = solver_.solve({"a", "b", "c"}, outcomes);
    EXPECT_DOUBLE_EQ(scorer.stability(outcomes, solved.strengths), 0.0);

    outcomes.push_back(win("b", "c"));
    EXPECT_DOUBLE_EQ(scorer.stability(outcomes, solved.strengths), 1.0);
}
