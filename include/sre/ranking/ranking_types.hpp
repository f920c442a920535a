#pragma once

/// @file ranking_types.hpp
/// @brief Core types shared by the solver, the scorer and the run
///        orchestrators.
///
/// Strengths are natural-log values centred on 0.0 ("average"); ratings
/// are always derived from them through RatingScale.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sre::ranking {

/// Opaque item (song) identifier.
using ItemId = std::string;

/// An item as read from the persistence collaborator.
struct Item {
    ItemId id;
    std::optional<double> strength;  ///< Absent until the item enters a run.
    double rating = 1500.0;
};

/// One recorded pairwise judgment.
///
/// winner set and isTie false: decisive result.
/// winner absent and isTie true: tie, both items credited.
/// winner absent and isTie false: explicit "no preference"; kept as
/// history but ignored by strength estimation.
struct Outcome {
    ItemId itemA;
    ItemId itemB;
    std::optional<ItemId> winner;
    bool isTie = false;
    std::optional<int64_t> decisionLatencyMs;

    /// Winner or tie, i.e. the outcome carries a result.
    [[nodiscard]] bool isDeterminate() const noexcept {
        return isTie || winner.has_value();
    }

    [[nodiscard]] bool references(const ItemId& id) const noexcept {
        return itemA == id || itemB == id;
    }
};

/// The set over which strengths are jointly estimated.
class RankingScope {
public:
    enum class Kind : uint8_t {
        Session,  ///< One bounded item set with its own history.
        Artist    ///< Union of all sessions sharing an artist label.
    };

    static RankingScope session(std::string id) {
        return RankingScope(Kind::Session, std::move(id));
    }

    static RankingScope artist(std::string name) {
        return RankingScope(Kind::Artist, std::move(name));
    }

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& key() const noexcept { return key_; }

    /// "session:<id>" / "artist:<name>", used in log context.
    [[nodiscard]] std::string describe() const {
        return (kind_ == Kind::Session ? "session:" : "artist:") + key_;
    }

private:
    RankingScope(Kind kind, std::string key)
        : kind_(kind), key_(std::move(key)) {}

    Kind kind_;
    std::string key_;
};

/// A strength/rating pair written back after a run.
struct StrengthUpdate {
    ItemId id;
    double strength = 0.0;
    double rating = 1500.0;
    std::optional<uint32_t> votesCount;  ///< Set by global runs only.
};

/// Trustworthiness of a ranking.
struct ConvergenceResult {
    int score = 0;            ///< 0-100
    double coverage = 0.0;    ///< 0-1
    double separation = 0.0;  ///< 0-1
    double stability = 0.0;   ///< 0-1
};

/// One row of a ranked listing.
struct LeaderboardEntry {
    uint32_t rank = 0;  ///< 1-based
    ItemId id;
    double strength = 0.0;
    double rating = 1500.0;
    uint32_t votesCount = 0;
};

/// Order updates by rating (highest first, ties by id) and assign ranks.
///
/// @param limit  Maximum number of rows; 0 means no limit.
[[nodiscard]] std::vector<LeaderboardEntry> buildLeaderboard(
    const std::vector<StrengthUpdate>& updates, std::size_t limit = 0);

} // namespace sre::ranking
