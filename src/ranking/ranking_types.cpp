/// @file ranking_types.cpp
/// @brief Leaderboard construction.

#include "sre/ranking/ranking_types.hpp"

#include <algorithm>

namespace sre::ranking {

std::vector<LeaderboardEntry> buildLeaderboard(
    const std::vector<StrengthUpdate>& updates, std::size_t limit) {
    std::vector<const StrengthUpdate*> ordered;
    ordered.reserve(updates.size());
    for (const auto& update : updates) {
        ordered.push_back(&update);
    }

    std::sort(ordered.begin(), ordered.end(),
              [](const StrengthUpdate* lhs, const StrengthUpdate* rhs) {
                  if (lhs->rating != rhs->rating) {
                      return lhs->rating > rhs->rating;
                  }
                  return lhs->id < rhs->id;
              });

    if (limit > 0 && ordered.size() > limit) {
        ordered.resize(limit);
    }

    std::vector<LeaderboardEntry> board;
    board.reserve(ordered.size());
    uint32_t rank = 1;
    for (const auto* update : ordered) {
        LeaderboardEntry entry;
        entry.rank = rank++;
        entry.id = update->id;
        entry.strength = update->strength;
        entry.rating = update->rating;
        entry.votesCount = update->votesCount.value_or(0);
        board.push_back(std::move(entry));
    }
    return board;
}

} // namespace sre::ranking
