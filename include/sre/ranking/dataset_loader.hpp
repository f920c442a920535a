#pragma once

/// @file dataset_loader.hpp
/// @brief Populate an InMemoryRankingStore from a YAML dataset.
///
/// A dataset is one session, or several under a `sessions:` list:
///
/// @code{.yaml}
///   session: s-1                 # default "session-<n>"
///   artist: Demo Artist          # default "unknown"
///   items:
///     - song-a
///     - id: song-b
///       strength: 0.3            # optional stored strength
///   outcomes:
///     - {a: song-a, b: song-b, winner: song-a, latency_ms: 2100}
///     - {a: song-a, b: song-b, tie: true}
///     - {a: song-a, b: song-b}   # no preference
/// @endcode
///
/// Outcomes are stored as written, in file order. Whether they are
/// consistent is decided at ranking time.

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "sre/foundation/rank_result.hpp"
#include "sre/ranking/ranking_store.hpp"

namespace sre::ranking {

struct DatasetSummary {
    std::vector<std::string> sessionIds;
    std::vector<std::string> artists;  ///< Distinct, in first-seen order.
    std::size_t itemCount = 0;
    std::size_t outcomeCount = 0;
};

/// Load a dataset file into @p store.
/// @return Summary, or DatasetLoadFailed (unreadable / unparsable) or
///         DatasetInvalid (structure errors, context = offending path).
[[nodiscard]] foundation::RankResult<DatasetSummary> loadDataset(
    const std::filesystem::path& path, InMemoryRankingStore& store);

/// Load an in-memory YAML dataset into @p store.
[[nodiscard]] foundation::RankResult<DatasetSummary> loadDatasetString(
    std::string_view yaml, InMemoryRankingStore& store);

} // namespace sre::ranking
