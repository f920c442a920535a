#pragma once

/// @file aggregation_policy.hpp
/// @brief When to re-rank a session and when to re-aggregate an artist.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sre::ranking {

/// Prefix of the per-artist global update lock key.
inline constexpr std::string_view kGlobalUpdateLockPrefix = "global_update_lock:";

/// Case-insensitive artist key ("Demi Lovato" and "demi lovato" collide).
[[nodiscard]] std::string normalizeArtist(std::string_view artist);

/// "global_update_lock:<normalized artist>"
[[nodiscard]] std::string globalUpdateLockKey(std::string_view artist);

/// Outcomes recorded since the last global run.
[[nodiscard]] constexpr std::size_t pendingComparisons(std::size_t total,
                                                       std::size_t processed) noexcept {
    return total > processed ? total - processed : 0;
}

/// Whether an artist's global ranking is due.
///
/// - nothing pending: no
/// - never aggregated: yes
/// - aggregated less than @p interval ago: no
[[nodiscard]] bool shouldTriggerGlobalUpdate(
    std::optional<std::chrono::system_clock::time_point> lastUpdated,
    std::size_t pending,
    std::chrono::seconds interval,
    std::chrono::system_clock::time_point now);

/// A session is re-ranked on every @p every-th recorded outcome.
[[nodiscard]] constexpr bool shouldRerankSession(std::size_t outcomeCount,
                                                 uint32_t every) noexcept {
    return every > 0 && outcomeCount > 0 && outcomeCount % every == 0;
}

} // namespace sre::ranking
