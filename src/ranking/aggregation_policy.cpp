/// @file aggregation_policy.cpp
/// @brief Re-ranking and re-aggregation triggers.

#include "sre/ranking/aggregation_policy.hpp"

#include <algorithm>
#include <cctype>

namespace sre::ranking {

std::string normalizeArtist(std::string_view artist) {
    std::string key(artist);
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return key;
}

std::string globalUpdateLockKey(std::string_view artist) {
    return std::string(kGlobalUpdateLockPrefix) + normalizeArtist(artist);
}

bool shouldTriggerGlobalUpdate(
    std::optional<std::chrono::system_clock::time_point> lastUpdated,
    std::size_t pending,
    std::chrono::seconds interval,
    std::chrono::system_clock::time_point now) {
    if (pending == 0) {
        return false;
    }
    if (!lastUpdated.has_value()) {
        return true;
    }
    return now - *lastUpdated >= interval;
}

} // namespace sre::ranking
