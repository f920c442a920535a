/// @file lock_service.cpp
/// @brief InMemoryLockService implementation.

#include "sre/ranking/lock_service.hpp"

namespace sre::ranking {

bool InMemoryLockService::tryAcquire(const std::string& key,
                                     std::chrono::milliseconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::steady_clock::now();
    auto it = expiries_.find(key);
    if (it != expiries_.end() && it->second > now) {
        return false;
    }
    expiries_[key] = now + ttl;
    return true;
}

void InMemoryLockService::release(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    expiries_.erase(key);
}

bool InMemoryLockService::isHeld(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = expiries_.find(key);
    return it != expiries_.end() && it->second > std::chrono::steady_clock::now();
}

} // namespace sre::ranking
