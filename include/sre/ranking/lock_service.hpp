#pragma once

/// @file lock_service.hpp
/// @brief Mutual-exclusion collaborator with TTL-based locks.
///
/// Global runs take one lock per artist. A lock that is not released
/// expires after its TTL, which doubles as the minimum interval between
/// two runs for the same artist.

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace sre::ranking {

/// Abstract distributed lock.
///
/// Implementations must be safe to call from any thread and, in a
/// multi-instance deployment, from any process.
class ILockService {
public:
    virtual ~ILockService() = default;

    /// Take @p key for @p ttl. False if it is currently held (not an error).
    [[nodiscard]] virtual bool tryAcquire(const std::string& key,
                                          std::chrono::milliseconds ttl) = 0;

    /// Drop @p key before its TTL runs out. No-op if not held.
    virtual void release(const std::string& key) = 0;
};

/// Single-process lock table for tests and tooling.
class InMemoryLockService : public ILockService {
public:
    [[nodiscard]] bool tryAcquire(const std::string& key,
                                  std::chrono::milliseconds ttl) override;

    void release(const std::string& key) override;

    /// Whether @p key is held and unexpired.
    [[nodiscard]] bool isHeld(const std::string& key) const;

private:
    using TimePoint = std::chrono::steady_clock::time_point;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, TimePoint> expiries_;
};

} // namespace sre::ranking
