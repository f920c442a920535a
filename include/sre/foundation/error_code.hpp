#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the ranking engine.

#include <cstdint>
#include <string_view>

namespace sre::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), so the source of
/// an error can be read from the code value alone.
///
/// Numerical degradation, lock contention and empty inputs are not
/// represented here: they are expected outcomes of a ranking run and are
/// reported through the run's report and the log instead.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,

    // Storage (0x0200 - 0x02FF)
    StorageError = 0x0200,
    QueryFailed = 0x0201,
    WriteFailed = 0x0202,
    ScopeNotFound = 0x0203,

    // Lock (0x0300 - 0x03FF)
    LockError = 0x0300,
    LockReleaseFailed = 0x0301,

    // Ranking (0x0400 - 0x04FF)
    RankingError = 0x0400,
    DatasetLoadFailed = 0x0401,
    DatasetInvalid = 0x0402,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    InvalidConfig = 0x0603,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0802,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0200: return "Storage";
        case 0x0300: return "Lock";
        case 0x0400: return "Ranking";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace sre::foundation
