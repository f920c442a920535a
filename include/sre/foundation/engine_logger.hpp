#pragma once

/// @file engine_logger.hpp
/// @brief EngineLogger wrapping kcenon logger_system for structured,
///        category-filtered logging of ranking runs.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "sre/foundation/rank_result.hpp"

namespace sre::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Engine log categories, each with its own runtime minimum level.
enum class LogCategory : uint8_t {
    Core        = 0, ///< Configuration, startup, tooling
    Solver      = 1, ///< Strength estimation iterations
    Scoring     = 2, ///< Convergence scoring
    Ranking     = 3, ///< Per-collection runs
    Aggregation = 4, ///< Cross-collection (artist) runs and locking
    Storage     = 5  ///< Persistence collaborator
};

inline constexpr std::size_t kLogCategoryCount = 6;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Solver", "Scoring", "Ranking", "Aggregation", "Storage"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context attached to a log entry.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.scope = "session:1f0c";
///   ctx.extra["skipped"] = "3";
///   logger.logWithContext(LogLevel::Warning, LogCategory::Ranking,
///                         "Malformed outcomes skipped", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> scope;
    std::optional<std::string> artist;
    std::optional<std::string> traceId;
    std::unordered_map<std::string, std::string> extra;
};

/// Engine logger over kcenon's logging interfaces.
///
/// Messages are routed to a named logger per category ("sre.Solver",
/// ...) when one is registered in the GlobalLoggerRegistry, otherwise to
/// the registry's default logger. PIMPL keeps kcenon headers out of the
/// public API.
///
/// Default log levels per category:
/// | Category    | Default Level |
/// |-------------|---------------|
/// | Core        | Info          |
/// | Solver      | Info          |
/// | Scoring     | Info          |
/// | Ranking     | Info          |
/// | Aggregation | Info          |
/// | Storage     | Warning       |
class EngineLogger {
public:
    EngineLogger();
    ~EngineLogger();

    EngineLogger(const EngineLogger&) = delete;
    EngineLogger& operator=(const EngineLogger&) = delete;
    EngineLogger(EngineLogger&&) noexcept;
    EngineLogger& operator=(EngineLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with context fields appended as key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default logger.
    RankResult<void> flush();

    /// Process-wide instance used by the SRE_LOG macros.
    static EngineLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sre::foundation

/// @name SRE_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// Define SRE_MIN_LOG_LEVEL before including this header to drop calls
/// below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef SRE_MIN_LOG_LEVEL
    #define SRE_MIN_LOG_LEVEL 0
#endif

#define SRE_LOG(level, cat, msg)                                                   \
    do {                                                                           \
        _Pragma("GCC diagnostic push")                                             \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                        \
        if (static_cast<int>(level) >= SRE_MIN_LOG_LEVEL &&                        \
            ::sre::foundation::EngineLogger::instance().isEnabled((level), (cat)))  \
        {                                                                          \
            ::sre::foundation::EngineLogger::instance().log((level), (cat), (msg)); \
        }                                                                          \
        _Pragma("GCC diagnostic pop")                                              \
    } while (0)

#define SRE_LOG_DEBUG(cat, msg) \
    SRE_LOG(::sre::foundation::LogLevel::Debug, (cat), (msg))

#define SRE_LOG_INFO(cat, msg) \
    SRE_LOG(::sre::foundation::LogLevel::Info, (cat), (msg))

#define SRE_LOG_WARN(cat, msg) \
    SRE_LOG(::sre::foundation::LogLevel::Warning, (cat), (msg))

#define SRE_LOG_ERROR(cat, msg) \
    SRE_LOG(::sre::foundation::LogLevel::Error, (cat), (msg))

/// @}
