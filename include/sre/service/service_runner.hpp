#pragma once

/// @file service_runner.hpp
/// @brief Shared utilities for engine entry points.
///
/// Configuration loading and CLI argument parsing for the sre tools.

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "sre/foundation/config_manager.hpp"
#include "sre/foundation/rank_result.hpp"

namespace sre::service {

/// Load a YAML configuration file into the provided ConfigManager.
///
/// The config file path is resolved in order:
///   1. SRE_CONFIG_PATH environment variable (if set)
///   2. @p defaultPath parameter
///
/// When neither names a file the manager is left empty and every engine
/// setting keeps its default.
///
/// @param config      ConfigManager to populate.
/// @param defaultPath Fallback config file path (may be empty).
/// @return Success or ConfigLoadFailed error.
[[nodiscard]] sre::foundation::RankResult<void>
loadConfig(sre::foundation::ConfigManager& config,
           const std::filesystem::path& defaultPath);

/// Value following @p flag (e.g. `--dataset <path>`), if present.
[[nodiscard]] std::optional<std::string>
parseArg(int argc, char* argv[], std::string_view flag);

/// Whether the bare switch @p flag appears on the command line.
[[nodiscard]] bool hasFlag(int argc, char* argv[], std::string_view flag);

/// Parse `--config <path>` from command-line arguments.
///
/// @return Config file path, or empty path if not specified.
[[nodiscard]] std::filesystem::path
parseConfigArg(int argc, char* argv[]);

} // namespace sre::service
