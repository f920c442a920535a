/// @file service_runner.cpp
/// @brief Implementation of shared entry-point utilities.

#include "sre/service/service_runner.hpp"

#include <cstdlib>

namespace sre::service {

// -- Config loading ----------------------------------------------------------

sre::foundation::RankResult<void>
loadConfig(sre::foundation::ConfigManager& config,
           const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;

    const char* envPath = std::getenv("SRE_CONFIG_PATH");
    if (envPath != nullptr && *envPath != '\0') {
        configPath = envPath;
    }

    if (configPath.empty()) {
        return sre::foundation::RankResult<void>::ok();
    }
    return config.load(configPath);
}

// -- CLI argument parsing ----------------------------------------------------

std::optional<std::string> parseArg(int argc, char* argv[], std::string_view flag) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == flag) {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return std::string(argv[i + 1]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return std::nullopt;
}

bool hasFlag(int argc, char* argv[], std::string_view flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view(argv[i]) == flag) {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return true;
        }
    }
    return false;
}

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    auto value = parseArg(argc, argv, "--config");
    if (!value) {
        return {};
    }
    return *value;
}

} // namespace sre::service
