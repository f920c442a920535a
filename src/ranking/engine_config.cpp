/// @file engine_config.cpp
/// @brief buildEngineConfig implementation.

#include "sre/ranking/engine_config.hpp"

#include <chrono>
#include <cmath>
#include <string>
#include <string_view>

namespace sre::ranking {

using sre::foundation::ConfigManager;
using sre::foundation::ErrorCode;
using sre::foundation::RankError;
using sre::foundation::RankResult;

namespace {

/// Copy @p key into @p out when present. Missing keys are not an error.
template <typename T>
RankResult<void> readOptional(const ConfigManager& config, std::string_view key, T& out) {
    if (!config.hasKey(key)) {
        return RankResult<void>::ok();
    }
    auto value = config.get<T>(key);
    if (!value) {
        return RankResult<void>::err(value.error());
    }
    out = value.value();
    return RankResult<void>::ok();
}

RankResult<void> invalid(std::string_view key, const std::string& reason) {
    return RankResult<void>::err(
        RankError(ErrorCode::InvalidConfig,
                  std::string(key) + ": " + reason, std::string(key)));
}

RankResult<void> validate(const EngineConfig& cfg) {
    if (!std::isfinite(cfg.solver.regularization) || cfg.solver.regularization < 0.0) {
        return invalid("ranking.solver.regularization", "must be >= 0");
    }
    if (cfg.solver.maxIterations == 0) {
        return invalid("ranking.solver.max_iterations", "must be > 0");
    }
    if (!(cfg.solver.tolerance > 0.0)) {
        return invalid("ranking.solver.tolerance", "must be > 0");
    }
    if (cfg.convergence.topN == 0) {
        return invalid("ranking.convergence.top_n", "must be > 0");
    }
    if (!std::isfinite(cfg.global.defaultStrength)) {
        return invalid("ranking.global.default_strength", "must be finite");
    }
    return RankResult<void>::ok();
}

} // namespace

RankerConfig EngineConfig::rankerConfig() const {
    RankerConfig cfg;
    cfg.solver = solver;
    cfg.convergence = convergence;
    cfg.rerankEvery = session.rerankEvery;
    return cfg;
}

AggregatorConfig EngineConfig::aggregatorConfig() const {
    AggregatorConfig cfg = global;
    cfg.solver = solver;
    cfg.convergence = convergence;
    return cfg;
}

RankResult<EngineConfig> buildEngineConfig(const ConfigManager& config) {
    EngineConfig cfg;

    int64_t updateIntervalSeconds = cfg.global.updateInterval.count();
    int64_t lockTtlSeconds =
        std::chrono::duration_cast<std::chrono::seconds>(cfg.global.lockTtl).count();

    for (auto read : {
             readOptional(config, "ranking.solver.regularization", cfg.solver.regularization),
             readOptional(config, "ranking.solver.max_iterations", cfg.solver.maxIterations),
             readOptional(config, "ranking.solver.tolerance", cfg.solver.tolerance),
             readOptional(config, "ranking.convergence.lookback", cfg.convergence.lookback),
             readOptional(config, "ranking.convergence.top_n", cfg.convergence.topN),
             readOptional(config, "ranking.global.update_interval_seconds",
                          updateIntervalSeconds),
             readOptional(config, "ranking.global.lock_ttl_seconds", lockTtlSeconds),
             readOptional(config, "ranking.global.default_strength",
                          cfg.global.defaultStrength),
             readOptional(config, "ranking.session.rerank_every", cfg.session.rerankEvery),
         }) {
        if (!read) {
            return RankResult<EngineConfig>::err(read.error());
        }
    }

    if (updateIntervalSeconds < 0) {
        return RankResult<EngineConfig>::err(
            invalid("ranking.global.update_interval_seconds", "must be >= 0").error());
    }
    if (lockTtlSeconds <= 0) {
        return RankResult<EngineConfig>::err(
            invalid("ranking.global.lock_ttl_seconds", "must be > 0").error());
    }
    cfg.global.updateInterval = std::chrono::seconds(updateIntervalSeconds);
    cfg.global.lockTtl = std::chrono::seconds(lockTtlSeconds);

    auto valid = validate(cfg);
    if (!valid) {
        return RankResult<EngineConfig>::err(valid.error());
    }
    return RankResult<EngineConfig>::ok(cfg);
}

} // namespace sre::ranking
