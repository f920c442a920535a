#pragma once

/// @file engine_config.hpp
/// @brief Engine settings assembled from a ConfigManager.
///
/// Recognized keys (all optional):
///
/// | Key                                     | Default |
/// |-----------------------------------------|---------|
/// | ranking.solver.regularization           | 0.01    |
/// | ranking.solver.max_iterations           | 100     |
/// | ranking.solver.tolerance                | 1e-8    |
/// | ranking.convergence.lookback            | 5       |
/// | ranking.convergence.top_n               | 10      |
/// | ranking.global.update_interval_seconds  | 120     |
/// | ranking.global.lock_ttl_seconds         | 120     |
/// | ranking.global.default_strength         | 0.0     |
/// | ranking.session.rerank_every            | 5       |

#include <cstdint>

#include "sre/foundation/config_manager.hpp"
#include "sre/foundation/rank_result.hpp"
#include "sre/ranking/collection_ranker.hpp"
#include "sre/ranking/convergence_scorer.hpp"
#include "sre/ranking/global_aggregator.hpp"
#include "sre/ranking/strength_solver.hpp"

namespace sre::ranking {

struct SessionConfig {
    uint32_t rerankEvery = 5;
};

struct EngineConfig {
    SolverConfig solver;
    ConvergenceConfig convergence;
    /// Interval, lock TTL and default strength; its solver and
    /// convergence members are overwritten by aggregatorConfig().
    AggregatorConfig global;
    SessionConfig session;

    [[nodiscard]] RankerConfig rankerConfig() const;
    [[nodiscard]] AggregatorConfig aggregatorConfig() const;
};

/// Build an EngineConfig from @p config.
///
/// Missing keys keep their defaults. A key of the wrong type yields
/// ConfigTypeMismatch; an out-of-range value yields InvalidConfig.
[[nodiscard]] foundation::RankResult<EngineConfig> buildEngineConfig(
    const foundation::ConfigManager& config);

} // namespace sre::ranking
