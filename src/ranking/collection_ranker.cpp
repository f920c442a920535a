/// @file collection_ranker.cpp
/// @brief CollectionRanker implementation.

#include "sre/ranking/collection_ranker.hpp"

#include <string>

#include "ranking_pipeline.hpp"
#include "sre/foundation/engine_logger.hpp"
#include "sre/ranking/aggregation_policy.hpp"

namespace sre::ranking {

using sre::foundation::EngineLogger;
using sre::foundation::LogCategory;
using sre::foundation::LogContext;
using sre::foundation::LogLevel;
using sre::foundation::RankResult;

CollectionRanker::CollectionRanker(IRankingStore& store, RankerConfig config)
    : store_(store),
      config_(config),
      solver_(config.solver),
      scorer_(config.solver, config.convergence) {}

RankResult<RankingReport> CollectionRanker::rank(const RankingScope& scope) const {
    auto items = store_.getItems(scope);
    if (!items) {
        return RankResult<RankingReport>::err(items.error());
    }
    auto outcomes = store_.getOutcomes(scope);
    if (!outcomes) {
        return RankResult<RankingReport>::err(outcomes.error());
    }

    auto computed = detail::runPipeline(items.value(), outcomes.value(),
                                        solver_, scorer_, 0.0);

    LogContext ctx;
    ctx.scope = scope.describe();

    if (computed.stats.malformed > 0) {
        ctx.extra["malformed"] = std::to_string(computed.stats.malformed);
        EngineLogger::instance().logWithContext(
            LogLevel::Warning, LogCategory::Ranking,
            "Malformed outcomes skipped", ctx);
    }

    auto written = store_.writeStrengths(scope, computed.updates,
                                         computed.convergence.score);
    if (!written) {
        EngineLogger::instance().logWithContext(
            LogLevel::Error, LogCategory::Ranking,
            "Failed to persist ranking: " + std::string(written.error().message()), ctx);
        return RankResult<RankingReport>::err(written.error());
    }

    RankingReport report;
    report.updates = std::move(computed.updates);
    report.convergence = computed.convergence;
    report.outcomeCount = outcomes.value().size();
    report.skippedOutcomes = computed.stats.skipped;
    report.malformedOutcomes = computed.stats.malformed;
    report.iterations = computed.iterations;
    report.degraded = computed.degraded;

    ctx.extra["items"] = std::to_string(report.updates.size());
    ctx.extra["outcomes"] = std::to_string(report.outcomeCount);
    ctx.extra["convergence"] = std::to_string(report.convergence.score);
    EngineLogger::instance().logWithContext(
        LogLevel::Info, LogCategory::Ranking, "Ranking updated", ctx);

    return RankResult<RankingReport>::ok(std::move(report));
}

RankResult<std::optional<RankingReport>> CollectionRanker::rankIfDue(
    const RankingScope& scope) const {
    using ResultT = RankResult<std::optional<RankingReport>>;

    auto count = store_.getOutcomeCount(scope);
    if (!count) {
        return ResultT::err(count.error());
    }
    if (!shouldRerankSession(count.value(), config_.rerankEvery)) {
        return ResultT::ok(std::nullopt);
    }

    auto report = rank(scope);
    if (!report) {
        return ResultT::err(report.error());
    }
    return ResultT::ok(std::move(report).value());
}

} // namespace sre::ranking
