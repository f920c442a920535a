/// @file global_aggregator.cpp
/// @brief GlobalAggregator implementation.

#include "sre/ranking/global_aggregator.hpp"

#include <string>

#include "ranking_pipeline.hpp"
#include "sre/foundation/engine_logger.hpp"
#include "sre/ranking/aggregation_policy.hpp"
#include "sre/ranking/rating_scale.hpp"

namespace sre::ranking {

using sre::foundation::EngineLogger;
using sre::foundation::LogCategory;
using sre::foundation::LogContext;
using sre::foundation::LogLevel;
using sre::foundation::RankResult;

// ============================================================================
// Impl
// ============================================================================

struct GlobalAggregator::Impl {
    IRankingStore& store;
    ILockService& locks;
    AggregatorConfig config;
    StrengthSolver solver;
    ConvergenceScorer scorer;

    Impl(IRankingStore& s, ILockService& l, AggregatorConfig cfg)
        : store(s),
          locks(l),
          config(cfg),
          solver(cfg.solver),
          scorer(cfg.solver, cfg.convergence) {}

    RankResult<AggregationReport> initialize(const RankingScope& scope,
                                             const std::vector<Item>& items) {
        AggregationReport report;
        report.status = AggregationStatus::Initialized;
        for (const auto& item : items) {
            StrengthUpdate update;
            update.id = item.id;
            update.strength = config.defaultStrength;
            update.rating = RatingScale::rating(config.defaultStrength);
            update.votesCount = 0;
            report.updates.push_back(std::move(update));
        }

        auto written = store.writeStrengths(scope, report.updates, std::nullopt);
        if (!written) {
            return RankResult<AggregationReport>::err(written.error());
        }
        auto stats = store.writeAggregationStats(scope.key(), 0, AggregationClock::now());
        if (!stats) {
            return RankResult<AggregationReport>::err(stats.error());
        }
        return RankResult<AggregationReport>::ok(std::move(report));
    }

    RankResult<AggregationReport> run(const std::string& artist) {
        auto scope = RankingScope::artist(artist);

        auto items = store.getItems(scope);
        if (!items) {
            return RankResult<AggregationReport>::err(items.error());
        }
        if (items.value().empty()) {
            AggregationReport report;
            report.status = AggregationStatus::NoItems;
            return RankResult<AggregationReport>::ok(std::move(report));
        }

        auto outcomes = store.getOutcomes(scope);
        if (!outcomes) {
            return RankResult<AggregationReport>::err(outcomes.error());
        }
        if (outcomes.value().empty()) {
            return initialize(scope, items.value());
        }

        auto computed = detail::runPipeline(items.value(), outcomes.value(),
                                            solver, scorer, config.defaultStrength);

        // Votes count every outcome that names the item, decisive or not.
        for (auto& update : computed.updates) {
            uint32_t votes = 0;
            for (const auto& outcome : outcomes.value()) {
                if (outcome.references(update.id)) {
                    ++votes;
                }
            }
            update.votesCount = votes;
        }

        auto written = store.writeStrengths(scope, computed.updates,
                                            computed.convergence.score);
        if (!written) {
            return RankResult<AggregationReport>::err(written.error());
        }
        auto stats = store.writeAggregationStats(artist, outcomes.value().size(),
                                                 AggregationClock::now());
        if (!stats) {
            return RankResult<AggregationReport>::err(stats.error());
        }

        AggregationReport report;
        report.status = AggregationStatus::Completed;
        report.updates = std::move(computed.updates);
        report.convergence = computed.convergence;
        report.outcomeCount = outcomes.value().size();
        report.degraded = computed.degraded;
        return RankResult<AggregationReport>::ok(std::move(report));
    }
};

// ============================================================================
// GlobalAggregator
// ============================================================================

GlobalAggregator::GlobalAggregator(IRankingStore& store, ILockService& locks,
                                   AggregatorConfig config)
    : impl_(std::make_unique<Impl>(store, locks, config)) {}

GlobalAggregator::~GlobalAggregator() = default;

const AggregatorConfig& GlobalAggregator::config() const noexcept {
    return impl_->config;
}

RankResult<AggregationReport> GlobalAggregator::aggregate(const std::string& artist) {
    LogContext ctx;
    ctx.artist = artist;

    auto key = globalUpdateLockKey(artist);
    if (!impl_->locks.tryAcquire(key, impl_->config.lockTtl)) {
        EngineLogger::instance().logWithContext(
            LogLevel::Debug, LogCategory::Aggregation,
            "Global update already running, skipped", ctx);
        AggregationReport report;
        report.status = AggregationStatus::SkippedLocked;
        return RankResult<AggregationReport>::ok(std::move(report));
    }

    auto result = impl_->run(artist);
    if (!result) {
        impl_->locks.release(key);
        EngineLogger::instance().logWithContext(
            LogLevel::Error, LogCategory::Aggregation,
            "Global update failed: " + std::string(result.error().message()), ctx);
        return result;
    }

    const auto& report = result.value();
    if (report.status == AggregationStatus::NoItems) {
        impl_->locks.release(key);
    }

    ctx.extra["status"] = aggregationStatusName(report.status);
    ctx.extra["items"] = std::to_string(report.updates.size());
    ctx.extra["outcomes"] = std::to_string(report.outcomeCount);
    if (report.status == AggregationStatus::Completed) {
        ctx.extra["convergence"] = std::to_string(report.convergence.score);
    }
    EngineLogger::instance().logWithContext(
        LogLevel::Info, LogCategory::Aggregation, "Global update finished", ctx);
    if (report.degraded) {
        EngineLogger::instance().logWithContext(
            LogLevel::Warning, LogCategory::Aggregation,
            "Global strengths reset to neutral after solver breakdown", ctx);
    }
    return result;
}

RankResult<std::optional<AggregationReport>> GlobalAggregator::maybeAggregate(
    const std::string& artist, AggregationClock::time_point now) {
    using ResultT = RankResult<std::optional<AggregationReport>>;

    auto stats = impl_->store.getAggregationStats(artist);
    if (!stats) {
        return ResultT::err(stats.error());
    }
    auto total = impl_->store.getOutcomeCount(RankingScope::artist(artist));
    if (!total) {
        return ResultT::err(total.error());
    }

    std::optional<AggregationClock::time_point> lastUpdated;
    std::size_t processed = 0;
    if (stats.value().has_value()) {
        lastUpdated = stats.value()->lastUpdatedAt;
        processed = stats.value()->processedOutcomes;
    }
    auto pending = pendingComparisons(total.value(), processed);

    if (!shouldTriggerGlobalUpdate(lastUpdated, pending, impl_->config.updateInterval, now)) {
        SRE_LOG_DEBUG(LogCategory::Aggregation,
                      "Global update for " + artist + " not due (" +
                          std::to_string(pending) + " pending)");
        return ResultT::ok(std::nullopt);
    }

    auto report = aggregate(artist);
    if (!report) {
        return ResultT::err(report.error());
    }
    return ResultT::ok(std::move(report).value());
}

} // namespace sre::ranking
