/// @file main.cpp
/// @brief sre_rank: offline ranking of a YAML dataset.
///
/// Loads a dataset into an in-memory store, ranks each session (or the
/// artist-wide collection with --artist) and prints the leaderboard with
/// the convergence breakdown.

#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "sre/foundation/config_manager.hpp"
#include "sre/foundation/engine_logger.hpp"
#include "sre/ranking/collection_ranker.hpp"
#include "sre/ranking/convergence_scorer.hpp"
#include "sre/ranking/dataset_loader.hpp"
#include "sre/ranking/engine_config.hpp"
#include "sre/ranking/global_aggregator.hpp"
#include "sre/ranking/lock_service.hpp"
#include "sre/ranking/ranking_store.hpp"
#include "sre/service/service_runner.hpp"
#include "sre/version.hpp"

namespace {

void printUsage() {
    std::cout << "usage: sre_rank --dataset <file.yaml> [--config <file.yaml>]\n"
                 "                [--session <id>] [--artist <name>] [--limit <n>]\n"
                 "                [--verbose] [--version]\n";
}

void printConvergence(const sre::ranking::ConvergenceResult& c,
                      std::size_t outcomes, std::size_t items) {
    std::cout << "  convergence: " << c.score << "/100"
              << std::fixed << std::setprecision(3)
              << "  (coverage " << c.coverage
              << ", separation " << c.separation
              << ", stability " << c.stability << ")\n"
              << "  progress:    " << std::setprecision(1)
              << sre::ranking::ConvergenceScorer::progress(outcomes, items) * 100.0
              << "% of " << outcomes << " duels over " << items << " items\n";
}

void printLeaderboard(const std::vector<sre::ranking::StrengthUpdate>& updates,
                      std::size_t limit, bool withVotes) {
    auto board = sre::ranking::buildLeaderboard(updates, limit);
    std::cout << "  " << std::left << std::setw(5) << "rank" << std::setw(24) << "item"
              << std::right << std::setw(10) << "strength" << std::setw(10) << "rating";
    if (withVotes) {
        std::cout << std::setw(8) << "votes";
    }
    std::cout << "\n";

    for (const auto& entry : board) {
        std::cout << "  " << std::left << std::setw(5) << entry.rank << std::setw(24)
                  << entry.id << std::right << std::fixed << std::setprecision(4)
                  << std::setw(10) << entry.strength << std::setprecision(1)
                  << std::setw(10) << entry.rating;
        if (withVotes) {
            std::cout << std::setw(8) << entry.votesCount;
        }
        std::cout << "\n";
    }
}

int rankSession(sre::ranking::InMemoryRankingStore& store,
                const sre::ranking::EngineConfig& engine,
                const std::string& sessionId, std::size_t limit) {
    sre::ranking::CollectionRanker ranker(store, engine.rankerConfig());
    auto report = ranker.rank(sre::ranking::RankingScope::session(sessionId));
    if (!report) {
        std::cerr << "Ranking session " << sessionId << " failed: "
                  << report.error().message() << "\n";
        return EXIT_FAILURE;
    }

    const auto& r = report.value();
    std::cout << "session " << sessionId << "\n";
    printConvergence(r.convergence, r.outcomeCount, r.updates.size());
    std::cout << "  solver:      " << r.iterations << " iterations"
              << (r.degraded ? " (degraded)" : "") << ", "
              << r.skippedOutcomes << " skipped, "
              << r.malformedOutcomes << " malformed\n";
    printLeaderboard(r.updates, limit, false);
    return EXIT_SUCCESS;
}

int rankArtist(sre::ranking::InMemoryRankingStore& store,
               const sre::ranking::EngineConfig& engine,
               const std::string& artist, std::size_t limit) {
    sre::ranking::InMemoryLockService locks;
    sre::ranking::GlobalAggregator aggregator(store, locks, engine.aggregatorConfig());

    auto report = aggregator.aggregate(artist);
    if (!report) {
        std::cerr << "Global ranking for " << artist << " failed: "
                  << report.error().message() << "\n";
        return EXIT_FAILURE;
    }

    const auto& r = report.value();
    std::cout << "artist " << artist << " ("
              << sre::ranking::aggregationStatusName(r.status) << ")\n";
    if (r.status == sre::ranking::AggregationStatus::NoItems) {
        return EXIT_SUCCESS;
    }
    printConvergence(r.convergence, r.outcomeCount, r.updates.size());
    printLeaderboard(r.updates, limit, true);
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char* argv[]) {
    if (sre::service::hasFlag(argc, argv, "--version")) {
        std::cout << "sre_rank " << sre::Version::string << "\n";
        return EXIT_SUCCESS;
    }
    if (sre::service::hasFlag(argc, argv, "--help")) {
        printUsage();
        return EXIT_SUCCESS;
    }

    auto datasetPath = sre::service::parseArg(argc, argv, "--dataset");
    if (!datasetPath) {
        printUsage();
        return EXIT_FAILURE;
    }

    sre::foundation::ConfigManager config;
    auto loadResult = sre::service::loadConfig(config, sre::service::parseConfigArg(argc, argv));
    if (!loadResult) {
        std::cerr << "Failed to load config: "
                  << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto engine = sre::ranking::buildEngineConfig(config);
    if (!engine) {
        std::cerr << "Invalid config: " << engine.error().message() << "\n";
        return EXIT_FAILURE;
    }

    if (sre::service::hasFlag(argc, argv, "--verbose")) {
        auto& logger = sre::foundation::EngineLogger::instance();
        for (std::size_t i = 0; i < sre::foundation::kLogCategoryCount; ++i) {
            logger.setCategoryLevel(static_cast<sre::foundation::LogCategory>(i),
                                    sre::foundation::LogLevel::Debug);
        }
    }

    std::size_t limit = 0;
    if (auto limitArg = sre::service::parseArg(argc, argv, "--limit")) {
        try {
            limit = std::stoul(*limitArg);
        } catch (const std::exception&) {
            std::cerr << "Invalid --limit: " << *limitArg << "\n";
            return EXIT_FAILURE;
        }
    }

    sre::ranking::InMemoryRankingStore store;
    auto dataset = sre::ranking::loadDataset(*datasetPath, store);
    if (!dataset) {
        std::cerr << "Failed to load dataset: " << dataset.error().message() << "\n";
        return EXIT_FAILURE;
    }

    if (auto artist = sre::service::parseArg(argc, argv, "--artist")) {
        return rankArtist(store, engine.value(), *artist, limit);
    }

    if (auto session = sre::service::parseArg(argc, argv, "--session")) {
        return rankSession(store, engine.value(), *session, limit);
    }

    int status = EXIT_SUCCESS;
    for (const auto& sessionId : dataset.value().sessionIds) {
        if (rankSession(store, engine.value(), sessionId, limit) != EXIT_SUCCESS) {
            status = EXIT_FAILURE;
        }
    }
    return status;
}
