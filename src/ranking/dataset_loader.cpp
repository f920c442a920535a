/// @file dataset_loader.cpp
/// @brief YAML dataset parsing for the in-memory store.

#include "sre/ranking/dataset_loader.hpp"

#include <algorithm>
#include <optional>
#include <utility>

#include <yaml-cpp/yaml.h>

#include "sre/foundation/engine_logger.hpp"

namespace sre::ranking {

using sre::foundation::ErrorCode;
using sre::foundation::LogCategory;
using sre::foundation::RankError;
using sre::foundation::RankResult;

namespace {

struct ParsedItem {
    ItemId id;
    std::optional<double> strength;
};

struct ParsedSession {
    std::string id;
    std::string artist;
    std::vector<ParsedItem> items;
    std::vector<Outcome> outcomes;
};

RankError invalid(const std::string& where, const std::string& what) {
    return RankError(ErrorCode::DatasetInvalid, where + ": " + what, where);
}

/// Read an optional scalar field of type T.
template <typename T>
RankResult<std::optional<T>> optionalField(const YAML::Node& node,
                                           const char* name,
                                           const std::string& where) {
    auto field = node[name];
    if (!field || field.IsNull()) {
        return RankResult<std::optional<T>>::ok(std::nullopt);
    }
    if (!field.IsScalar()) {
        return RankResult<std::optional<T>>::err(
            invalid(where + "." + name, "expected a scalar"));
    }
    try {
        return RankResult<std::optional<T>>::ok(field.as<T>());
    } catch (const YAML::BadConversion&) {
        return RankResult<std::optional<T>>::err(
            invalid(where + "." + name, "has the wrong type"));
    }
}

RankResult<ParsedItem> parseItem(const YAML::Node& node, const std::string& where) {
    ParsedItem item;
    if (node.IsScalar()) {
        item.id = node.as<std::string>();
        return RankResult<ParsedItem>::ok(std::move(item));
    }
    if (!node.IsMap()) {
        return RankResult<ParsedItem>::err(invalid(where, "expected an id or a map"));
    }

    auto id = optionalField<std::string>(node, "id", where);
    if (!id) {
        return RankResult<ParsedItem>::err(id.error());
    }
    if (!id.value().has_value() || id.value()->empty()) {
        return RankResult<ParsedItem>::err(invalid(where, "missing id"));
    }
    auto strength = optionalField<double>(node, "strength", where);
    if (!strength) {
        return RankResult<ParsedItem>::err(strength.error());
    }

    item.id = *id.value();
    item.strength = strength.value();
    return RankResult<ParsedItem>::ok(std::move(item));
}

RankResult<Outcome> parseOutcome(const YAML::Node& node, const std::string& where) {
    if (!node.IsMap()) {
        return RankResult<Outcome>::err(invalid(where, "expected a map"));
    }

    auto a = optionalField<std::string>(node, "a", where);
    if (!a) {
        return RankResult<Outcome>::err(a.error());
    }
    auto b = optionalField<std::string>(node, "b", where);
    if (!b) {
        return RankResult<Outcome>::err(b.error());
    }
    if (!a.value().has_value() || !b.value().has_value()) {
        return RankResult<Outcome>::err(invalid(where, "needs both 'a' and 'b'"));
    }

    auto winner = optionalField<std::string>(node, "winner", where);
    if (!winner) {
        return RankResult<Outcome>::err(winner.error());
    }
    auto tie = optionalField<bool>(node, "tie", where);
    if (!tie) {
        return RankResult<Outcome>::err(tie.error());
    }
    auto latency = optionalField<int64_t>(node, "latency_ms", where);
    if (!latency) {
        return RankResult<Outcome>::err(latency.error());
    }

    Outcome outcome;
    outcome.itemA = *a.value();
    outcome.itemB = *b.value();
    outcome.winner = winner.value();
    outcome.isTie = tie.value().value_or(false);
    outcome.decisionLatencyMs = latency.value();
    return RankResult<Outcome>::ok(std::move(outcome));
}

RankResult<ParsedSession> parseSession(const YAML::Node& node,
                                       const std::string& where,
                                       std::size_t index) {
    if (!node.IsMap()) {
        return RankResult<ParsedSession>::err(invalid(where, "expected a map"));
    }

    ParsedSession session;

    auto id = optionalField<std::string>(node, "session", where);
    if (!id) {
        return RankResult<ParsedSession>::err(id.error());
    }
    auto altId = optionalField<std::string>(node, "id", where);
    if (!altId) {
        return RankResult<ParsedSession>::err(altId.error());
    }
    session.id = id.value().value_or(
        altId.value().value_or("session-" + std::to_string(index + 1)));

    auto artist = optionalField<std::string>(node, "artist", where);
    if (!artist) {
        return RankResult<ParsedSession>::err(artist.error());
    }
    session.artist = artist.value().value_or("unknown");

    auto items = node["items"];
    if (items && !items.IsNull()) {
        if (!items.IsSequence()) {
            return RankResult<ParsedSession>::err(invalid(where + ".items", "expected a list"));
        }
        for (std::size_t i = 0; i < items.size(); ++i) {
            auto item = parseItem(items[i], where + ".items[" + std::to_string(i) + "]");
            if (!item) {
                return RankResult<ParsedSession>::err(item.error());
            }
            session.items.push_back(std::move(item).value());
        }
    }

    auto outcomes = node["outcomes"];
    if (outcomes && !outcomes.IsNull()) {
        if (!outcomes.IsSequence()) {
            return RankResult<ParsedSession>::err(
                invalid(where + ".outcomes", "expected a list"));
        }
        for (std::size_t i = 0; i < outcomes.size(); ++i) {
            auto outcome = parseOutcome(outcomes[i],
                                        where + ".outcomes[" + std::to_string(i) + "]");
            if (!outcome) {
                return RankResult<ParsedSession>::err(outcome.error());
            }
            session.outcomes.push_back(std::move(outcome).value());
        }
    }

    return RankResult<ParsedSession>::ok(std::move(session));
}

RankResult<DatasetSummary> apply(const YAML::Node& root, InMemoryRankingStore& store) {
    if (!root.IsMap()) {
        return RankResult<DatasetSummary>::err(invalid("dataset", "expected a map"));
    }

    // Parse everything first so a bad document leaves the store untouched.
    std::vector<ParsedSession> sessions;
    auto list = root["sessions"];
    if (list) {
        if (!list.IsSequence()) {
            return RankResult<DatasetSummary>::err(invalid("sessions", "expected a list"));
        }
        for (std::size_t i = 0; i < list.size(); ++i) {
            auto parsed = parseSession(list[i], "sessions[" + std::to_string(i) + "]", i);
            if (!parsed) {
                return RankResult<DatasetSummary>::err(parsed.error());
            }
            sessions.push_back(std::move(parsed).value());
        }
    } else {
        auto parsed = parseSession(root, "dataset", 0);
        if (!parsed) {
            return RankResult<DatasetSummary>::err(parsed.error());
        }
        sessions.push_back(std::move(parsed).value());
    }

    DatasetSummary summary;
    for (auto& session : sessions) {
        store.createSession(session.id, session.artist);
        summary.sessionIds.push_back(session.id);
        if (std::find(summary.artists.begin(), summary.artists.end(), session.artist) ==
            summary.artists.end()) {
            summary.artists.push_back(session.artist);
        }

        for (auto& item : session.items) {
            auto added = store.addItem(session.id, item.id, item.strength);
            if (!added) {
                return RankResult<DatasetSummary>::err(added.error());
            }
            ++summary.itemCount;
        }
        for (auto& outcome : session.outcomes) {
            auto added = store.addOutcome(session.id, std::move(outcome));
            if (!added) {
                return RankResult<DatasetSummary>::err(added.error());
            }
            ++summary.outcomeCount;
        }
    }

    SRE_LOG_DEBUG(LogCategory::Storage,
                  "Dataset loaded: " + std::to_string(summary.sessionIds.size()) +
                      " sessions, " + std::to_string(summary.itemCount) + " items, " +
                      std::to_string(summary.outcomeCount) + " outcomes");
    return RankResult<DatasetSummary>::ok(std::move(summary));
}

} // namespace

RankResult<DatasetSummary> loadDataset(const std::filesystem::path& path,
                                       InMemoryRankingStore& store) {
    try {
        return apply(YAML::LoadFile(path.string()), store);
    } catch (const YAML::BadFile&) {
        return RankResult<DatasetSummary>::err(
            RankError(ErrorCode::DatasetLoadFailed,
                      "failed to open dataset: " + path.string(), path.string()));
    } catch (const YAML::ParserException& e) {
        return RankResult<DatasetSummary>::err(
            RankError(ErrorCode::DatasetLoadFailed,
                      std::string("dataset parse error: ") + e.what(), path.string()));
    }
}

RankResult<DatasetSummary> loadDatasetString(std::string_view yaml,
                                             InMemoryRankingStore& store) {
    try {
        return apply(YAML::Load(std::string(yaml)), store);
    } catch (const YAML::ParserException& e) {
        return RankResult<DatasetSummary>::err(
            RankError(ErrorCode::DatasetLoadFailed,
                      std::string("dataset parse error: ") + e.what()));
    }
}

} // namespace sre::ranking
