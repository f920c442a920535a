#pragma once

/// @file rank_result.hpp
/// @brief RankResult<T> type alias for engine error handling.

#include "sre/core/result.hpp"
#include "sre/foundation/rank_error.hpp"

namespace sre::foundation {

/// Result type specialized with RankError.
///
/// Store adapters, configuration and the ranking orchestrators return
/// RankResult<T> instead of throwing.
///
/// Example:
/// @code
///   RankResult<std::size_t> countOutcomes(const Scope& scope) {
///       if (!known(scope)) {
///           return RankResult<std::size_t>::err(
///               RankError(ErrorCode::ScopeNotFound, "unknown session"));
///       }
///       return RankResult<std::size_t>::ok(outcomes(scope).size());
///   }
/// @endcode
template <typename T>
using RankResult = sre::Result<T, RankError>;

}  // namespace sre::foundation
