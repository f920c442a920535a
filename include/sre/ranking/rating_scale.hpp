#pragma once

/// @file rating_scale.hpp
/// @brief Conversion between log-strengths and Elo-like display ratings.

#include <cmath>
#include <numbers>

namespace sre::ranking {

/// Static utility mapping solver strengths onto the familiar Elo scale.
///
///   rating = K * strength + 1500,   K = 400 * log10(e)
///
/// With this K the logistic win probability in strength space,
///   P(i beats j) = e^si / (e^si + e^sj),
/// equals the Elo expected score
///   E(i) = 1 / (1 + 10^((Rj - Ri) / 400))
/// for every pair of strengths.
class RatingScale {
public:
    RatingScale() = delete;

    static constexpr double kBaseRating = 1500.0;
    static constexpr double kEloScale = 400.0;
    static constexpr double kRatingPerStrength = kEloScale * std::numbers::log10e;

    [[nodiscard]] static double rating(double strength) noexcept;

    /// Inverse of rating().
    [[nodiscard]] static double strengthFromRating(double rating) noexcept;

    /// P(i beats j) from log-strengths.
    [[nodiscard]] static double winProbability(double strengthI,
                                               double strengthJ) noexcept;

    /// Elo expected score of i against j from ratings.
    [[nodiscard]] static double expectedScore(double ratingI,
                                              double ratingJ) noexcept;
};

} // namespace sre::ranking
