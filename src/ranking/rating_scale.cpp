/// @file rating_scale.cpp
/// @brief RatingScale implementation.

#include "sre/ranking/rating_scale.hpp"

namespace sre::ranking {

double RatingScale::rating(double strength) noexcept {
    return kRatingPerStrength * strength + kBaseRating;
}

double RatingScale::strengthFromRating(double rating) noexcept {
    return (rating - kBaseRating) / kRatingPerStrength;
}

double RatingScale::winProbability(double strengthI, double strengthJ) noexcept {
    // Written as a logistic of the difference to stay finite for large
    // strengths.
    return 1.0 / (1.0 + std::exp(strengthJ - strengthI));
}

double RatingScale::expectedScore(double ratingI, double ratingJ) noexcept {
    double exponent = (ratingJ - ratingI) / kEloScale;
    return 1.0 / (1.0 + std::pow(10.0, exponent));
}

} // namespace sre::ranking
