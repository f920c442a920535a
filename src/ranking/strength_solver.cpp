/// @file strength_solver.cpp
/// @brief StrengthSolver implementation.

#include "sre/ranking/strength_solver.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "sre/foundation/engine_logger.hpp"

namespace sre::ranking {

using sre::foundation::LogCategory;

namespace {

StrengthMap neutralStrengths(const std::vector<ItemId>& items) {
    StrengthMap strengths;
    strengths.reserve(items.size());
    for (const auto& id : items) {
        strengths[id] = 0.0;
    }
    return strengths;
}

std::vector<ItemId> uniqueItems(const std::vector<ItemId>& items) {
    std::vector<ItemId> unique;
    unique.reserve(items.size());
    std::unordered_set<ItemId> seen;
    for (const auto& id : items) {
        if (seen.insert(id).second) {
            unique.push_back(id);
        }
    }
    return unique;
}

/// Seeded log-strengths are clamped to +-log(1e12).
constexpr double kMaxSeedLogStrength = 27.631021115928547;

/// Win totals and pair counts, both including the virtual wins.
struct Tallies {
    std::size_t n = 0;
    std::vector<double> wins;
    std::vector<double> pairs;  ///< n x n, row-major

    [[nodiscard]] double count(std::size_t i, std::size_t j) const {
        return pairs[i * n + j];
    }
};

double sigmoid(double x) {
    return 1.0 / (1.0 + std::exp(-x));
}

/// Shift @p theta to mean 0 (geometric mean 1 in probability space).
/// False if any value is not finite.
bool centre(std::vector<double>& theta) {
    double sum = 0.0;
    for (double v : theta) {
        if (!std::isfinite(v)) {
            return false;
        }
        sum += v;
    }
    double mean = sum / static_cast<double>(theta.size());
    for (double& v : theta) {
        v -= mean;
    }
    return true;
}

double logLikelihood(const Tallies& t, const std::vector<double>& theta) {
    double ll = 0.0;
    for (std::size_t i = 0; i < t.n; ++i) {
        ll += t.wins[i] * theta[i];
        for (std::size_t j = i + 1; j < t.n; ++j) {
            double nij = t.count(i, j);
            if (nij > 0.0) {
                double hi = std::max(theta[i], theta[j]);
                double lo = std::min(theta[i], theta[j]);
                ll -= nij * (hi + std::log1p(std::exp(lo - hi)));
            }
        }
    }
    return ll;
}

/// Newton direction for the log-likelihood: solves (L + 11^T) d = g, where
/// g is the gradient and L the (Laplacian) negative Hessian. The gradient
/// sums to zero, so d does too. False if the system is singular.
bool newtonDirection(const Tallies& t, const std::vector<double>& theta,
                     std::vector<double>& direction) {
    const std::size_t n = t.n;
    std::vector<double> a(n * n, 1.0);
    std::vector<double> g(t.wins);

    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = 0; j < n; ++j) {
            double nij = t.count(i, j);
            if (i == j || nij <= 0.0) {
                continue;
            }
            double pij = sigmoid(theta[i] - theta[j]);
            double w = nij * pij * (1.0 - pij);
            g[i] -= nij * pij;
            a[i * n + j] -= w;
            a[i * n + i] += w;
        }
    }

    // Gaussian elimination with partial pivoting.
    double scale = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        scale = std::max(scale, std::abs(a[i * n + i]));
    }
    for (std::size_t col = 0; col < n; ++col) {
        std::size_t pivot = col;
        for (std::size_t row = col + 1; row < n; ++row) {
            if (std::abs(a[row * n + col]) > std::abs(a[pivot * n + col])) {
                pivot = row;
            }
        }
        if (!(std::abs(a[pivot * n + col]) > 1e-13 * scale)) {
            return false;
        }
        if (pivot != col) {
            for (std::size_t k = 0; k < n; ++k) {
                std::swap(a[col * n + k], a[pivot * n + k]);
            }
            std::swap(g[col], g[pivot]);
        }
        for (std::size_t row = col + 1; row < n; ++row) {
            double f = a[row * n + col] / a[col * n + col];
            if (f == 0.0) {
                continue;
            }
            for (std::size_t k = col; k < n; ++k) {
                a[row * n + k] -= f * a[col * n + k];
            }
            g[row] -= f * g[col];
        }
    }

    direction.assign(n, 0.0);
    for (std::size_t i = n; i-- > 0;) {
        double v = g[i];
        for (std::size_t k = i + 1; k < n; ++k) {
            v -= a[i * n + k] * direction[k];
        }
        direction[i] = v / a[i * n + i];
        if (!std::isfinite(direction[i])) {
            return false;
        }
    }
    return true;
}

/// One minorization-maximization update, in log space.
bool mmStep(const Tallies& t, const std::vector<double>& theta,
            std::vector<double>& next) {
    next.assign(t.n, 0.0);
    for (std::size_t i = 0; i < t.n; ++i) {
        double denom = 0.0;
        for (std::size_t j = 0; j < t.n; ++j) {
            double nij = t.count(i, j);
            if (i != j && nij > 0.0) {
                denom += nij / (std::exp(theta[i]) + std::exp(theta[j]));
            }
        }
        next[i] = (denom > 0.0) ? std::log(t.wins[i] / denom) : theta[i];
    }
    return centre(next);
}

/// Damped Newton step; falls back to the MM update when no step length
/// along the Newton direction improves the likelihood.
bool ascend(const Tallies& t, const std::vector<double>& theta,
            std::vector<double>& next) {
    std::vector<double> direction;
    if (newtonDirection(t, theta, direction)) {
        double current = logLikelihood(t, theta);
        double slack = 1e-12 * (1.0 + std::abs(current));
        double step = 1.0;
        for (int halvings = 0; halvings < 30; ++halvings, step *= 0.5) {
            next = theta;
            for (std::size_t i = 0; i < t.n; ++i) {
                next[i] += step * direction[i];
            }
            if (!centre(next)) {
                continue;
            }
            double candidate = logLikelihood(t, next);
            if (std::isfinite(candidate) && candidate >= current - slack) {
                return true;
            }
        }
    }
    return mmStep(t, theta, next);
}

} // namespace

StrengthSolver::StrengthSolver(SolverConfig config)
    : config_(config) {}

SolveResult StrengthSolver::solve(const std::vector<ItemId>& rawItems,
                                  const std::vector<Outcome>& outcomes,
                                  const StrengthMap& warmStart) const {
    SolveResult result;
    auto items = uniqueItems(rawItems);
    const auto n = items.size();

    if (n == 0) {
        return result;
    }
    if (n == 1) {
        result.strengths[items.front()] = 0.0;
        result.converged = true;
        return result;
    }

    auto expanded = expandOutcomes(items, outcomes);
    result.stats = expanded.stats;
    if (expanded.stats.malformed > 0) {
        SRE_LOG_WARN(LogCategory::Solver,
                     "Dropped " + std::to_string(expanded.stats.malformed) +
                         " malformed outcome(s)");
    }
    if (expanded.records.empty()) {
        result.strengths = neutralStrengths(items);
        result.converged = true;
        return result;
    }

    try {
        const double alpha = config_.regularization;

        Tallies t;
        t.n = n;
        t.wins.assign(n, alpha * static_cast<double>(n - 1));
        t.pairs.assign(n * n, 0.0);
        for (const auto& rec : expanded.records) {
            t.wins[rec.winner] += 1.0;
            t.pairs[rec.winner * n + rec.loser] += 1.0;
            t.pairs[rec.loser * n + rec.winner] += 1.0;
        }
        for (std::size_t i = 0; i < n; ++i) {
            for (std::size_t j = 0; j < n; ++j) {
                if (i != j) {
                    t.pairs[i * n + j] += 2.0 * alpha;
                }
            }
        }

        // An item without a single (virtual) win has no finite estimate.
        bool healthy = std::all_of(t.wins.begin(), t.wins.end(),
                                   [](double w) { return w > 0.0; });

        std::vector<double> theta(n, 0.0);
        for (std::size_t i = 0; i < n; ++i) {
            auto it = warmStart.find(items[i]);
            if (it != warmStart.end() && std::isfinite(it->second)) {
                theta[i] = std::clamp(it->second, -kMaxSeedLogStrength, kMaxSeedLogStrength);
            }
        }
        healthy = healthy && centre(theta);

        std::vector<double> next;
        while (healthy && result.iterations < config_.maxIterations) {
            ++result.iterations;

            if (!ascend(t, theta, next)) {
                healthy = false;
                break;
            }

            double maxChange = 0.0;
            for (std::size_t i = 0; i < n; ++i) {
                maxChange = std::max(maxChange,
                                     std::abs(std::exp(next[i]) - std::exp(theta[i])));
            }
            theta.swap(next);

            if (!std::isfinite(maxChange)) {
                healthy = false;
                break;
            }
            if (maxChange < config_.tolerance) {
                result.converged = true;
                break;
            }
        }

        if (healthy) {
            for (std::size_t i = 0; i < n; ++i) {
                result.strengths[items[i]] = theta[i];
            }
        }

        if (!healthy) {
            SRE_LOG_WARN(LogCategory::Solver,
                         "Strength iteration produced a non-finite value after " +
                             std::to_string(result.iterations) +
                             " iteration(s); falling back to neutral strengths");
            result.strengths = neutralStrengths(items);
            result.converged = false;
            result.degraded = true;
            return result;
        }
    } catch (const std::exception& e) {
        SRE_LOG_ERROR(LogCategory::Solver,
                      std::string("Strength solve failed: ") + e.what() +
                          "; falling back to neutral strengths");
        result.strengths = neutralStrengths(items);
        result.converged = false;
        result.degraded = true;
        return result;
    }

    SRE_LOG_DEBUG(LogCategory::Solver,
                  "Solved " + std::to_string(n) + " items from " +
                      std::to_string(expanded.records.size()) + " records in " +
                      std::to_string(result.iterations) + " iteration(s)" +
                      (result.converged ? "" : " (iteration limit reached)"));
    return result;
}

} // namespace sre::ranking
