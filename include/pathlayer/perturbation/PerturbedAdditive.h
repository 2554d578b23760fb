#pragma once

#include "ProbabilityDistribution.h"
#include "pathlayer/config/PerturbationConfig.h"
#include "pathlayer/core/Random.h"
#include "pathlayer/solvers/Maximizers.h"

#include <vector>

namespace pathlayer {

/// Noise draws and oracle outputs of one perturbed call.
///
/// Keeping them together lets the forward value, the distribution and the
/// backward rules of a single step all see the same draws.
struct PerturbedSamples {
    double epsilon = 0.0;
    CostMatrix theta;
    std::vector<CostMatrix> noise;       ///< Z_i (all zero when epsilon == 0)
    std::vector<PathMatrix> solutions;   ///< Y_i = maximizer(theta + epsilon * Z_i)

    size_t size() const { return solutions.size(); }

    /// (1/M) sum_i Y_i
    PathMatrix average() const;

    /// (1/M) sum_i <theta + epsilon * Z_i, Y_i>, the Monte Carlo estimate of
    /// the perturbed value function F(theta)
    double averageObjective() const;
};

/// Additive perturbation wrapper around a combinatorial maximizer.
///
/// Turns the piecewise-constant oracle into a smooth map by averaging it over
/// Gaussian perturbations of its input:
///
///     y_hat(theta) = E[ maximizer(theta + epsilon * Z) ],  Z ~ N(0, I)
///
/// estimated with M Monte Carlo samples. The result lies in the convex hull of
/// feasible paths. The random engine is supplied by the caller on every call;
/// the same engine state always yields the same draws, whatever numThreads is.
///
/// Usage:
/// @code
/// PerturbedAdditive layer(dijkstraMaximizer, PerturbationConfig::imitation().withSeed(0));
/// RandomEngine rng = layer.makeEngine();
/// PathMatrix soft = layer(theta, {}, rng);
/// @endcode
class PerturbedAdditive {
public:
    /// @throws std::invalid_argument if the maximizer is empty or the
    ///         configuration is invalid
    PerturbedAdditive(Maximizer maximizer, PerturbationConfig config);

    const PerturbationConfig& config() const { return config_; }
    const Maximizer& maximizer() const { return maximizer_; }

    /// Engine seeded from config().seed
    RandomEngine makeEngine() const { return makeRandomEngine(config_.seed); }

    /// Draw M noise matrices from rng and run the oracle on each perturbed input
    /// @throws std::invalid_argument if theta is empty
    PerturbedSamples sample(const CostMatrix& theta, const MaximizerContext& context,
                            RandomEngine& rng) const;

    /// Point estimate: the Monte Carlo average of the perturbed solutions
    PathMatrix operator()(const CostMatrix& theta, const MaximizerContext& context,
                          RandomEngine& rng) const;

    /// Empirical distribution of the perturbed solutions, one atom per draw
    /// with weight 1/M (not compressed)
    FixedAtomsProbabilityDistribution distribution(const CostMatrix& theta,
                                                   const MaximizerContext& context,
                                                   RandomEngine& rng) const;

    /// Vector-Jacobian product of the point estimate for fixed draws:
    ///
    ///     dtheta = (1 / (M * epsilon)) * sum_i <Y_i, dY> Z_i
    ///
    /// Zero when epsilon == 0, where the layer is the raw oracle and its true
    /// gradient vanishes almost everywhere.
    /// @throws std::invalid_argument if dY does not match the sample shape
    static CostMatrix pullback(const PerturbedSamples& samples, const PathMatrix& dY);

private:
    Maximizer maximizer_;
    PerturbationConfig config_;
};

}  // namespace pathlayer
