#pragma once

#include <cstdint>
#include <optional>

namespace pathlayer {

/// Hyperparameters of the additive perturbation wrapper
///
/// Usage:
/// @code
/// auto config = PerturbationConfig::imitation().withSeed(0);
/// PerturbedAdditive layer(dijkstraMaximizer, config);
/// @endcode
struct PerturbationConfig {
    /// Perturbation scale. 0 disables smoothing and the layer reduces to the
    /// raw oracle.
    double epsilon = 1.0;

    /// Monte Carlo samples per call
    int nbSamples = 1;

    /// Seed for engines created through PerturbedAdditive::makeEngine()
    /// (nullopt = nondeterministic)
    std::optional<uint64_t> seed;

    /// Oracle calls are spread over this many threads (<= 1 = sequential)
    int numThreads = 1;

    /// Settings of the imitation learning pipeline (eps = 0.1, M = 10)
    static PerturbationConfig imitation();

    /// @throws std::invalid_argument if epsilon < 0 (or NaN), nbSamples < 1
    ///         or numThreads < 0
    void validate() const;

    PerturbationConfig& withEpsilon(double value) {
        epsilon = value;
        return *this;
    }

    PerturbationConfig& withSamples(int value) {
        nbSamples = value;
        return *this;
    }

    PerturbationConfig& withSeed(uint64_t value) {
        seed = value;
        return *this;
    }

    PerturbationConfig& withThreads(int value) {
        numThreads = value;
        return *this;
    }
};

}  // namespace pathlayer
