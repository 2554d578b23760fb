#pragma once

#include "Types.h"

#include <cstdint>
#include <optional>
#include <random>

namespace pathlayer {

/// Random engine threaded explicitly through every stochastic call.
/// There is no process-wide seed: callers own their engines.
using RandomEngine = std::mt19937_64;

/// Engine seeded with `seed`, or from std::random_device when absent
inline RandomEngine makeRandomEngine(std::optional<uint64_t> seed) {
    if (seed) {
        return RandomEngine(*seed);
    }
    std::random_device device;
    return RandomEngine((static_cast<uint64_t>(device()) << 32) ^ device());
}

/// Matrix of i.i.d. standard normal entries, filled in storage order
inline Eigen::MatrixXd standardNormalMatrix(Eigen::Index rows, Eigen::Index cols, RandomEngine& rng) {
    std::normal_distribution<double> normal(0.0, 1.0);
    Eigen::MatrixXd z(rows, cols);
    double* data = z.data();
    for (Eigen::Index i = 0; i < z.size(); ++i) {
        data[i] = normal(rng);
    }
    return z;
}

}  // namespace pathlayer
