#include "pathlayer/config/PerturbationConfig.h"

#include <cmath>
#include <stdexcept>
#include <string>

namespace pathlayer {

PerturbationConfig PerturbationConfig::imitation() {
    PerturbationConfig config;
    config.epsilon = 0.1;
    config.nbSamples = 10;
    return config;
}

void PerturbationConfig::validate() const {
    if (std::isnan(epsilon) || epsilon < 0.0) {
        throw std::invalid_argument("Perturbation epsilon must be >= 0, got " + std::to_string(epsilon));
    }
    if (nbSamples < 1) {
        throw std::invalid_argument("Perturbation needs at least one sample, got " + std::to_string(nbSamples));
    }
    if (numThreads < 0) {
        throw std::invalid_argument("Thread count must be >= 0, got " + std::to_string(numThreads));
    }
}

}  // namespace pathlayer
