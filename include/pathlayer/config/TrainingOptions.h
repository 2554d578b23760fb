#pragma once

#include <cstdint>
#include <optional>

namespace pathlayer {

/// Settings of the gradient descent loop
struct TrainingOptions {
    int nbEpochs = 10;
    int batchSize = 5;

    /// Adam step size
    double learningRate = 1e-3;

    /// Share of the dataset used for training by trainTestSplit
    double trainProportion = 0.8;

    /// Seed of the engine driving the perturbed losses during training
    std::optional<uint64_t> seed;

    /// @throws std::invalid_argument on non-positive epochs, batch size or
    ///         learning rate, or a proportion outside [0, 1]
    void validate() const;
};

}  // namespace pathlayer
