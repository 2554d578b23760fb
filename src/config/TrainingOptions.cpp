#include "pathlayer/config/TrainingOptions.h"

#include <stdexcept>
#include <string>

namespace pathlayer {

void TrainingOptions::validate() const {
    if (nbEpochs < 1) {
        throw std::invalid_argument("Training needs at least one epoch, got " + std::to_string(nbEpochs));
    }
    if (batchSize < 1) {
        throw std::invalid_argument("Batch size must be positive, got " + std::to_string(batchSize));
    }
    if (!(learningRate > 0.0)) {
        throw std::invalid_argument("Learning rate must be positive, got " + std::to_string(learningRate));
    }
    if (!(trainProportion >= 0.0 && trainProportion <= 1.0)) {
        throw std::invalid_argument("Train proportion must lie in [0, 1], got " +
                                    std::to_string(trainProportion));
    }
}

}  // namespace pathlayer
