#pragma once

#include "pathlayer/core/Types.h"

#include <utility>
#include <vector>

namespace pathlayer {

/// Input of the cost embedding: feature channels at grid resolution
using Features = std::vector<Eigen::MatrixXd>;

/// One labelled instance
struct DataPoint {
    Features features;     ///< Embedding input (image channels)
    CostMatrix trueCosts;  ///< Ground-truth cell costs (positive = expensive)
    PathMatrix truePath;   ///< Optimal path under trueCosts (imitation target)
};

using Dataset = std::vector<DataPoint>;

/// Split in order: the first floor(N * trainProportion) points train, the rest test
/// @throws std::invalid_argument if trainProportion is outside [0, 1]
std::pair<Dataset, Dataset> trainTestSplit(const Dataset& data, double trainProportion = 0.5);

/// Consecutive minibatches; the last one may be smaller
/// @throws std::invalid_argument if batchSize is 0
std::vector<Dataset> makeBatches(const Dataset& data, size_t batchSize);

}  // namespace pathlayer
