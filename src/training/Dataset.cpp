#include "pathlayer/training/Dataset.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace pathlayer {

std::pair<Dataset, Dataset> trainTestSplit(const Dataset& data, double trainProportion) {
    if (!(trainProportion >= 0.0 && trainProportion <= 1.0)) {
        throw std::invalid_argument("Train proportion must lie in [0, 1], got " +
                                    std::to_string(trainProportion));
    }

    const auto nTrain = static_cast<size_t>(std::floor(static_cast<double>(data.size()) * trainProportion));
    Dataset train(data.begin(), data.begin() + static_cast<std::ptrdiff_t>(nTrain));
    Dataset test(data.begin() + static_cast<std::ptrdiff_t>(nTrain), data.end());
    return {std::move(train), std::move(test)};
}

std::vector<Dataset> makeBatches(const Dataset& data, size_t batchSize) {
    if (batchSize == 0) {
        throw std::invalid_argument("Batch size must be positive");
    }

    std::vector<Dataset> batches;
    for (size_t start = 0; start < data.size(); start += batchSize) {
        size_t end = std::min(start + batchSize, data.size());
        batches.emplace_back(data.begin() + static_cast<std::ptrdiff_t>(start),
                             data.begin() + static_cast<std::ptrdiff_t>(end));
    }
    return batches;
}

}  // namespace pathlayer
