#include "SyntheticDataset.h"

#include <cmath>

namespace pathlayer::test {

CostMatrix syntheticCosts(const Features& features, const SyntheticGenerator& generator) {
    Eigen::MatrixXd z = Eigen::MatrixXd::Constant(generator.height, generator.width, generator.bias);
    for (size_t c = 0; c < generator.weights.size(); ++c) {
        z += generator.weights[c] * features[c];
    }
    return z.unaryExpr([](double v) {
        return v > 0.0 ? v + std::log1p(std::exp(-v)) : std::log1p(std::exp(v));
    });
}

Dataset makeSyntheticDataset(size_t n, const SyntheticGenerator& generator, RandomEngine& rng) {
    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    MaximizerContext context;
    context.connectivity = generator.connectivity;

    Dataset data;
    data.reserve(n);
    for (size_t k = 0; k < n; ++k) {
        DataPoint point;
        for (size_t c = 0; c < generator.weights.size(); ++c) {
            Eigen::MatrixXd channel(generator.height, generator.width);
            for (Eigen::Index i = 0; i < channel.size(); ++i) {
                channel.data()[i] = uniform(rng);
            }
            point.features.push_back(std::move(channel));
        }
        point.trueCosts = syntheticCosts(point.features, generator);
        point.truePath = dijkstraMaximizer(-point.trueCosts, context);
        data.push_back(std::move(point));
    }
    return data;
}

CostMatrix randomCosts(int height, int width, RandomEngine& rng, double low, double high) {
    std::uniform_real_distribution<double> uniform(low, high);
    CostMatrix costs(height, width);
    for (Eigen::Index i = 0; i < costs.size(); ++i) {
        costs.data()[i] = uniform(rng);
    }
    return costs;
}

}  // namespace pathlayer::test
