#include "pathlayer/loss/PerturbedCostLoss.h"
#include "pathlayer/common/Logger.h"
#include "pathlayer/training/Metrics.h"

#include <stdexcept>

namespace pathlayer {

double linearSolutionCost(const PathMatrix& y, const DataPoint& point) {
    return solutionCost(y, point.trueCosts);
}

PerturbedCostLoss::PerturbedCostLoss(PerturbedAdditive layer, MaximizerContext context,
                                     SolutionCostFunction cost)
    : layer_(std::move(layer)), context_(std::move(context)), cost_(std::move(cost)) {
    if (layer_.config().epsilon <= 0.0) {
        throw std::invalid_argument("PerturbedCostLoss requires a positive perturbation size");
    }
    if (!cost_) {
        throw std::invalid_argument("PerturbedCostLoss requires a cost function");
    }
}

LossEvaluation PerturbedCostLoss::evaluate(const CostMatrix& theta, const DataPoint& point,
                                           RandomEngine& rng) const {
    PerturbedSamples samples = layer_.sample(theta, context_, rng);
    const double m = static_cast<double>(samples.size());

    LossEvaluation result;
    result.gradient = CostMatrix::Zero(theta.rows(), theta.cols());
    for (size_t i = 0; i < samples.size(); ++i) {
        double c = cost_(samples.solutions[i], point);
        result.value += c;
        result.gradient += c * samples.noise[i];
    }
    result.value /= m;
    result.gradient /= m * samples.epsilon;

    LOG_TRACE("[PerturbedCostLoss] value={:.6f}", result.value);
    return result;
}

}  // namespace pathlayer
