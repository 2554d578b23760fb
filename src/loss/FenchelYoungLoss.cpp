#include "pathlayer/loss/FenchelYoungLoss.h"
#include "pathlayer/common/Logger.h"

#include <stdexcept>

namespace pathlayer {

FenchelYoungLoss::FenchelYoungLoss(PerturbedAdditive layer, MaximizerContext context)
    : layer_(std::move(layer)), context_(std::move(context)) {}

LossEvaluation FenchelYoungLoss::evaluate(const CostMatrix& theta, const PathMatrix& target,
                                          RandomEngine& rng) const {
    if (target.rows() != theta.rows() || target.cols() != theta.cols()) {
        throw std::invalid_argument("Fenchel-Young target shape does not match theta");
    }

    PerturbedSamples samples = layer_.sample(theta, context_, rng);

    LossEvaluation result;
    result.value = samples.averageObjective() - theta.cwiseProduct(target).sum();
    result.gradient = samples.average() - target;

    LOG_TRACE("[FenchelYoungLoss] value={:.6f} |grad|={:.6f}", result.value, result.gradient.norm());
    return result;
}

LossEvaluation FenchelYoungLoss::evaluate(const CostMatrix& theta, const DataPoint& point,
                                          RandomEngine& rng) const {
    return evaluate(theta, point.truePath, rng);
}

}  // namespace pathlayer
