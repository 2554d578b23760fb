#pragma once

#include "IStructuredLoss.h"
#include "pathlayer/perturbation/PerturbedAdditive.h"

#include <functional>

namespace pathlayer {

/// Cost of a hard solution on a data point; treated as a black box
using SolutionCostFunction = std::function<double(const PathMatrix&, const DataPoint&)>;

/// <y, point.trueCosts>
double linearSolutionCost(const PathMatrix& y, const DataPoint& point);

/// Expected solution cost under the perturbed layer, for learning by experience.
///
///     L(theta) = (1/M) sum_i cost(Y_i)
///     grad     = (1 / (M * epsilon)) sum_i cost(Y_i) Z_i
///
/// The gradient is the score-function estimate, so cost may be any black-box
/// function of the solution. For the linear cost it coincides with
/// PerturbedAdditive::pullback(samples, trueCosts). Needs epsilon > 0.
class PerturbedCostLoss : public IStructuredLoss {
public:
    /// @throws std::invalid_argument if the layer has epsilon == 0 or cost is empty
    PerturbedCostLoss(PerturbedAdditive layer, MaximizerContext context = {},
                      SolutionCostFunction cost = linearSolutionCost);

    LossEvaluation evaluate(const CostMatrix& theta, const DataPoint& point,
                            RandomEngine& rng) const override;

    const char* name() const override { return "PerturbedCost"; }

    const PerturbedAdditive& layer() const { return layer_; }

private:
    PerturbedAdditive layer_;
    MaximizerContext context_;
    SolutionCostFunction cost_;
};

}  // namespace pathlayer
