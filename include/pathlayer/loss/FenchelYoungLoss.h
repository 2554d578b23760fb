#pragma once

#include "IStructuredLoss.h"
#include "pathlayer/perturbation/PerturbedAdditive.h"

namespace pathlayer {

/// Perturbed Fenchel-Young loss for learning by imitation.
///
///     L(theta, y) = F(theta) - <theta, y>
///     grad        = y_hat(theta) - y
///
/// F is the perturbed value function and y_hat the perturbed point estimate,
/// both taken from the same draws. The regularizer term of the conjugate is
/// constant in theta and omitted, so the value is a Monte Carlo estimate of
/// the loss up to that constant; with enough samples it is non-negative.
class FenchelYoungLoss : public IStructuredLoss {
public:
    explicit FenchelYoungLoss(PerturbedAdditive layer, MaximizerContext context = {});

    /// @throws std::invalid_argument if target and theta differ in shape
    LossEvaluation evaluate(const CostMatrix& theta, const PathMatrix& target,
                            RandomEngine& rng) const;

    /// Uses point.truePath as the target
    LossEvaluation evaluate(const CostMatrix& theta, const DataPoint& point,
                            RandomEngine& rng) const override;

    const char* name() const override { return "FenchelYoung"; }

    const PerturbedAdditive& layer() const { return layer_; }

private:
    PerturbedAdditive layer_;
    MaximizerContext context_;
};

}  // namespace pathlayer
