#pragma once

#include "pathlayer/core/Random.h"
#include "pathlayer/training/Dataset.h"

namespace pathlayer {

/// Loss value and its gradient with respect to the predicted costs
struct LossEvaluation {
    double value = 0.0;
    CostMatrix gradient;
};

/// Loss over the output of a cost embedding.
///
/// The gradient is supplied in closed form, so callers chain it through
/// ICostEmbedding::backward() without differentiating the oracle.
class IStructuredLoss {
public:
    virtual ~IStructuredLoss() = default;

    virtual LossEvaluation evaluate(const CostMatrix& theta, const DataPoint& point,
                                    RandomEngine& rng) const = 0;

    virtual const char* name() const = 0;
};

}  // namespace pathlayer
