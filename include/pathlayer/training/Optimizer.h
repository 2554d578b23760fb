#pragma once

#include "pathlayer/core/Types.h"

namespace pathlayer {

/// Gradient descent update rule over a flat parameter vector
class IOptimizer {
public:
    virtual ~IOptimizer() = default;

    /// Update params in place from the loss gradient
    virtual void step(ParameterVector& params, const ParameterVector& grad) = 0;

    /// Forget accumulated state (moments, step count)
    virtual void reset() = 0;
};

/// Adam (Kingma & Ba) with bias correction
class AdamOptimizer : public IOptimizer {
public:
    explicit AdamOptimizer(double learningRate = 1e-3, double beta1 = 0.9,
                           double beta2 = 0.999, double epsilon = 1e-8);

    /// @throws std::invalid_argument if params and grad sizes differ, or the
    ///         size changes between steps without reset()
    void step(ParameterVector& params, const ParameterVector& grad) override;
    void reset() override;

    double learningRate() const { return learningRate_; }
    long stepCount() const { return t_; }

private:
    double learningRate_;
    double beta1_;
    double beta2_;
    double epsilon_;
    long t_ = 0;
    ParameterVector m_;
    ParameterVector v_;
};

}  // namespace pathlayer
