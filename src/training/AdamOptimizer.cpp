#include "pathlayer/training/Optimizer.h"

#include <cmath>
#include <stdexcept>

namespace pathlayer {

AdamOptimizer::AdamOptimizer(double learningRate, double beta1, double beta2, double epsilon)
    : learningRate_(learningRate), beta1_(beta1), beta2_(beta2), epsilon_(epsilon) {
    if (!(learningRate > 0.0)) {
        throw std::invalid_argument("Adam learning rate must be positive");
    }
}

void AdamOptimizer::step(ParameterVector& params, const ParameterVector& grad) {
    if (params.size() != grad.size()) {
        throw std::invalid_argument("Gradient size does not match parameter size");
    }
    if (t_ == 0) {
        m_ = ParameterVector::Zero(params.size());
        v_ = ParameterVector::Zero(params.size());
    } else if (m_.size() != params.size()) {
        throw std::invalid_argument("Parameter size changed between Adam steps");
    }

    ++t_;
    m_ = beta1_ * m_ + (1.0 - beta1_) * grad;
    v_ = beta2_ * v_ + (1.0 - beta2_) * grad.cwiseProduct(grad);

    const double correction1 = 1.0 - std::pow(beta1_, static_cast<double>(t_));
    const double correction2 = 1.0 - std::pow(beta2_, static_cast<double>(t_));

    ParameterVector mHat = m_ / correction1;
    ParameterVector vHat = v_ / correction2;
    params.array() -= learningRate_ * mHat.array() / (vHat.array().sqrt() + epsilon_);
}

void AdamOptimizer::reset() {
    t_ = 0;
    m_.resize(0);
    v_.resize(0);
}

}  // namespace pathlayer
