#include "pathlayer/training/Embedding.h"

#include <cmath>
#include <stdexcept>
#include <string>

namespace pathlayer {

namespace {

double softplus(double z) {
    return z > 0.0 ? z + std::log1p(std::exp(-z)) : std::log1p(std::exp(z));
}

double sigmoid(double z) {
    if (z >= 0.0) {
        return 1.0 / (1.0 + std::exp(-z));
    }
    double e = std::exp(z);
    return e / (1.0 + e);
}

}  // namespace

LinearCellEmbedding::LinearCellEmbedding(size_t numChannels)
    : numChannels_(numChannels), params_(ParameterVector::Zero(static_cast<Eigen::Index>(numChannels) + 1)) {
    if (numChannels == 0) {
        throw std::invalid_argument("LinearCellEmbedding needs at least one channel");
    }
}

void LinearCellEmbedding::initialize(RandomEngine& rng, double scale) {
    std::normal_distribution<double> normal(0.0, scale);
    for (size_t c = 0; c < numChannels_; ++c) {
        params_(static_cast<Eigen::Index>(c)) = normal(rng);
    }
    params_(static_cast<Eigen::Index>(numChannels_)) = 0.0;
}

Eigen::MatrixXd LinearCellEmbedding::preActivation(const Features& x) const {
    if (x.size() != numChannels_) {
        throw std::invalid_argument("Expected " + std::to_string(numChannels_) +
                                    " feature channels, got " + std::to_string(x.size()));
    }
    for (const auto& channel : x) {
        if (channel.rows() != x.front().rows() || channel.cols() != x.front().cols()) {
            throw std::invalid_argument("Feature channels differ in shape");
        }
    }

    Eigen::MatrixXd z = Eigen::MatrixXd::Constant(x.front().rows(), x.front().cols(),
                                                  params_(static_cast<Eigen::Index>(numChannels_)));
    for (size_t c = 0; c < numChannels_; ++c) {
        z += params_(static_cast<Eigen::Index>(c)) * x[c];
    }
    return z;
}

CostMatrix LinearCellEmbedding::forward(const Features& x) const {
    return -preActivation(x).unaryExpr([](double z) { return softplus(z); });
}

ParameterVector LinearCellEmbedding::backward(const Features& x, const CostMatrix& dTheta) const {
    Eigen::MatrixXd z = preActivation(x);
    if (dTheta.rows() != z.rows() || dTheta.cols() != z.cols()) {
        throw std::invalid_argument("Cost gradient shape does not match the prediction");
    }

    // d theta / d z = -sigmoid(z)
    Eigen::MatrixXd dz = -dTheta.cwiseProduct(z.unaryExpr([](double v) { return sigmoid(v); }));

    ParameterVector grad(params_.size());
    for (size_t c = 0; c < numChannels_; ++c) {
        grad(static_cast<Eigen::Index>(c)) = dz.cwiseProduct(x[c]).sum();
    }
    grad(static_cast<Eigen::Index>(numChannels_)) = dz.sum();
    return grad;
}

void LinearCellEmbedding::setParameters(const ParameterVector& params) {
    if (params.size() != params_.size()) {
        throw std::invalid_argument("Expected " + std::to_string(params_.size()) +
                                    " parameters, got " + std::to_string(params.size()));
    }
    params_ = params;
}

}  // namespace pathlayer
