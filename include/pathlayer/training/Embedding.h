#pragma once

#include "Dataset.h"
#include "pathlayer/core/Random.h"

#include <memory>

namespace pathlayer {

/// Differentiable map from features to a predicted cost matrix theta.
///
/// This is the boundary with the external autodiff: structured losses return
/// dL/dtheta in closed form and backward() pulls it back onto the parameters,
/// so nothing ever differentiates through the combinatorial oracle.
class ICostEmbedding {
public:
    virtual ~ICostEmbedding() = default;

    /// Predicted theta for one instance
    virtual CostMatrix forward(const Features& x) const = 0;

    /// Gradient of a scalar loss with respect to the parameters, given the
    /// gradient dTheta of that loss with respect to forward(x)
    virtual ParameterVector backward(const Features& x, const CostMatrix& dTheta) const = 0;

    virtual ParameterVector parameters() const = 0;

    /// @throws std::invalid_argument if the size differs from parameterCount()
    virtual void setParameters(const ParameterVector& params) = 0;

    virtual size_t parameterCount() const = 0;

    /// Deep copy (snapshots of the trained model)
    virtual std::unique_ptr<ICostEmbedding> clone() const = 0;
};

/// Per-cell linear model followed by -softplus.
///
///     theta(i, j) = -softplus(b + sum_c w_c * x_c(i, j))
///
/// Predictions are strictly negative, so -theta is a valid Dijkstra weight
/// matrix. Parameters are laid out as [w_1, ..., w_C, b].
class LinearCellEmbedding : public ICostEmbedding {
public:
    explicit LinearCellEmbedding(size_t numChannels);

    /// Weights ~ N(0, scale^2), bias 0
    void initialize(RandomEngine& rng, double scale = 0.1);

    CostMatrix forward(const Features& x) const override;
    ParameterVector backward(const Features& x, const CostMatrix& dTheta) const override;

    ParameterVector parameters() const override { return params_; }
    void setParameters(const ParameterVector& params) override;
    size_t parameterCount() const override { return static_cast<size_t>(params_.size()); }

    std::unique_ptr<ICostEmbedding> clone() const override {
        return std::make_unique<LinearCellEmbedding>(*this);
    }

    size_t numChannels() const { return numChannels_; }

private:
    /// Pre-activation b + sum_c w_c x_c
    Eigen::MatrixXd preActivation(const Features& x) const;

    size_t numChannels_;
    ParameterVector params_;
};

}  // namespace pathlayer
