#include "pathlayer/perturbation/PerturbedAdditive.h"
#include "pathlayer/common/Logger.h"
#include "pathlayer/core/TaskExecutor.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace pathlayer {

namespace {

std::string shapeString(const Eigen::MatrixXd& m) {
    return std::to_string(m.rows()) + "x" + std::to_string(m.cols());
}

}  // namespace

PathMatrix PerturbedSamples::average() const {
    if (solutions.empty()) {
        return PathMatrix::Zero(theta.rows(), theta.cols());
    }
    PathMatrix sum = PathMatrix::Zero(theta.rows(), theta.cols());
    for (const auto& y : solutions) {
        sum += y;
    }
    return sum / static_cast<double>(solutions.size());
}

double PerturbedSamples::averageObjective() const {
    if (solutions.empty()) {
        return 0.0;
    }
    double total = 0.0;
    for (size_t i = 0; i < solutions.size(); ++i) {
        total += ((theta + epsilon * noise[i]).cwiseProduct(solutions[i])).sum();
    }
    return total / static_cast<double>(solutions.size());
}

PerturbedAdditive::PerturbedAdditive(Maximizer maximizer, PerturbationConfig config)
    : maximizer_(std::move(maximizer)), config_(std::move(config)) {
    if (!maximizer_) {
        throw std::invalid_argument("PerturbedAdditive requires a maximizer");
    }
    config_.validate();
}

PerturbedSamples PerturbedAdditive::sample(const CostMatrix& theta, const MaximizerContext& context,
                                           RandomEngine& rng) const {
    if (theta.size() == 0) {
        throw std::invalid_argument("PerturbedAdditive called with an empty theta");
    }

    const size_t m = static_cast<size_t>(config_.nbSamples);

    PerturbedSamples samples;
    samples.epsilon = config_.epsilon;
    samples.theta = theta;
    samples.noise.reserve(m);
    samples.solutions.resize(m);

    // Draw everything up front on the caller's engine so the result does not
    // depend on how oracle calls are scheduled
    for (size_t i = 0; i < m; ++i) {
        if (config_.epsilon > 0.0) {
            samples.noise.push_back(standardNormalMatrix(theta.rows(), theta.cols(), rng));
        } else {
            samples.noise.push_back(CostMatrix::Zero(theta.rows(), theta.cols()));
        }
    }

    const size_t workers = std::clamp<size_t>(static_cast<size_t>(config_.numThreads), 1, m);
    stridedFor(m, workers, [&](size_t i) {
        CostMatrix perturbed = theta + config_.epsilon * samples.noise[i];
        PathMatrix y = maximizer_(perturbed, context);
        if (y.rows() != theta.rows() || y.cols() != theta.cols()) {
            throw std::logic_error("Maximizer returned " + shapeString(y) +
                                   " solution for " + shapeString(theta) + " input");
        }
        samples.solutions[i] = std::move(y);
    });

    LOG_TRACE("Drew {} perturbed solutions (eps={}, {} worker(s)) for {} theta",
              m, config_.epsilon, workers, shapeString(theta));
    return samples;
}

PathMatrix PerturbedAdditive::operator()(const CostMatrix& theta, const MaximizerContext& context,
                                         RandomEngine& rng) const {
    return sample(theta, context, rng).average();
}

FixedAtomsProbabilityDistribution PerturbedAdditive::distribution(const CostMatrix& theta,
                                                                  const MaximizerContext& context,
                                                                  RandomEngine& rng) const {
    PerturbedSamples samples = sample(theta, context, rng);
    const double weight = 1.0 / static_cast<double>(samples.size());
    std::vector<double> weights(samples.size(), weight);
    return FixedAtomsProbabilityDistribution(std::move(samples.solutions), std::move(weights));
}

CostMatrix PerturbedAdditive::pullback(const PerturbedSamples& samples, const PathMatrix& dY) {
    if (dY.rows() != samples.theta.rows() || dY.cols() != samples.theta.cols()) {
        throw std::invalid_argument("Pullback cotangent is " + shapeString(dY) +
                                    ", samples are " + shapeString(samples.theta));
    }

    CostMatrix grad = CostMatrix::Zero(samples.theta.rows(), samples.theta.cols());
    if (samples.epsilon == 0.0 || samples.solutions.empty()) {
        return grad;
    }

    for (size_t i = 0; i < samples.size(); ++i) {
        grad += samples.solutions[i].cwiseProduct(dY).sum() * samples.noise[i];
    }
    return grad / (static_cast<double>(samples.size()) * samples.epsilon);
}

}  // namespace pathlayer
