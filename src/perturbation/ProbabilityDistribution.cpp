#include "pathlayer/perturbation/ProbabilityDistribution.h"
#include "pathlayer/common/Logger.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>

namespace pathlayer {

bool atomsApproxEqual(const PathMatrix& a, const PathMatrix& b, double atol) {
    if (a.rows() != b.rows() || a.cols() != b.cols()) {
        return false;
    }
    const double rtol = atol > 0.0 ? 0.0 : std::sqrt(std::numeric_limits<double>::epsilon());
    const double diff = (a - b).norm();
    return diff <= std::max(atol, rtol * std::max(a.norm(), b.norm()));
}

FixedAtomsProbabilityDistribution::FixedAtomsProbabilityDistribution(
    std::vector<PathMatrix> atoms, std::vector<double> weights)
    : atoms_(std::move(atoms)), weights_(std::move(weights)) {
    if (atoms_.size() != weights_.size()) {
        throw std::invalid_argument("Distribution has " + std::to_string(atoms_.size()) +
                                    " atoms but " + std::to_string(weights_.size()) + " weights");
    }
    for (size_t i = 0; i < atoms_.size(); ++i) {
        if (atoms_[i].rows() != atoms_.front().rows() || atoms_[i].cols() != atoms_.front().cols()) {
            throw std::invalid_argument("Atom " + std::to_string(i) + " shape differs from atom 0");
        }
        if (weights_[i] < 0.0) {
            throw std::invalid_argument("Negative weight at atom " + std::to_string(i));
        }
    }
}

double FixedAtomsProbabilityDistribution::totalWeight() const {
    return std::accumulate(weights_.begin(), weights_.end(), 0.0);
}

bool FixedAtomsProbabilityDistribution::isNormalized(double tolerance) const {
    return std::abs(totalWeight() - 1.0) <= tolerance;
}

PathMatrix FixedAtomsProbabilityDistribution::expectation() const {
    if (empty()) {
        throw std::logic_error("Expectation of an empty distribution");
    }
    if (!isNormalized(1e-6)) {
        LOG_WARN("Distribution weights sum to {:.9f}, expected 1", totalWeight());
    }

    PathMatrix mean = PathMatrix::Zero(atoms_.front().rows(), atoms_.front().cols());
    for (size_t i = 0; i < atoms_.size(); ++i) {
        mean += weights_[i] * atoms_[i];
    }
    return mean;
}

void FixedAtomsProbabilityDistribution::compress(double atol) {
    std::vector<size_t> toDelete;
    for (size_t i = atoms_.size(); i-- > 1;) {
        for (size_t j = 0; j < i; ++j) {
            if (atomsApproxEqual(atoms_[i], atoms_[j], atol)) {
                weights_[j] += weights_[i];
                toDelete.push_back(i);
                break;
            }
        }
    }

    // toDelete is already in descending order
    for (size_t index : toDelete) {
        atoms_.erase(atoms_.begin() + static_cast<std::ptrdiff_t>(index));
        weights_.erase(weights_.begin() + static_cast<std::ptrdiff_t>(index));
    }

    if (!toDelete.empty()) {
        LOG_DEBUG("Merged {} atoms, {} distinct remain", toDelete.size(), atoms_.size());
    }
}

FixedAtomsProbabilityDistribution FixedAtomsProbabilityDistribution::compressed(double atol) const {
    FixedAtomsProbabilityDistribution copy = *this;
    copy.compress(atol);
    return copy;
}

}  // namespace pathlayer
