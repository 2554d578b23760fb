#pragma once

#include "pathlayer/core/Types.h"

#include <vector>

namespace pathlayer {

/// Approximate equality of two atoms.
///
/// ||a - b|| <= max(atol, rtol * max(||a||, ||b||)) with rtol = sqrt(machine
/// epsilon) when atol is 0 and rtol = 0 otherwise. For 0/1 path matrices atol
/// = 0 means exact equality.
bool atomsApproxEqual(const PathMatrix& a, const PathMatrix& b, double atol = 0.0);

/// Finite-support distribution over oracle outputs.
///
/// Atoms are path matrices with parallel non-negative weights. A distribution
/// built from M Monte Carlo draws starts with one atom per draw, each weighted
/// 1/M, and is usually compressed afterwards so repeated paths merge.
class FixedAtomsProbabilityDistribution {
public:
    FixedAtomsProbabilityDistribution() = default;

    /// @throws std::invalid_argument if sizes differ, an atom shape differs
    ///         from the first one, or a weight is negative
    FixedAtomsProbabilityDistribution(std::vector<PathMatrix> atoms, std::vector<double> weights);

    size_t size() const { return atoms_.size(); }
    bool empty() const { return atoms_.empty(); }

    const std::vector<PathMatrix>& atoms() const { return atoms_; }
    const std::vector<double>& weights() const { return weights_; }

    double totalWeight() const;

    /// True if the weights sum to 1 within `tolerance`
    bool isNormalized(double tolerance = 1e-9) const;

    /// Weighted sum of the atoms. A total weight away from 1 is reported with
    /// a warning and not corrected.
    /// @throws std::logic_error if the distribution is empty
    PathMatrix expectation() const;

    /// Merge approximately equal atoms in place.
    ///
    /// Each atom is folded into the first earlier atom it matches, adding its
    /// weight there. Candidates are scanned from the last index down and
    /// removed in descending index order, so no pending index shifts.
    void compress(double atol = 0.0);

    /// Compressed copy, leaving this distribution untouched
    FixedAtomsProbabilityDistribution compressed(double atol = 0.0) const;

private:
    std::vector<PathMatrix> atoms_;
    std::vector<double> weights_;
};

}  // namespace pathlayer
