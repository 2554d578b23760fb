#pragma once

#include "Dataset.h"
#include "Embedding.h"
#include "pathlayer/solvers/Maximizers.h"

#include <optional>

namespace pathlayer {

/// Total true cost of a (possibly fractional) path: <y, cTrue>
/// @throws std::invalid_argument on shape mismatch
double solutionCost(const PathMatrix& y, const CostMatrix& cTrue);

/// Ratio of the true cost of the predicted path to the true cost of the
/// reference path. At least 1 when the reference path is optimal.
///
/// Returns nullopt (and warns) when the oracle finds no path for the
/// prediction or the reference cost is zero.
std::optional<double> costRatio(const CostMatrix& thetaPredicted,
                                const PathMatrix& yTrue,
                                const CostMatrix& cTrue,
                                const Maximizer& maximizer,
                                const MaximizerContext& context = {});

/// Cost ratio of the model's prediction on one data point
std::optional<double> costRatio(const ICostEmbedding& model,
                                const DataPoint& point,
                                const Maximizer& maximizer,
                                const MaximizerContext& context = {});

/// Mean percentage excess cost over a dataset: (mean ratio - 1) * 100.
/// Points with an undefined ratio are skipped; nullopt if none is defined.
std::optional<double> costGap(const ICostEmbedding& model,
                              const Dataset& data,
                              const Maximizer& maximizer,
                              const MaximizerContext& context = {});

}  // namespace pathlayer
