#pragma once

#include "pathlayer/core/Types.h"

#include <functional>

namespace pathlayer {

/// Combinatorial oracle: theta -> argmax over feasible solutions of <theta, y>.
///
/// Must be a pure function of its arguments; the perturbed layer calls it many
/// times per step, possibly from several threads.
using Maximizer = std::function<PathMatrix(const CostMatrix& theta, const MaximizerContext& context)>;

/// Shortest path oracle on the grid weighted by -theta (Dijkstra).
///
/// theta must be non-positive so that -theta is a valid set of cell costs.
/// Returns the incidence matrix of the path from the top-left to the
/// bottom-right cell, or a zero matrix if no path exists.
///
/// @throws std::invalid_argument if theta has a positive entry or is empty
PathMatrix dijkstraMaximizer(const CostMatrix& theta, const MaximizerContext& context = {});

/// Shortest path oracle on the grid weighted by -theta (bounded Bellman-Ford).
///
/// Accepts theta of any sign; context.lengthMax bounds the hop count.
/// Returns a zero matrix if no path fits within the bound.
PathMatrix bellmanMaximizer(const CostMatrix& theta, const MaximizerContext& context = {});

}  // namespace pathlayer
