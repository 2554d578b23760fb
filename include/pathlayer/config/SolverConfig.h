#pragma once

#include "pathlayer/core/Types.h"
#include "pathlayer/solvers/Maximizers.h"

#include <optional>
#include <string>

namespace pathlayer {

/// Oracle selection and grid settings
struct SolverConfig {
    /// Name in the MaximizerRegistry ("dijkstra" or "bellman_ford")
    std::string maximizer = "bellman_ford";

    Connectivity connectivity = Connectivity::Queen;

    /// Bellman-Ford hop bound (nullopt = vertex count)
    std::optional<size_t> lengthMax;

    MaximizerContext context() const {
        MaximizerContext ctx;
        ctx.connectivity = connectivity;
        ctx.lengthMax = lengthMax;
        return ctx;
    }

    /// @throws std::invalid_argument if the maximizer is not registered or
    ///         lengthMax can never fit the Bellman-Ford hop table
    void validate() const;

    /// Look the maximizer up in the registry
    /// @throws std::invalid_argument if the name is unknown
    Maximizer resolveMaximizer() const;
};

}  // namespace pathlayer
