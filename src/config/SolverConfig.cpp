#include "pathlayer/config/SolverConfig.h"
#include "pathlayer/solvers/MaximizerRegistry.h"
#include "pathlayer/solvers/ShortestPath.h"

#include <stdexcept>
#include <string>

namespace pathlayer {

void SolverConfig::validate() const {
    if (!MaximizerRegistry::instance().has(maximizer)) {
        throw std::invalid_argument("Unknown maximizer: '" + maximizer + "'");
    }
    if (lengthMax && *lengthMax >= algorithms::MAX_HOP_TABLE_ENTRIES) {
        throw std::invalid_argument("Hop bound must be below " +
                                    std::to_string(algorithms::MAX_HOP_TABLE_ENTRIES) +
                                    ", got " + std::to_string(*lengthMax));
    }
}

Maximizer SolverConfig::resolveMaximizer() const {
    return MaximizerRegistry::instance().get(maximizer);
}

}  // namespace pathlayer
