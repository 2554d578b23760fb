#pragma once

/// @file pathlayer.h
/// @brief Main header for the pathlayer library
///
/// pathlayer wraps grid shortest-path oracles in a perturbed, differentiable
/// layer and trains cost embeddings through it with structured losses.
///
/// Example usage:
/// @code
/// #include <pathlayer/pathlayer.h>
///
/// pathlayer::PerturbedAdditive layer(pathlayer::dijkstraMaximizer,
///                                    pathlayer::PerturbationConfig::imitation().withSeed(0));
/// pathlayer::FenchelYoungLoss loss(layer);
///
/// pathlayer::LinearCellEmbedding model(3);
/// pathlayer::AdamOptimizer adam(1e-2);
/// pathlayer::Trainer trainer(options);
/// auto history = trainer.train(model, loss, adam, pathlayer::dijkstraMaximizer, {}, train, test);
/// @endcode

// Core module - Grid graph and shared types
#include "core/Types.h"
#include "core/GridGraph.h"
#include "core/Random.h"

// Solvers module - Shortest path oracles
#include "solvers/ShortestPath.h"
#include "solvers/Maximizers.h"
#include "solvers/MaximizerRegistry.h"

// Perturbation module - Differentiable layer
#include "perturbation/ProbabilityDistribution.h"
#include "perturbation/PerturbedAdditive.h"

// Loss module
#include "loss/IStructuredLoss.h"
#include "loss/FenchelYoungLoss.h"
#include "loss/PerturbedCostLoss.h"

// Training module
#include "training/Dataset.h"
#include "training/Embedding.h"
#include "training/Optimizer.h"
#include "training/Metrics.h"
#include "training/Trainer.h"

// Configuration
#include "config/ExperimentConfig.h"

#include <string>

namespace pathlayer {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace pathlayer
