#pragma once

#include "Maximizers.h"

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace pathlayer {

/// Central registry of named maximizers
///
/// Maps configuration names to oracle functions so the solver can be chosen
/// from a configuration file. Entries are plain function values.
///
/// Built-in maximizers are registered automatically:
/// - "dijkstra": dijkstraMaximizer (non-negative cell costs)
/// - "bellman_ford": bellmanMaximizer (any sign, hop-bounded)
///
/// Usage:
/// @code
/// auto& registry = MaximizerRegistry::instance();
/// Maximizer oracle = registry.get("bellman_ford");
///
/// registry.registerMaximizer("my_oracle", [](const CostMatrix& theta,
///                                            const MaximizerContext& ctx) { ... });
/// @endcode
class MaximizerRegistry {
public:
    /// Get singleton instance
    static MaximizerRegistry& instance();

    // Non-copyable, non-movable (singleton)
    MaximizerRegistry(const MaximizerRegistry&) = delete;
    MaximizerRegistry& operator=(const MaximizerRegistry&) = delete;

    /// Register a maximizer under a name
    /// @throws std::runtime_error if the name is taken or the function is empty
    void registerMaximizer(const std::string& name, Maximizer maximizer);

    /// @return true if a maximizer was found and removed
    bool unregisterMaximizer(const std::string& name);

    /// @throws std::invalid_argument if no maximizer has this name
    Maximizer get(const std::string& name) const;

    bool has(const std::string& name) const;

    /// Registered names, sorted
    std::vector<std::string> availableMaximizers() const;

private:
    MaximizerRegistry();
    ~MaximizerRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Maximizer> maximizers_;
};

}  // namespace pathlayer
