#include "pathlayer/solvers/MaximizerRegistry.h"

#include <algorithm>
#include <stdexcept>

namespace pathlayer {

MaximizerRegistry& MaximizerRegistry::instance() {
    static MaximizerRegistry instance;
    return instance;
}

MaximizerRegistry::MaximizerRegistry() {
    maximizers_["dijkstra"] = dijkstraMaximizer;
    maximizers_["bellman_ford"] = bellmanMaximizer;
}

void MaximizerRegistry::registerMaximizer(const std::string& name, Maximizer maximizer) {
    if (!maximizer) {
        throw std::runtime_error("Cannot register empty maximizer '" + name + "'");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (maximizers_.find(name) != maximizers_.end()) {
        throw std::runtime_error("Maximizer with name '" + name + "' already registered");
    }
    maximizers_[name] = std::move(maximizer);
}

bool MaximizerRegistry::unregisterMaximizer(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return maximizers_.erase(name) > 0;
}

Maximizer MaximizerRegistry::get(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = maximizers_.find(name);
    if (it == maximizers_.end()) {
        throw std::invalid_argument("Unknown maximizer: '" + name + "'");
    }
    return it->second;
}

bool MaximizerRegistry::has(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return maximizers_.find(name) != maximizers_.end();
}

std::vector<std::string> MaximizerRegistry::availableMaximizers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(maximizers_.size());
    for (const auto& [name, _] : maximizers_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

}  // namespace pathlayer
