#include "pathlayer/solvers/ShortestPath.h"
#include "pathlayer/common/Logger.h"

#include <algorithm>
#include <functional>
#include <limits>
#include <queue>
#include <stdexcept>
#include <string>
#include <unordered_set>

namespace pathlayer {
namespace algorithms {

namespace {

constexpr double INF = std::numeric_limits<double>::infinity();

void checkEndpoints(const GridGraph& graph, VertexId source, VertexId destination) {
    if (!graph.hasVertex(source) || !graph.hasVertex(destination)) {
        throw std::out_of_range("Shortest path endpoints (" + std::to_string(source) + ", " +
                                std::to_string(destination) + ") outside graph of " +
                                std::to_string(graph.vertexCount()) + " vertices");
    }
}

}  // namespace

VertexPath dijkstraShortestPath(const GridGraph& graph, VertexId source, VertexId destination) {
    checkEndpoints(graph, source, destination);

    const CostMatrix& weights = graph.vertexWeights();
    if ((weights.array() < 0.0).any()) {
        throw std::invalid_argument("Dijkstra requires non-negative vertex weights (min = " +
                                    std::to_string(weights.minCoeff()) + ")");
    }

    const size_t n = graph.vertexCount();
    std::vector<double> dist(n, INF);
    std::vector<VertexId> parent(n, INVALID_VERTEX);
    std::vector<bool> settled(n, false);

    using QueueEntry = std::pair<double, VertexId>;
    std::priority_queue<QueueEntry, std::vector<QueueEntry>, std::greater<QueueEntry>> open;

    dist[source] = 0.0;
    open.push({0.0, source});

    while (!open.empty()) {
        auto [d, u] = open.top();
        open.pop();

        if (settled[u]) continue;
        settled[u] = true;
        if (u == destination) break;

        for (VertexId v : graph.outNeighbors(u)) {
            if (settled[v]) continue;
            double candidate = d + graph.vertexWeight(v);
            if (candidate < dist[v]) {
                dist[v] = candidate;
                parent[v] = u;
                open.push({candidate, v});
            }
        }
    }

    if (dist[destination] == INF) {
        LOG_WARN("No path from {} to {} in {}x{} grid", source, destination,
                 graph.height(), graph.width());
        return {};
    }

    VertexPath path;
    for (VertexId v = destination; v != INVALID_VERTEX; v = parent[v]) {
        path.push_back(v);
        if (v == source) break;
    }
    std::reverse(path.begin(), path.end());
    return path;
}

VertexPath boundedBellmanFord(const GridGraph& graph, VertexId source, VertexId destination,
                              std::optional<size_t> lengthMax) {
    checkEndpoints(graph, source, destination);

    const size_t n = graph.vertexCount();
    const size_t maxHops = lengthMax.value_or(n);
    if (n > MAX_HOP_TABLE_ENTRIES || maxHops > MAX_HOP_TABLE_ENTRIES / n - 1) {
        throw std::invalid_argument("Hop bound " + std::to_string(maxHops) + " on " +
                                    std::to_string(n) + " vertices exceeds the table limit of " +
                                    std::to_string(MAX_HOP_TABLE_ENTRIES) + " entries");
    }

    // Distances only need the current and next hop layer; the parent table
    // and the destination column keep every layer for reconstruction.
    std::vector<double> current(n, INF);
    std::vector<double> next(n, INF);
    std::vector<VertexId> parents(n * (maxHops + 1), INVALID_VERTEX);
    std::vector<double> destinationDist(maxHops + 1, INF);

    current[source] = 0.0;
    destinationDist[0] = current[destination];

    for (size_t k = 0; k < maxHops; ++k) {
        std::fill(next.begin(), next.end(), INF);
        for (VertexId v = 0; v < n; ++v) {
            const double weight = graph.vertexWeight(v);
            for (VertexId u : graph.inNeighbors(v)) {
                const double du = current[u];
                if (du == INF) continue;

                const double throughU = du + weight;
                if (next[v] == INF || throughU < next[v]) {
                    next[v] = throughU;
                    parents[(k + 1) * n + v] = u;
                }
            }
        }
        destinationDist[k + 1] = next[destination];
        current.swap(next);
    }

    auto best = std::min_element(destinationDist.begin(), destinationDist.end());
    size_t kShort = static_cast<size_t>(std::distance(destinationDist.begin(), best));
    if (*best == INF) {
        LOG_WARN("No shortest path with at most {} arcs", maxHops);
        return {};
    }

    VertexPath path{destination};
    VertexId v = destination;
    size_t k = kShort;
    while (v != source) {
        v = parents[k * n + v];
        if (v == INVALID_VERTEX) {
            LOG_WARN("Path reconstruction hit a missing predecessor at hop {}", k);
            return {};
        }
        path.push_back(v);
        --k;
    }
    std::reverse(path.begin(), path.end());
    return path;
}

double pathCost(const GridGraph& graph, const VertexPath& path) {
    double cost = 0.0;
    for (size_t i = 1; i < path.size(); ++i) {
        cost += graph.vertexWeight(path[i]);
    }
    return cost;
}

PathMatrix pathToMatrix(const GridGraph& graph, const VertexPath& path) {
    PathMatrix y = PathMatrix::Zero(graph.height(), graph.width());
    for (VertexId v : path) {
        Cell c = graph.coordinates(v);
        y(c.row, c.col) = 1.0;
    }
    return y;
}

std::optional<VertexPath> matrixToPath(const PathMatrix& y, Connectivity connectivity) {
    if (y.size() == 0) {
        return std::nullopt;
    }

    GridGraph grid(CostMatrix::Zero(y.rows(), y.cols()), connectivity);
    auto marked = [&](VertexId v) {
        Cell c = grid.coordinates(v);
        return y(c.row, c.col) > 0.5;
    };

    size_t markedCount = static_cast<size_t>((y.array() > 0.5).count());
    if (markedCount == 0) {
        return VertexPath{};
    }
    if (!marked(grid.source()) || !marked(grid.destination())) {
        return std::nullopt;
    }

    VertexPath path{grid.source()};
    std::vector<bool> onPath(grid.vertexCount(), false);
    onPath[grid.source()] = true;

    // Depth-first walk; the destination must be the last marked cell reached
    std::function<bool(VertexId)> extend = [&](VertexId u) -> bool {
        if (u == grid.destination()) {
            return path.size() == markedCount;
        }
        for (VertexId v : grid.outNeighbors(u)) {
            if (onPath[v] || !marked(v)) continue;
            onPath[v] = true;
            path.push_back(v);
            if (extend(v)) return true;
            path.pop_back();
            onPath[v] = false;
        }
        return false;
    };

    if (!extend(grid.source())) {
        return std::nullopt;
    }
    return path;
}

bool isValidPath(const GridGraph& graph, const VertexPath& path) {
    if (path.empty() || path.front() != graph.source() || path.back() != graph.destination()) {
        return false;
    }

    std::unordered_set<VertexId> seen;
    for (size_t i = 0; i < path.size(); ++i) {
        if (!graph.hasVertex(path[i]) || !seen.insert(path[i]).second) {
            return false;
        }
        if (i > 0 && !graph.areAdjacent(path[i - 1], path[i])) {
            return false;
        }
    }
    return true;
}

}  // namespace algorithms
}  // namespace pathlayer
