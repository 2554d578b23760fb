#pragma once

#include "pathlayer/core/GridGraph.h"

#include <optional>

namespace pathlayer {
namespace algorithms {

/// Upper bound on the (hop, vertex) parent table of boundedBellmanFord
constexpr size_t MAX_HOP_TABLE_ENTRIES = size_t{1} << 30;

/// Dijkstra shortest path on a grid graph with vertex weights.
///
/// The cost of a path is the sum of the weights of every visited vertex except
/// the source. Among equal-cost candidates, the first one relaxed wins
/// (neighbors are scanned in GridGraph::directions order).
///
/// @param graph Grid graph with non-negative vertex weights
/// @param source Start vertex
/// @param destination Target vertex
/// @return Vertex sequence from source to destination, empty if unreachable
/// @throws std::invalid_argument if any vertex weight is negative
/// @throws std::out_of_range if source or destination is not in the graph
VertexPath dijkstraShortestPath(const GridGraph& graph, VertexId source, VertexId destination);

/// Bellman-Ford shortest path restricted to at most lengthMax hops.
///
/// Dynamic program over (vertex, exact hop count): dist[v][k+1] is relaxed
/// from dist[u][k] + weight(v) for every in-neighbor u, charging the weight of
/// the destination cell of each hop. The returned path uses the hop count k*
/// minimizing dist[destination][k] (smallest k on ties). Handles negative
/// weights; the hop bound keeps negative cycles finite.
///
/// Runs in O(V * lengthMax * degree) time.
///
/// @param lengthMax Hop bound, defaults to the vertex count
/// @return Vertex sequence, empty if no path exists within the bound
/// @throws std::out_of_range if source or destination is not in the graph
/// @throws std::invalid_argument if vertexCount * (lengthMax + 1) exceeds
///         MAX_HOP_TABLE_ENTRIES
VertexPath boundedBellmanFord(const GridGraph& graph, VertexId source, VertexId destination,
                              std::optional<size_t> lengthMax = std::nullopt);

/// Sum of the weights charged along a path (source cell excluded)
double pathCost(const GridGraph& graph, const VertexPath& path);

/// Binary incidence matrix of the cells visited by a path (all zeros if empty)
PathMatrix pathToMatrix(const GridGraph& graph, const VertexPath& path);

/// Recover the ordered vertex sequence of a path from its incidence matrix.
///
/// Walks from the top-left cell to the bottom-right cell through marked,
/// adjacent cells, backtracking until every marked cell is covered exactly
/// once. Entries above 0.5 count as marked.
///
/// @return The vertex sequence, or nullopt if the marks are not such a path
///         (an all-zero matrix yields an empty sequence)
std::optional<VertexPath> matrixToPath(const PathMatrix& y, Connectivity connectivity);

/// Check that a vertex sequence is a simple path of grid-adjacent cells from
/// graph.source() to graph.destination()
bool isValidPath(const GridGraph& graph, const VertexPath& path);

}  // namespace algorithms
}  // namespace pathlayer
