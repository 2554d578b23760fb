#pragma once

#include "Types.h"

#include <vector>

namespace pathlayer {

/// Directed grid graph whose vertices are the cells of a height x width matrix.
///
/// Every vertex is linked to the grid-adjacent cells given by the
/// connectivity pattern, in both directions, without wraparound. Weights live
/// on vertices: moving onto a cell costs that cell's weight, so a path cost
/// charges every visited cell except the source.
///
/// Immutable after construction. Oracles build one per call from the weight
/// matrix they receive and discard it afterwards.
class GridGraph {
public:
    /// @throws std::invalid_argument if the weight matrix is empty
    explicit GridGraph(CostMatrix vertexWeights,
                       Connectivity connectivity = Connectivity::Queen);

    int height() const { return static_cast<int>(weights_.rows()); }
    int width() const { return static_cast<int>(weights_.cols()); }
    size_t vertexCount() const { return static_cast<size_t>(weights_.size()); }
    Connectivity connectivity() const { return connectivity_; }
    const CostMatrix& vertexWeights() const { return weights_; }

    /// Top-left cell
    VertexId source() const { return 0; }

    /// Bottom-right cell
    VertexId destination() const { return static_cast<VertexId>(vertexCount() - 1); }

    bool hasVertex(VertexId v) const { return v < vertexCount(); }
    bool contains(const Cell& cell) const {
        return cell.row >= 0 && cell.row < height() && cell.col >= 0 && cell.col < width();
    }

    /// @throws std::out_of_range if the cell is outside the grid
    VertexId vertexIndex(const Cell& cell) const;

    /// @throws std::out_of_range if the vertex is not in the graph
    Cell coordinates(VertexId v) const;

    /// Weight charged when a path moves onto v
    double vertexWeight(VertexId v) const;

    /// Neighbors reachable in one hop. The pattern is symmetric, so these are
    /// also the in-neighbors.
    std::vector<VertexId> outNeighbors(VertexId v) const;
    std::vector<VertexId> inNeighbors(VertexId v) const { return outNeighbors(v); }

    /// True if u and v are distinct and adjacent under the connectivity
    bool areAdjacent(VertexId u, VertexId v) const;

    /// Maximum neighbor count of a vertex (4 or 8)
    static int degree(Connectivity connectivity);

    /// Unit offsets of the connectivity pattern
    static const std::vector<Cell>& directions(Connectivity connectivity);

private:
    CostMatrix weights_;
    Connectivity connectivity_;
};

}  // namespace pathlayer
