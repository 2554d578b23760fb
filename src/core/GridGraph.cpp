#include "pathlayer/core/GridGraph.h"

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace pathlayer {

namespace {

const std::vector<Cell> ROOK_DIRECTIONS = {
    {-1, 0}, {0, -1}, {0, 1}, {1, 0}
};

// Both patterns are row-major scans of the 3x3 neighborhood; oracles break
// ties by this order
const std::vector<Cell> QUEEN_DIRECTIONS = {
    {-1, -1}, {-1, 0}, {-1, 1},
    {0, -1},           {0, 1},
    {1, -1},  {1, 0},  {1, 1}
};

}  // namespace

GridGraph::GridGraph(CostMatrix vertexWeights, Connectivity connectivity)
    : weights_(std::move(vertexWeights)), connectivity_(connectivity) {
    if (weights_.size() == 0) {
        throw std::invalid_argument("GridGraph requires a non-empty weight matrix");
    }
}

VertexId GridGraph::vertexIndex(const Cell& cell) const {
    if (!contains(cell)) {
        throw std::out_of_range("Cell (" + std::to_string(cell.row) + ", " +
                                std::to_string(cell.col) + ") outside " +
                                std::to_string(height()) + "x" + std::to_string(width()) + " grid");
    }
    return static_cast<VertexId>(cell.row * width() + cell.col);
}

Cell GridGraph::coordinates(VertexId v) const {
    if (!hasVertex(v)) {
        throw std::out_of_range("Invalid vertex ID: " + std::to_string(v));
    }
    int w = width();
    return {static_cast<int>(v) / w, static_cast<int>(v) % w};
}

double GridGraph::vertexWeight(VertexId v) const {
    Cell c = coordinates(v);
    return weights_(c.row, c.col);
}

std::vector<VertexId> GridGraph::outNeighbors(VertexId v) const {
    Cell c = coordinates(v);
    const auto& dirs = directions(connectivity_);

    std::vector<VertexId> result;
    result.reserve(dirs.size());
    for (const Cell& d : dirs) {
        Cell n = c + d;
        if (contains(n)) {
            result.push_back(static_cast<VertexId>(n.row * width() + n.col));
        }
    }
    return result;
}

bool GridGraph::areAdjacent(VertexId u, VertexId v) const {
    if (!hasVertex(u) || !hasVertex(v) || u == v) return false;

    Cell a = coordinates(u);
    Cell b = coordinates(v);
    int dr = std::abs(a.row - b.row);
    int dc = std::abs(a.col - b.col);
    if (connectivity_ == Connectivity::Rook) {
        return dr + dc == 1;
    }
    return dr <= 1 && dc <= 1;
}

int GridGraph::degree(Connectivity connectivity) {
    return static_cast<int>(directions(connectivity).size());
}

const std::vector<Cell>& GridGraph::directions(Connectivity connectivity) {
    return connectivity == Connectivity::Rook ? ROOK_DIRECTIONS : QUEEN_DIRECTIONS;
}

}  // namespace pathlayer
