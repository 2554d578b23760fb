#pragma once

#include <Eigen/Dense>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pathlayer {

/// Dense per-cell cost matrix (height x width). Oracles maximize, so
/// shortest-path cell costs enter them negated.
using CostMatrix = Eigen::MatrixXd;

/// Dense path incidence matrix (height x width). Entries are 0/1 for a hard
/// path and lie in [0, 1] for a perturbed (averaged) solution.
using PathMatrix = Eigen::MatrixXd;

/// Flattened parameter vector of an embedding
using ParameterVector = Eigen::VectorXd;

/// Linear vertex index, row-major: index = row * width + col
using VertexId = uint32_t;

constexpr VertexId INVALID_VERTEX = UINT32_MAX;

/// Ordered vertex sequence from source to destination (empty = no path)
using VertexPath = std::vector<VertexId>;

/// Grid cell coordinate (0-based)
struct Cell {
    int row = 0;
    int col = 0;

    constexpr Cell() = default;
    constexpr Cell(int r, int c) : row(r), col(c) {}

    constexpr Cell operator+(const Cell& o) const { return {row + o.row, col + o.col}; }

    constexpr bool operator==(const Cell& o) const { return row == o.row && col == o.col; }
    constexpr bool operator!=(const Cell& o) const { return !(*this == o); }
};

/// Neighbor pattern of a grid graph
enum class Connectivity {
    Rook,   ///< 4 neighbors (up, down, left, right)
    Queen   ///< 8 neighbors (rook moves plus diagonals)
};

std::string connectivityToString(Connectivity connectivity);

/// @throws std::invalid_argument for names other than "rook" and "queen"
Connectivity connectivityFromString(const std::string& name);

/// Auxiliary context handed to every maximizer call
struct MaximizerContext {
    Connectivity connectivity = Connectivity::Queen;

    /// Hop bound for the Bellman-Ford oracle (nullopt = vertex count)
    std::optional<size_t> lengthMax;
};

}  // namespace pathlayer
