//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#include "topology.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "errors.hpp"

namespace
{
// Smallest s such that s^dims >= n.
size_t gridSide(size_t n, size_t dims)
{
    size_t side = static_cast<size_t>(std::floor(std::pow(static_cast<double>(n), 1.0 / static_cast<double>(dims))));
    auto covers = [n, dims](size_t s) {
        size_t total = 1;
        for (size_t d = 0; d < dims; ++d)
            total *= s;
        return total >= n;
    };
    // Guard against rounding of pow in either direction.
    while (side > 1 && covers(side - 1))
        side--;
    while (!covers(side))
        side++;
    return side;
}
} // namespace

namespace topology
{
NeighbourIndices ring(size_t n, size_t idx)
{
    return {(idx + 1) % n};
}

NeighbourIndices mesh2d(size_t n, size_t idx)
{
    size_t side = gridSide(n, 2);
    size_t row = idx / side;
    size_t col = idx % side;

    NeighbourIndices neighbours;
    auto add = [&neighbours, n, side](size_t r, size_t c) {
        size_t i = r * side + c;
        if (i < n)
            neighbours.push_back(i);
    };
    if (row > 0)
        add(row - 1, col);
    if (row + 1 < side)
        add(row + 1, col);
    if (col > 0)
        add(row, col - 1);
    if (col + 1 < side)
        add(row, col + 1);

    std::sort(neighbours.begin(), neighbours.end());
    return neighbours;
}

NeighbourIndices mesh3d(size_t n, size_t idx)
{
    size_t side = gridSide(n, 3);
    size_t layer_size = side * side;
    size_t layer = idx / layer_size;
    size_t row = (idx % layer_size) / side;
    size_t col = idx % side;

    NeighbourIndices neighbours;
    auto add = [&neighbours, n, side, layer_size](size_t l, size_t r, size_t c) {
        size_t i = l * layer_size + r * side + c;
        if (i < n)
            neighbours.push_back(i);
    };
    if (row > 0)
        add(layer, row - 1, col);
    if (row + 1 < side)
        add(layer, row + 1, col);
    if (col > 0)
        add(layer, row, col - 1);
    if (col + 1 < side)
        add(layer, row, col + 1);
    if (layer > 0)
        add(layer - 1, row, col);
    if (layer + 1 < side)
        add(layer + 1, row, col);

    std::sort(neighbours.begin(), neighbours.end());
    return neighbours;
}

NeighbourIndices fullyConnected(size_t n, size_t idx)
{
    NeighbourIndices neighbours;
    for (size_t i = 0; i < n; ++i)
    {
        if (i != idx)
            neighbours.push_back(i);
    }
    return neighbours;
}

NeighbourIndices star(size_t n, size_t idx)
{
    if (idx == 0)
        return fullyConnected(n, 0);
    return {0};
}

TopologyFunction fromMap(const std::map<size_t, NeighbourIndices> &adjacency)
{
    size_t n = adjacency.size();
    // std::map keys are sorted, so keys 0..n-1 means the last key is n-1.
    if (n == 0 || adjacency.rbegin()->first != n - 1)
    {
        throw InvalidTopologyError("expected the topology map keys to be exactly 0.." +
                                   (n == 0 ? std::string("n-1, got an empty map") : std::to_string(n - 1)));
    }
    for (auto &[idx, neighbours] : adjacency)
    {
        for (size_t neighbour : neighbours)
        {
            if (neighbour >= n)
            {
                throw InvalidTopologyError("neighbour " + std::to_string(neighbour) + " of population " +
                                           std::to_string(idx) + " is out of range [0, " + std::to_string(n - 1) +
                                           "]");
            }
        }
    }

    return [adjacency, n](size_t num_populations, size_t idx) {
        if (num_populations != n)
        {
            throw InvalidTopologyError("topology map describes " + std::to_string(n) + " populations, but " +
                                       std::to_string(num_populations) + " are running");
        }
        return adjacency.at(idx);
    };
}
} // namespace topology
