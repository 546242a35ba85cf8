//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#pragma once
// Topologies for multi-population algorithms.
//
// A topology is a directed graph in which every population points to its direct neighbours. It is
// represented as a function of the number of populations and the index of a population, so the
// same topology applies regardless of the number of populations.

#include <functional>
#include <map>
#include <vector>

using NeighbourIndices = std::vector<size_t>;
using TopologyFunction = std::function<NeighbourIndices(size_t num_populations, size_t index)>;

namespace topology
{
// Unidirectional ring, the only neighbour is the next population.
NeighbourIndices ring(size_t n, size_t idx);

// Square grid of side ceil(sqrt(n)), filled row by row, the last row may be incomplete.
NeighbourIndices mesh2d(size_t n, size_t idx);

// Cubic grid of side ceil(cbrt(n)), filled layer by layer.
NeighbourIndices mesh3d(size_t n, size_t idx);

NeighbourIndices fullyConnected(size_t n, size_t idx);

// Population 0 is the hub, connected to everyone, every other population only to the hub.
NeighbourIndices star(size_t n, size_t idx);

/**
 * @brief Topology given by an explicit adjacency map.
 *
 * The keys must be exactly 0..n-1 and all neighbours must lie within that range, otherwise
 * InvalidTopologyError is thrown. The resulting topology only applies to n populations.
 */
TopologyFunction fromMap(const std::map<size_t, NeighbourIndices> &adjacency);
} // namespace topology
