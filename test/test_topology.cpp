#include <map>

#include <catch2/catch.hpp>

#include "errors.hpp"
#include "topology.hpp"

namespace
{
using Adjacency = std::map<size_t, NeighbourIndices>;

Adjacency adjacencyOf(const TopologyFunction &neighbours_of, size_t n)
{
    Adjacency adjacency;
    for (size_t idx = 0; idx < n; ++idx)
        adjacency[idx] = neighbours_of(n, idx);
    return adjacency;
}
} // namespace

TEST_CASE("Ring topology", "[Topology]")
{
    REQUIRE(adjacencyOf(topology::ring, 5) == Adjacency{{0, {1}}, {1, {2}}, {2, {3}}, {3, {4}}, {4, {0}}});
    REQUIRE(topology::ring(4, 0) == NeighbourIndices{1});
    REQUIRE(topology::ring(4, 3) == NeighbourIndices{0});
    REQUIRE(topology::ring(1, 0) == NeighbourIndices{0});
}

TEST_CASE("Mesh topologies", "[Topology]")
{
    SECTION("A full 3x3 grid")
    {
        REQUIRE(topology::mesh2d(9, 0) == NeighbourIndices{1, 3});
        REQUIRE(topology::mesh2d(9, 4) == NeighbourIndices{1, 3, 5, 7});
        REQUIRE(topology::mesh2d(9, 8) == NeighbourIndices{5, 7});
    }
    SECTION("An incomplete last row leaves out missing populations")
    {
        // Side 3: populations 0 1 2 / 3 4.
        REQUIRE(topology::mesh2d(5, 2) == NeighbourIndices{1});
        REQUIRE(topology::mesh2d(5, 1) == NeighbourIndices{0, 2, 4});
        REQUIRE(topology::mesh2d(5, 4) == NeighbourIndices{1, 3});
    }
    SECTION("Every population of an incomplete grid")
    {
        REQUIRE(adjacencyOf(topology::mesh2d, 5) ==
                Adjacency{{0, {1, 3}}, {1, {0, 2, 4}}, {2, {1}}, {3, {0, 4}}, {4, {1, 3}}});
    }
    SECTION("Every population of a 2x2x2 cube")
    {
        REQUIRE(adjacencyOf(topology::mesh3d, 8) == Adjacency{{0, {1, 2, 4}},
                                                              {1, {0, 3, 5}},
                                                              {2, {0, 3, 6}},
                                                              {3, {1, 2, 7}},
                                                              {4, {0, 5, 6}},
                                                              {5, {1, 4, 7}},
                                                              {6, {2, 4, 7}},
                                                              {7, {3, 5, 6}}});
    }
    SECTION("A 2x2x2 cube")
    {
        REQUIRE(topology::mesh3d(8, 0) == NeighbourIndices{1, 2, 4});
        REQUIRE(topology::mesh3d(8, 7) == NeighbourIndices{3, 5, 6});
    }
    SECTION("The centre of a 3x3x3 cube has six neighbours")
    {
        REQUIRE(topology::mesh3d(27, 13) == NeighbourIndices{4, 10, 12, 14, 16, 22});
    }
}

TEST_CASE("Fully connected and star topologies", "[Topology]")
{
    REQUIRE(topology::fullyConnected(4, 1) == NeighbourIndices{0, 2, 3});
    REQUIRE(topology::fullyConnected(1, 0).empty());
    REQUIRE(topology::star(4, 0) == NeighbourIndices{1, 2, 3});
    REQUIRE(topology::star(4, 2) == NeighbourIndices{0});
    REQUIRE(adjacencyOf(topology::star, 4) == Adjacency{{0, {1, 2, 3}}, {1, {0}}, {2, {0}}, {3, {0}}});
}

TEST_CASE("Topology from an adjacency map", "[Topology]")
{
    SECTION("A valid map is followed exactly")
    {
        auto t = topology::fromMap({{0, {1, 2}}, {1, {}}, {2, {0}}});
        REQUIRE(t(3, 0) == NeighbourIndices{1, 2});
        REQUIRE(t(3, 1).empty());
        REQUIRE(t(3, 2) == NeighbourIndices{0});
    }
    SECTION("Keys must be exactly 0..n-1")
    {
        REQUIRE_THROWS_AS(topology::fromMap({{0, {2}}, {2, {0}}}), InvalidTopologyError);
        REQUIRE_THROWS_AS(topology::fromMap({}), InvalidTopologyError);
    }
    SECTION("Neighbours must be in range")
    {
        REQUIRE_THROWS_AS(topology::fromMap({{0, {1}}, {1, {2}}}), InvalidTopologyError);
    }
    SECTION("A map only applies to the number of populations it describes")
    {
        auto t = topology::fromMap({{0, {1}}, {1, {0}}});
        REQUIRE_THROWS_AS(t(3, 0), InvalidTopologyError);
    }
}
