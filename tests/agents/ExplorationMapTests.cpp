/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ExplorationMapTests
#include <boost/test/unit_test.hpp>

#include "agents/ExplorationMap.hpp"
#include "core/Logger.hpp"

using namespace GridAgents;

struct MapFixture {
    MapFixture() { GRIDAGENTS_ENABLE_QUIET_MODE(); }
    ~MapFixture() { GRIDAGENTS_DISABLE_QUIET_MODE(); }

    // Straight corridor (0,0) - (1,0) - ... - (length-1,0), unit edges
    static ExplorationMap corridor(int length) {
        ExplorationMap map;
        for (int x = 0; x + 1 < length; ++x) {
            map.addEdge(GridCoord(x, 0), GridCoord(x + 1, 0), 1);
        }
        return map;
    }

    // T junction: a row of five with a three-cell stem down from the middle
    static ExplorationMap junction() {
        ExplorationMap map = corridor(5);
        map.addEdge(GridCoord(2, 0), GridCoord(2, 1), 1);
        map.addEdge(GridCoord(2, 1), GridCoord(2, 2), 1);
        map.addEdge(GridCoord(2, 2), GridCoord(2, 3), 1);
        return map;
    }
};

BOOST_FIXTURE_TEST_SUITE(ExplorationMapEdgeTests, MapFixture)

BOOST_AUTO_TEST_CASE(TestEmptyMap) {
    ExplorationMap map;
    BOOST_CHECK(map.empty());
    BOOST_CHECK_EQUAL(map.nodeCount(), 0u);
    BOOST_CHECK_EQUAL(map.edgeCount(), 0u);
    BOOST_CHECK(map.edgesFrom(GridCoord(0, 0)) == nullptr);
    BOOST_CHECK(!map.shortestDistance(GridCoord(0, 0), GridCoord(1, 0)).has_value());
    BOOST_CHECK_EQUAL(map.prune(), 0u);
}

BOOST_AUTO_TEST_CASE(TestEdgesAreUndirected) {
    ExplorationMap map;
    map.addEdge(GridCoord(0, 0), GridCoord(0, 1), 3);

    BOOST_CHECK_EQUAL(map.nodeCount(), 2u);
    BOOST_CHECK_EQUAL(map.edgeCount(), 1u);
    BOOST_CHECK_EQUAL(*map.edgeDistance(GridCoord(0, 0), GridCoord(0, 1)), 3);
    BOOST_CHECK_EQUAL(*map.edgeDistance(GridCoord(0, 1), GridCoord(0, 0)), 3);
}

BOOST_AUTO_TEST_CASE(TestEdgeKeepsShortestDistance) {
    ExplorationMap map;
    map.addEdge(GridCoord(0, 0), GridCoord(1, 0), 4);
    map.addEdge(GridCoord(1, 0), GridCoord(0, 0), 2);
    map.addEdge(GridCoord(0, 0), GridCoord(1, 0), 7);

    BOOST_CHECK_EQUAL(map.edgeCount(), 1u);
    BOOST_CHECK_EQUAL(*map.edgeDistance(GridCoord(0, 0), GridCoord(1, 0)), 2);
    BOOST_CHECK_EQUAL(*map.edgeDistance(GridCoord(1, 0), GridCoord(0, 0)), 2);
}

BOOST_AUTO_TEST_CASE(TestSelfLoopsIgnored) {
    ExplorationMap map;
    map.addEdge(GridCoord(2, 2), GridCoord(2, 2), 1);
    BOOST_CHECK(map.empty());
}

BOOST_AUTO_TEST_CASE(TestAddNodeKeepsEdges) {
    ExplorationMap map = corridor(3);
    map.addNode(GridCoord(1, 0));
    BOOST_CHECK_EQUAL(map.degree(GridCoord(1, 0)), 2u);

    map.addNode(GridCoord(5, 5));
    BOOST_CHECK(map.contains(GridCoord(5, 5)));
    BOOST_CHECK_EQUAL(map.degree(GridCoord(5, 5)), 0u);
}

BOOST_AUTO_TEST_CASE(TestRemoveNode) {
    ExplorationMap map = corridor(3);
    BOOST_CHECK(map.removeNode(GridCoord(1, 0)));
    BOOST_CHECK(!map.contains(GridCoord(1, 0)));
    BOOST_CHECK_EQUAL(map.degree(GridCoord(0, 0)), 0u);
    BOOST_CHECK_EQUAL(map.degree(GridCoord(2, 0)), 0u);
    BOOST_CHECK(!map.removeNode(GridCoord(1, 0)));
}

BOOST_AUTO_TEST_CASE(TestShortestDistance) {
    ExplorationMap map = junction();
    BOOST_CHECK_EQUAL(*map.shortestDistance(GridCoord(0, 0), GridCoord(4, 0)), 4);
    BOOST_CHECK_EQUAL(*map.shortestDistance(GridCoord(0, 0), GridCoord(2, 3)), 5);
    BOOST_CHECK_EQUAL(*map.shortestDistance(GridCoord(2, 0), GridCoord(2, 0)), 0);

    map.addNode(GridCoord(9, 9));
    BOOST_CHECK(!map.shortestDistance(GridCoord(0, 0), GridCoord(9, 9)).has_value());
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// CORRIDOR PRUNING
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(ExplorationMapPruneTests, MapFixture)

BOOST_AUTO_TEST_CASE(TestCorridorCollapsesToEndpoints) {
    ExplorationMap map = corridor(5);
    BOOST_CHECK_EQUAL(map.prune(), 3u);

    BOOST_CHECK_EQUAL(map.nodeCount(), 2u);
    BOOST_CHECK_EQUAL(map.edgeCount(), 1u);
    BOOST_CHECK_EQUAL(*map.edgeDistance(GridCoord(0, 0), GridCoord(4, 0)), 4);
}

BOOST_AUTO_TEST_CASE(TestJunctionKeepsDecisionPoints) {
    ExplorationMap map = junction();
    map.prune();

    // dead ends and the branch survive, everything in between goes
    BOOST_CHECK_EQUAL(map.nodeCount(), 4u);
    BOOST_CHECK(map.contains(GridCoord(0, 0)));
    BOOST_CHECK(map.contains(GridCoord(4, 0)));
    BOOST_CHECK(map.contains(GridCoord(2, 3)));
    BOOST_CHECK(map.contains(GridCoord(2, 0)));
    BOOST_CHECK_EQUAL(map.degree(GridCoord(2, 0)), 3u);

    BOOST_CHECK_EQUAL(*map.edgeDistance(GridCoord(2, 0), GridCoord(0, 0)), 2);
    BOOST_CHECK_EQUAL(*map.edgeDistance(GridCoord(2, 0), GridCoord(4, 0)), 2);
    BOOST_CHECK_EQUAL(*map.edgeDistance(GridCoord(2, 0), GridCoord(2, 3)), 3);

    for (const auto& [node, edges] : map.nodes()) {
        BOOST_CHECK_NE(edges.size(), 2u);
    }
}

BOOST_AUTO_TEST_CASE(TestPruneIsIdempotent) {
    ExplorationMap map = junction();
    map.prune();
    const ExplorationMap once = map;

    BOOST_CHECK_EQUAL(map.prune(), 0u);
    BOOST_CHECK(map == once);
}

BOOST_AUTO_TEST_CASE(TestPrunePreservesDistancesBetweenSurvivors) {
    // ring of eight around (1,1) with a spur hanging off (2,0)
    ExplorationMap map;
    const GridCoord ring[] = {{0, 0}, {1, 0}, {2, 0}, {2, 1}, {2, 2}, {1, 2}, {0, 2}, {0, 1}};
    for (size_t i = 0; i < 8; ++i) {
        map.addEdge(ring[i], ring[(i + 1) % 8], 1);
    }
    map.addEdge(GridCoord(2, 0), GridCoord(3, 0), 1);
    map.addEdge(GridCoord(3, 0), GridCoord(4, 0), 1);

    const ExplorationMap before = map;
    map.prune();

    // the loop folds away, the dead end stays
    BOOST_CHECK_LT(map.nodeCount(), before.nodeCount());
    BOOST_REQUIRE(map.contains(GridCoord(4, 0)));
    for (const auto& [a, edgesA] : map.nodes()) {
        for (const auto& [b, edgesB] : map.nodes()) {
            BOOST_CHECK_EQUAL(*map.shortestDistance(a, b), *before.shortestDistance(a, b));
        }
    }
}

BOOST_AUTO_TEST_CASE(TestPinnedNodesSurvive) {
    ExplorationMap map = corridor(5);
    const CoordSet pinned{GridCoord(2, 0)};
    BOOST_CHECK_EQUAL(map.prune(pinned), 2u);

    BOOST_CHECK(map.contains(GridCoord(2, 0)));
    BOOST_CHECK_EQUAL(*map.edgeDistance(GridCoord(0, 0), GridCoord(2, 0)), 2);
    BOOST_CHECK_EQUAL(*map.edgeDistance(GridCoord(2, 0), GridCoord(4, 0)), 2);
}

BOOST_AUTO_TEST_CASE(TestParallelPathsKeepShorter) {
    // two routes from (0,0) to (2,0): direct length 2, detour length 4.
    // Both ends carry two spurs so they stay branch points.
    ExplorationMap map = corridor(3);
    map.addEdge(GridCoord(0, 0), GridCoord(0, -1), 1);
    map.addEdge(GridCoord(2, 0), GridCoord(2, -1), 1);
    map.addEdge(GridCoord(0, 0), GridCoord(0, 1), 1);
    map.addEdge(GridCoord(0, 1), GridCoord(1, 1), 1);
    map.addEdge(GridCoord(1, 1), GridCoord(2, 1), 1);
    map.addEdge(GridCoord(2, 1), GridCoord(2, 0), 1);
    map.addEdge(GridCoord(2, 0), GridCoord(3, 0), 1);
    map.addEdge(GridCoord(0, 0), GridCoord(-1, 0), 1);

    map.prune();
    BOOST_CHECK_EQUAL(map.degree(GridCoord(0, 0)), 3u);
    BOOST_CHECK_EQUAL(map.degree(GridCoord(2, 0)), 3u);
    BOOST_CHECK_EQUAL(*map.shortestDistance(GridCoord(0, 0), GridCoord(2, 0)), 2);
    BOOST_CHECK_EQUAL(*map.edgeDistance(GridCoord(0, 0), GridCoord(2, 0)), 2);
}

BOOST_AUTO_TEST_SUITE_END()
