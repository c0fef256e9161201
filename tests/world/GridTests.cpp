/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE GridTests
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"
#include "world/Grid.hpp"
#include <stdexcept>

using namespace GridAgents;

struct QuietFixture {
    QuietFixture() { GRIDAGENTS_ENABLE_QUIET_MODE(); }
    ~QuietFixture() { GRIDAGENTS_DISABLE_QUIET_MODE(); }
};

BOOST_FIXTURE_TEST_SUITE(GridConstructionTests, QuietFixture)

BOOST_AUTO_TEST_CASE(TestDimensionsAndCoordinates) {
    Grid grid(nullptr, 3, 5);
    BOOST_CHECK_EQUAL(grid.getHeight(), 3);
    BOOST_CHECK_EQUAL(grid.getWidth(), 5);
    BOOST_CHECK_EQUAL(grid.cells().size(), 15u);

    for (int y = 0; y < 3; ++y) {
        for (int x = 0; x < 5; ++x) {
            const Cell* cell = grid.at(x, y);
            BOOST_REQUIRE(cell != nullptr);
            BOOST_CHECK_EQUAL(cell->coord(), GridCoord(x, y));
            BOOST_CHECK_EQUAL(cell->capacity(), 1);
        }
    }
}

BOOST_AUTO_TEST_CASE(TestOutOfBoundsLookup) {
    Grid grid(nullptr, 2, 2);
    BOOST_CHECK(grid.at(-1, 0) == nullptr);
    BOOST_CHECK(grid.at(0, -1) == nullptr);
    BOOST_CHECK(grid.at(2, 0) == nullptr);
    BOOST_CHECK(grid.at(0, 2) == nullptr);
    BOOST_CHECK(!grid.inBounds(GridCoord(2, 2)));
    BOOST_CHECK(grid.inBounds(GridCoord(1, 1)));
}

BOOST_AUTO_TEST_CASE(TestInvalidConstruction) {
    BOOST_CHECK_THROW(Grid(nullptr, 0, 5), std::invalid_argument);
    BOOST_CHECK_THROW(Grid(nullptr, 5, -1), std::invalid_argument);
    BOOST_CHECK_THROW(Grid(nullptr, 2, 2, {}, -1), std::invalid_argument);

    CapacityMap negative{{GridCoord(0, 0), -3}};
    BOOST_CHECK_THROW(Grid(nullptr, 2, 2, negative), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestCapacityOverrides) {
    CapacityMap capacities{{GridCoord(1, 1), 3}, {GridCoord(0, 1), 0}, {GridCoord(9, 9), 2}};
    Grid grid(nullptr, 2, 2, capacities, 2);

    BOOST_CHECK_EQUAL(grid.at(0, 0)->capacity(), 2);
    BOOST_CHECK_EQUAL(grid.at(1, 1)->capacity(), 3);
    BOOST_CHECK_EQUAL(grid.at(0, 1)->capacity(), 0);
    BOOST_CHECK_EQUAL(grid.openCellCount(), 3u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(AdjacencyTests, QuietFixture)

BOOST_AUTO_TEST_CASE(TestOpenGridAdjacency) {
    Grid grid(nullptr, 3, 3);

    const Cell* centre = grid.at(1, 1);
    BOOST_CHECK(centre->neighbour(Direction::North) == grid.at(1, 0));
    BOOST_CHECK(centre->neighbour(Direction::East) == grid.at(2, 1));
    BOOST_CHECK(centre->neighbour(Direction::South) == grid.at(1, 2));
    BOOST_CHECK(centre->neighbour(Direction::West) == grid.at(0, 1));

    const Cell* corner = grid.at(0, 0);
    BOOST_CHECK(corner->neighbour(Direction::North) == nullptr);
    BOOST_CHECK(corner->neighbour(Direction::West) == nullptr);
    BOOST_CHECK(corner->neighbour(Direction::East) == grid.at(1, 0));
    BOOST_CHECK(corner->neighbour(Direction::South) == grid.at(0, 1));
}

BOOST_AUTO_TEST_CASE(TestAdjacencyIsSymmetric) {
    CapacityMap capacities{{GridCoord(2, 1), 0}, {GridCoord(0, 3), 2}};
    Grid grid(nullptr, 4, 4, capacities);

    for (const Cell& cell : grid.cells()) {
        for (Direction d : CARDINAL_DIRECTIONS) {
            const Cell* next = cell.neighbour(d);
            if (next != nullptr && cell.capacity() > 0) {
                BOOST_CHECK(next->neighbour(opposite(d)) == &cell);
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(TestZeroCapacityCellsAreWalledOff) {
    CapacityMap capacities{{GridCoord(1, 1), 0}};
    Grid grid(nullptr, 3, 3, capacities);
    const Cell* wall = grid.at(1, 1);

    for (const Cell& cell : grid.cells()) {
        for (Direction d : CARDINAL_DIRECTIONS) {
            BOOST_CHECK(cell.neighbour(d) != wall);
        }
    }

    // the wall itself still sees its open neighbours
    BOOST_CHECK(wall->neighbour(Direction::North) == grid.at(1, 0));
    BOOST_CHECK(!grid.at(1, 0)->canGo(Direction::South));
}

BOOST_AUTO_TEST_SUITE_END()
