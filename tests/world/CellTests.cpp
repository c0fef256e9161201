/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE CellTests
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"
#include "world/Cell.hpp"
#include "world/GridErrors.hpp"
#include "world/World.hpp"
#include <memory>
#include <stdexcept>

using namespace GridAgents;

// ============================================================================
// Test Fixture
// ============================================================================

// Two unowned cells side by side: west (0,0) <-> east (1,0)
class CellPairFixture {
public:
    CellPairFixture()
        : west(nullptr, 0, 0, 1)
        , east(nullptr, 1, 0, 1)
        , mover(std::make_shared<GridObject>("mover"))
        , blocker(std::make_shared<Obstacle>()) {
        GRIDAGENTS_ENABLE_QUIET_MODE();
        west.addNeighbour(Direction::East, &east);
        east.addNeighbour(Direction::West, &west);
    }

    ~CellPairFixture() {
        GRIDAGENTS_DISABLE_QUIET_MODE();
    }

    // Exactly-one-place check used after every move attempt
    int placesHolding(const GridObject& object) const {
        return (west.contains(object) ? 1 : 0) + (east.contains(object) ? 1 : 0);
    }

protected:
    Cell west;
    Cell east;
    GridObjectPtr mover;
    GridObjectPtr blocker;
};

// ============================================================================
// CONSTRUCTION AND TOPOLOGY
// ============================================================================

BOOST_AUTO_TEST_SUITE(TopologyTests)

BOOST_AUTO_TEST_CASE(TestConstruction) {
    Cell cell(nullptr, 3, 4, 2);
    BOOST_CHECK_EQUAL(cell.x(), 3);
    BOOST_CHECK_EQUAL(cell.y(), 4);
    BOOST_CHECK_EQUAL(cell.capacity(), 2);
    BOOST_CHECK(cell.occupants().empty());
    BOOST_CHECK(!cell.isOccupied());
    for (Direction d : CARDINAL_DIRECTIONS) {
        BOOST_CHECK(cell.neighbour(d) == nullptr);
        BOOST_CHECK(!cell.canGo(d));
    }
}

BOOST_AUTO_TEST_CASE(TestNegativeCapacityRejected) {
    BOOST_CHECK_THROW(Cell(nullptr, 0, 0, -1), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestZeroCapacityIsAlwaysFull) {
    Cell cell(nullptr, 0, 0, 0);
    BOOST_CHECK(cell.isOccupied());
    BOOST_CHECK(!cell.placeOccupant(nullptr, std::make_shared<Obstacle>()));
}

BOOST_AUTO_TEST_CASE(TestInvalidDirectionThrows) {
    Cell cell(nullptr, 1, 1, 1);
    Cell north(nullptr, 1, 0, 1);
    BOOST_CHECK_THROW(cell.addNeighbour(static_cast<Direction>(4), &north), InvalidDirection);
    BOOST_CHECK_THROW(cell.addNeighbour(Direction::Nowhere, &north), InvalidDirection);
    // InvalidDirection is an out_of_range
    BOOST_CHECK_THROW(cell.addNeighbour(static_cast<Direction>(7), nullptr), std::out_of_range);
}

BOOST_AUTO_TEST_CASE(TestMalformedNeighbourThrows) {
    Cell cell(nullptr, 1, 1, 1);
    Cell farAway(nullptr, 3, 1, 1);
    Cell south(nullptr, 1, 2, 1);

    BOOST_CHECK_THROW(cell.addNeighbour(Direction::North, &cell), CorruptTopology);
    BOOST_CHECK_THROW(cell.addNeighbour(Direction::East, &farAway), CorruptTopology);
    // right cell, wrong slot
    BOOST_CHECK_THROW(cell.addNeighbour(Direction::North, &south), CorruptTopology);
    BOOST_CHECK(cell.neighbour(Direction::North) == nullptr);

    BOOST_CHECK_NO_THROW(cell.addNeighbour(Direction::South, &south));
    BOOST_CHECK(cell.neighbour(Direction::South) == &south);
}

BOOST_AUTO_TEST_CASE(TestLabels) {
    Cell cell(nullptr, 0, 0, 1);
    BOOST_CHECK(!cell.label().has_value());
    cell.setLabel("visited");
    BOOST_REQUIRE(cell.label().has_value());
    BOOST_CHECK_EQUAL(*cell.label(), "visited");
    cell.clearLabel();
    BOOST_CHECK(!cell.label().has_value());
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// WORLD-MEDIATED PLACEMENT
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(PlacementTests, CellPairFixture)

BOOST_AUTO_TEST_CASE(TestPlaceUntilFull) {
    BOOST_CHECK(west.placeOccupant(nullptr, mover));
    BOOST_CHECK(west.isOccupied());
    BOOST_CHECK(!west.placeOccupant(nullptr, blocker));
    BOOST_CHECK_EQUAL(west.occupants().size(), 1u);
    BOOST_CHECK(west.contains(*mover));
    BOOST_CHECK(!west.contains(*blocker));
}

BOOST_AUTO_TEST_CASE(TestPlaceRejectsForeignRequester) {
    World other(1, 1);
    BOOST_CHECK(!west.placeOccupant(&other, mover));
    BOOST_CHECK(west.occupants().empty());
}

BOOST_AUTO_TEST_CASE(TestPlaceRejectsNull) {
    BOOST_CHECK(!west.placeOccupant(nullptr, nullptr));
    BOOST_CHECK(west.occupants().empty());
}

BOOST_AUTO_TEST_CASE(TestRemoveOccupant) {
    BOOST_REQUIRE(west.placeOccupant(nullptr, mover));

    World other(1, 1);
    BOOST_CHECK(west.removeOccupant(&other, *mover) == nullptr);
    BOOST_CHECK(west.contains(*mover));

    BOOST_CHECK(west.removeOccupant(nullptr, *blocker) == nullptr);

    GridObjectPtr removed = west.removeOccupant(nullptr, *mover);
    BOOST_CHECK(removed == mover);
    BOOST_CHECK(west.occupants().empty());
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// MOVEMENT: OCCUPY AND VACATE
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(MovementTests, CellPairFixture)

BOOST_AUTO_TEST_CASE(TestOccupyRequiresAdjacency) {
    BOOST_CHECK(east.occupy(mover, GridCoord(3, 0)) == nullptr);
    BOOST_CHECK(east.occupants().empty());

    // diagonal still counts as adjacent
    BOOST_CHECK(east.occupy(mover, GridCoord(0, 1)) == &east);
    BOOST_CHECK(east.contains(*mover));
}

BOOST_AUTO_TEST_CASE(TestOccupyRespectsCapacity) {
    BOOST_REQUIRE(east.placeOccupant(nullptr, blocker));
    BOOST_CHECK(east.occupy(mover, west.coord()) == nullptr);
    BOOST_CHECK(!east.contains(*mover));
}

BOOST_AUTO_TEST_CASE(TestVacateMovesExactlyOnce) {
    BOOST_REQUIRE(west.placeOccupant(nullptr, mover));

    Cell* result = west.vacate(*mover, Direction::East);
    BOOST_CHECK(result == &east);
    BOOST_CHECK(east.contains(*mover));
    BOOST_CHECK_EQUAL(placesHolding(*mover), 1);
}

BOOST_AUTO_TEST_CASE(TestVacateIntoFullNeighbourKeepsOccupant) {
    BOOST_REQUIRE(west.placeOccupant(nullptr, mover));
    BOOST_REQUIRE(east.placeOccupant(nullptr, blocker));
    BOOST_CHECK(!west.canGo(Direction::East));

    Cell* result = west.vacate(*mover, Direction::East);
    BOOST_CHECK(result == &west);
    BOOST_CHECK(west.contains(*mover));
    BOOST_CHECK_EQUAL(placesHolding(*mover), 1);
    BOOST_CHECK_EQUAL(east.occupants().size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestVacateWithoutNeighbourReturnsSelf) {
    BOOST_REQUIRE(west.placeOccupant(nullptr, mover));
    for (Direction d : {Direction::North, Direction::South, Direction::West}) {
        BOOST_CHECK(west.vacate(*mover, d) == &west);
        BOOST_CHECK_EQUAL(placesHolding(*mover), 1);
    }
}

BOOST_AUTO_TEST_CASE(TestVacateWithoutDirectionLeavesGrid) {
    BOOST_REQUIRE(west.placeOccupant(nullptr, mover));
    BOOST_CHECK(west.vacate(*mover) == nullptr);
    BOOST_CHECK_EQUAL(placesHolding(*mover), 0);
}

BOOST_AUTO_TEST_CASE(TestVacateMissingOccupant) {
    BOOST_CHECK(west.vacate(*mover, Direction::East) == nullptr);
    BOOST_CHECK(east.occupants().empty());
}

BOOST_AUTO_TEST_CASE(TestCanGo) {
    BOOST_CHECK(west.canGo(Direction::East));
    BOOST_CHECK(!west.canGo(Direction::West));
    BOOST_REQUIRE(east.placeOccupant(nullptr, blocker));
    BOOST_CHECK(!west.canGo(Direction::East));
    BOOST_CHECK(!west.canGo(Direction::Nowhere));
}

BOOST_AUTO_TEST_SUITE_END()
