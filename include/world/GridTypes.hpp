/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GRID_TYPES_HPP
#define GRID_TYPES_HPP

#include <array>
#include <cstdint>
#include <cstdlib>
#include <ostream>

#include <boost/container/flat_map.hpp>

namespace GridAgents {

// Cardinal directions. Values index a cell's neighbour slots.
enum class Direction : int8_t {
    Nowhere = -1,
    North = 0,
    East = 1,
    South = 2,
    West = 3
};

constexpr int DIRECTION_COUNT = 4;

// Fixed priority order used wherever a deterministic choice is needed
constexpr std::array<Direction, DIRECTION_COUNT> CARDINAL_DIRECTIONS{
    Direction::North, Direction::East, Direction::South, Direction::West};

inline constexpr bool isCardinal(Direction d) {
    const int v = static_cast<int>(d);
    return v >= 0 && v < DIRECTION_COUNT;
}

inline constexpr int directionIndex(Direction d) {
    return static_cast<int>(d);
}

inline constexpr Direction opposite(Direction d) {
    switch (d) {
        case Direction::North: return Direction::South;
        case Direction::East: return Direction::West;
        case Direction::South: return Direction::North;
        case Direction::West: return Direction::East;
        default: return Direction::Nowhere;
    }
}

// Stream operator for test output
inline std::ostream& operator<<(std::ostream& os, const Direction& direction) {
    switch (direction) {
        case Direction::Nowhere: return os << "Nowhere";
        case Direction::North: return os << "North";
        case Direction::East: return os << "East";
        case Direction::South: return os << "South";
        case Direction::West: return os << "West";
        default: return os << "Direction(" << static_cast<int>(direction) << ")";
    }
}

/**
 * @brief Integer grid coordinate. x grows East, y grows South.
 */
struct GridCoord {
    int x{0};
    int y{0};

    constexpr GridCoord() = default;
    constexpr GridCoord(int px, int py) : x(px), y(py) {}

    constexpr bool operator==(const GridCoord&) const = default;

    // Row-major ordering so flat containers iterate the way the grid is laid out
    constexpr bool operator<(const GridCoord& other) const {
        return y != other.y ? y < other.y : x < other.x;
    }

    constexpr GridCoord offset(Direction d) const {
        switch (d) {
            case Direction::North: return {x, y - 1};
            case Direction::East: return {x + 1, y};
            case Direction::South: return {x, y + 1};
            case Direction::West: return {x - 1, y};
            default: return *this;
        }
    }

    // Chebyshev distance, used for the adjacency check on occupation
    int chebyshev(const GridCoord& other) const {
        const int dx = std::abs(x - other.x);
        const int dy = std::abs(y - other.y);
        return dx > dy ? dx : dy;
    }
};

inline std::ostream& operator<<(std::ostream& os, const GridCoord& c) {
    return os << "(" << c.x << "," << c.y << ")";
}

// Per-coordinate integer tables (capacity overrides, initial occupant counts)
using CoordIntMap = boost::container::flat_map<GridCoord, int>;
using CapacityMap = CoordIntMap;
using OccupantCountMap = CoordIntMap;

} // namespace GridAgents

#endif // GRID_TYPES_HPP
