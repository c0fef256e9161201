/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "config/Layouts.hpp"
#include <array>

namespace GridAgents {

namespace {

void addColumn(std::vector<GridCoord>& walls, int x, int yBegin, int yEnd) {
    for (int y = yBegin; y < yEnd; ++y) {
        walls.emplace_back(x, y);
    }
}

void addRow(std::vector<GridCoord>& walls, int y, int xBegin, int xEnd) {
    for (int x = xBegin; x < xEnd; ++x) {
        walls.emplace_back(x, y);
    }
}

LayoutDefinition makeOpen() {
    LayoutDefinition layout;
    layout.name = "open";
    layout.start = GridCoord(5, 5);
    return layout;
}

// Two long walls with a short bar between them
LayoutDefinition makeWalls() {
    LayoutDefinition layout;
    layout.name = "walls";
    addColumn(layout.walls, 2, 2, 8);
    addRow(layout.walls, 4, 4, 7);
    addColumn(layout.walls, 8, 2, 8);
    // away from the central bar
    layout.start = GridCoord(5, 7);
    return layout;
}

LayoutDefinition makeRooms() {
    LayoutDefinition layout;
    layout.name = "rooms";
    addRow(layout.walls, 5, 0, 4);
    addColumn(layout.walls, 3, 0, 3);
    addColumn(layout.walls, 5, 7, 10);
    addColumn(layout.walls, 7, 0, 2);
    addRow(layout.walls, 4, 7, 10);
    layout.start = GridCoord(5, 5);
    return layout;
}

LayoutDefinition makeMaze() {
    static constexpr std::array<std::pair<int, int>, 30> MAZE_WALLS{{
        {2, 0}, {7, 0},
        {2, 2}, {3, 2}, {5, 2}, {7, 2},
        {2, 3}, {3, 3}, {5, 3}, {6, 3}, {7, 3}, {9, 3},
        {6, 4}, {7, 4}, {9, 4},
        {2, 5}, {3, 5}, {9, 5},
        {0, 6}, {2, 6}, {4, 6}, {6, 6}, {7, 6}, {8, 6}, {9, 6},
        {4, 7}, {6, 7},
        {3, 8}, {4, 8}, {6, 8},
    }};

    LayoutDefinition layout;
    layout.name = "maze";
    layout.walls.reserve(MAZE_WALLS.size());
    for (const auto& [x, y] : MAZE_WALLS) {
        layout.walls.emplace_back(x, y);
    }
    layout.start = GridCoord(5, 5);
    return layout;
}

} // anonymous namespace

std::optional<LayoutDefinition> findLayout(std::string_view name) {
    if (name == "open") return makeOpen();
    if (name == "walls") return makeWalls();
    if (name == "rooms") return makeRooms();
    if (name == "maze") return makeMaze();
    return std::nullopt;
}

std::vector<std::string> layoutNames() {
    return {"open", "walls", "rooms", "maze"};
}

} // namespace GridAgents
