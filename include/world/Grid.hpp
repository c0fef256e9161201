/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GRID_HPP
#define GRID_HPP

#include "world/Cell.hpp"
#include "world/GridTypes.hpp"
#include <vector>

namespace GridAgents {

class World;

/**
 * @brief Rectangular array of cells with a 4-connected adjacency graph.
 *
 * Dimensions and adjacency are fixed at construction. An edge into a cell
 * exists only if that cell's capacity is greater than zero, so walls are
 * unreachable from every side. Cells are stored row-major and never move,
 * which keeps neighbour pointers valid for the grid's lifetime.
 */
class Grid {
public:
    /**
     * @param owner World allowed to place and remove occupants (may be null
     *        for a standalone topology)
     * @param capacities per-coordinate overrides; coordinates outside the
     *        grid are ignored
     * @throws std::invalid_argument on non-positive dimensions or negative
     *         capacities
     */
    Grid(const World* owner, int height, int width,
         const CapacityMap& capacities = {}, int defaultCapacity = 1);

    Grid(const Grid&) = delete;
    Grid& operator=(const Grid&) = delete;

    int getWidth() const { return m_width; }
    int getHeight() const { return m_height; }

    bool inBounds(int x, int y) const { return x >= 0 && y >= 0 && x < m_width && y < m_height; }
    bool inBounds(GridCoord c) const { return inBounds(c.x, c.y); }

    Cell* at(int x, int y);
    const Cell* at(int x, int y) const;
    Cell* at(GridCoord c) { return at(c.x, c.y); }
    const Cell* at(GridCoord c) const { return at(c.x, c.y); }

    const std::vector<Cell>& cells() const { return m_cells; }

    // Cells that can ever hold an occupant
    size_t openCellCount() const;

private:
    void buildAdjacency();

    int m_width;
    int m_height;
    std::vector<Cell> m_cells;
};

} // namespace GridAgents

#endif // GRID_HPP
