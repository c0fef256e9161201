/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/Grid.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>
#include <stdexcept>

namespace GridAgents {

Grid::Grid(const World* owner, int height, int width,
           const CapacityMap& capacities, int defaultCapacity)
    : m_width(width), m_height(height) {

    if (m_width <= 0 || m_height <= 0) {
        throw std::invalid_argument(std::format("Grid dimensions must be positive: {}x{}",
                                                width, height));
    }
    if (defaultCapacity < 0) {
        throw std::invalid_argument(std::format("Grid default capacity must not be negative: {}",
                                                defaultCapacity));
    }

    m_cells.reserve(static_cast<size_t>(m_width) * static_cast<size_t>(m_height));
    for (int y = 0; y < m_height; ++y) {
        for (int x = 0; x < m_width; ++x) {
            auto it = capacities.find(GridCoord(x, y));
            const int capacity = (it != capacities.end()) ? it->second : defaultCapacity;
            m_cells.emplace_back(owner, x, y, capacity);
        }
    }

    for (const auto& [coord, capacity] : capacities) {
        if (!inBounds(coord)) {
            GRID_WARN(std::format("Ignoring capacity override outside the grid at ({},{})",
                                  coord.x, coord.y));
        }
    }

    buildAdjacency();

    GRID_DEBUG(std::format("Built {}x{} grid with {} open cells", m_width, m_height,
                           openCellCount()));
}

void Grid::buildAdjacency() {
    for (int y = 0; y < m_height; ++y) {
        for (int x = 0; x < m_width; ++x) {
            Cell* cell = at(x, y);
            for (Direction d : CARDINAL_DIRECTIONS) {
                Cell* next = at(cell->coord().offset(d));
                // capacity-0 cells are never a destination
                if (next != nullptr && next->capacity() > 0) {
                    cell->addNeighbour(d, next);
                }
            }
        }
    }
}

Cell* Grid::at(int x, int y) {
    if (!inBounds(x, y)) {
        return nullptr;
    }
    return &m_cells[static_cast<size_t>(y) * static_cast<size_t>(m_width) + static_cast<size_t>(x)];
}

const Cell* Grid::at(int x, int y) const {
    if (!inBounds(x, y)) {
        return nullptr;
    }
    return &m_cells[static_cast<size_t>(y) * static_cast<size_t>(m_width) + static_cast<size_t>(x)];
}

size_t Grid::openCellCount() const {
    return static_cast<size_t>(std::count_if(m_cells.begin(), m_cells.end(),
                                             [](const Cell& c) { return c.capacity() > 0; }));
}

} // namespace GridAgents
