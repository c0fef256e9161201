/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/Cell.hpp"
#include "world/GridErrors.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>
#include <stdexcept>

namespace GridAgents {

Cell::Cell(const World* owner, int x, int y, int capacity)
    : m_owner(owner), m_coord(x, y), m_capacity(capacity) {
    if (capacity < 0) {
        throw std::invalid_argument(std::format("Cell ({},{}) capacity must not be negative: {}",
                                                x, y, capacity));
    }
}

bool Cell::contains(const GridObject& object) const {
    return std::any_of(m_occupants.begin(), m_occupants.end(),
                       [&object](const GridObjectPtr& o) { return o.get() == &object; });
}

OccupantList::iterator Cell::find(const GridObject& object) {
    return std::find_if(m_occupants.begin(), m_occupants.end(),
                        [&object](const GridObjectPtr& o) { return o.get() == &object; });
}

void Cell::addNeighbour(Direction direction, Cell* neighbour) {
    if (!isCardinal(direction)) {
        throw InvalidDirection(std::format("Neighbour index {} is out of range for cell ({},{})",
                                           static_cast<int>(direction), m_coord.x, m_coord.y));
    }
    if (neighbour != nullptr &&
        (neighbour == this || neighbour->coord() != m_coord.offset(direction))) {
        throw CorruptTopology(std::format("Cell ({},{}) cannot link ({},{}) as its {} neighbour",
                                          m_coord.x, m_coord.y, neighbour->x(), neighbour->y(),
                                          static_cast<int>(direction)));
    }
    m_neighbours[static_cast<size_t>(directionIndex(direction))] = neighbour;
}

Cell* Cell::neighbour(Direction direction) const {
    if (!isCardinal(direction)) {
        return nullptr;
    }
    return m_neighbours[static_cast<size_t>(directionIndex(direction))];
}

bool Cell::placeOccupant(const World* requester, GridObjectPtr occupant) {
    if (requester != m_owner || !occupant || isOccupied()) {
        return false;
    }
    m_occupants.push_back(std::move(occupant));
    return true;
}

GridObjectPtr Cell::removeOccupant(const World* requester, const GridObject& occupant) {
    if (requester != m_owner) {
        return nullptr;
    }
    auto it = find(occupant);
    if (it == m_occupants.end()) {
        return nullptr;
    }
    GridObjectPtr removed = std::move(*it);
    m_occupants.erase(it);
    return removed;
}

Cell* Cell::occupy(GridObjectPtr occupant, GridCoord origin) {
    // can only occupy from an adjacent cell
    if (!occupant || origin.chebyshev(m_coord) > 1) {
        return nullptr;
    }
    if (isOccupied()) {
        return nullptr;
    }
    m_occupants.push_back(std::move(occupant));
    return this;
}

Cell* Cell::vacate(const GridObject& occupant, std::optional<Direction> direction) {
    auto it = find(occupant);
    if (it == m_occupants.end()) {
        GRID_ERROR(std::format("No occupant '{}' ({}) in cell ({},{})",
                               occupant.objectName(), occupant.objectID(), m_coord.x, m_coord.y));
        return nullptr;
    }

    // leaving the grid entirely
    if (!direction.has_value()) {
        m_occupants.erase(it);
        return nullptr;
    }

    Cell* next = neighbour(*direction);
    if (next == nullptr || next->isOccupied()) {
        return this;
    }

    // Hand over first; only drop our copy once the neighbour has it
    if (next->occupy(*it, m_coord) == nullptr) {
        return this;
    }
    m_occupants.erase(it);
    return next;
}

bool Cell::canGo(Direction direction) const {
    const Cell* next = neighbour(direction);
    return next != nullptr && !next->isOccupied();
}

} // namespace GridAgents
