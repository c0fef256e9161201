/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CELL_HPP
#define CELL_HPP

#include "world/GridObject.hpp"
#include "world/GridTypes.hpp"
#include <array>
#include <optional>
#include <string>
#include <boost/container/small_vector.hpp>

namespace GridAgents {

class World;

// Most cells hold one or two occupants; avoid a heap allocation for those
using OccupantList = boost::container::small_vector<GridObjectPtr, 2>;

/**
 * @brief A single addressable grid location with a capacity and occupants.
 *
 * A cell with capacity 0 is a wall: it can never be occupied and the grid
 * never links to it. The four neighbour slots are fixed; an empty slot
 * means there is no edge in that direction.
 *
 * Occupants are only changed through the owning World (placeOccupant /
 * removeOccupant) or through movement resolution (occupy / vacate).
 */
class Cell {
public:
    Cell(const World* owner, int x, int y, int capacity);

    Cell(const Cell&) = delete;
    Cell& operator=(const Cell&) = delete;
    Cell(Cell&&) = default;
    Cell& operator=(Cell&&) = delete;

    int x() const { return m_coord.x; }
    int y() const { return m_coord.y; }
    GridCoord coord() const { return m_coord; }
    int capacity() const { return m_capacity; }

    const OccupantList& occupants() const { return m_occupants; }
    bool isOccupied() const { return static_cast<int>(m_occupants.size()) >= m_capacity; }
    bool contains(const GridObject& object) const;

    // Agents may tag cells (numbers, colours, any text)
    const std::optional<std::string>& label() const { return m_label; }
    void setLabel(std::string newLabel) { m_label = std::move(newLabel); }
    void clearLabel() { m_label.reset(); }

    /**
     * @brief Links a neighbour in the given direction.
     * @throws InvalidDirection if @p direction is not a cardinal direction
     * @throws CorruptTopology if @p neighbour is not the orthogonally adjacent
     *         cell in that direction
     */
    void addNeighbour(Direction direction, Cell* neighbour);

    Cell* neighbour(Direction direction) const;

    /**
     * @brief World-mediated placement. Fails (no state change) when the
     *        requester is not the owning world or the cell is full.
     */
    bool placeOccupant(const World* requester, GridObjectPtr occupant);

    /**
     * @brief World-mediated removal.
     * @return the removed occupant, or nullptr if the requester does not own
     *         this cell or the occupant is not here
     */
    GridObjectPtr removeOccupant(const World* requester, const GridObject& occupant);

    /**
     * @brief Entry side of a move. Only accepts occupants arriving from an
     *        adjacent cell (Chebyshev distance <= 1) while below capacity.
     * @return this cell on success, nullptr if refused
     */
    Cell* occupy(GridObjectPtr occupant, GridCoord origin);

    /**
     * @brief Exit side of a move.
     *
     * Without a direction the occupant leaves the grid and nullptr is
     * returned. With a direction the occupant moves to that neighbour if it
     * exists and accepts it; otherwise it stays here and this cell is
     * returned. The occupant is only removed here after the neighbour has
     * accepted it, so it is always in exactly one of the two cells.
     *
     * @return the cell now holding the occupant, or nullptr if it left the
     *         grid or was never here
     */
    Cell* vacate(const GridObject& occupant, std::optional<Direction> direction = std::nullopt);

    // true iff a neighbour exists in that direction and has room
    bool canGo(Direction direction) const;

private:
    OccupantList::iterator find(const GridObject& object);

    const World* m_owner;
    GridCoord m_coord;
    int m_capacity;
    OccupantList m_occupants;
    std::optional<std::string> m_label;
    std::array<Cell*, DIRECTION_COUNT> m_neighbours{};
};

} // namespace GridAgents

#endif // CELL_HPP
