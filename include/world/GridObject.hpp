/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GRID_OBJECT_HPP
#define GRID_OBJECT_HPP

#include "utils/UniqueID.hpp"
#include "world/GridTypes.hpp"
#include <memory>
#include <string>

namespace GridAgents {

class World;
class GridObject;

// Smart pointer type aliases
using GridObjectPtr = std::shared_ptr<GridObject>;
using GridObjectWeakPtr = std::weak_ptr<GridObject>;

/**
 * @brief Base class for anything that can sit in a grid cell.
 *
 * Name and ID are fixed at construction. The embedding world can be set
 * once; after that the object belongs to that world and attempts to embed
 * it elsewhere are rejected. Position is the object's own belief and is
 * only updated from observations or explicit placement.
 */
class GridObject : public std::enable_shared_from_this<GridObject> {
public:
    using IDType = UniqueID::IDType;

    explicit GridObject(std::string name, const World* world = nullptr,
                        int x = 0, int y = 0);

    // Caller-supplied ID. Uniqueness is the caller's responsibility.
    GridObject(std::string name, IDType id, const World* world = nullptr,
               int x = 0, int y = 0);

    virtual ~GridObject() = default;

    GridObject(const GridObject&) = delete;
    GridObject& operator=(const GridObject&) = delete;

    const std::string& objectName() const { return m_name; }
    IDType objectID() const { return m_id; }
    const World* world() const { return m_world; }

    int x() const { return m_position.x; }
    int y() const { return m_position.y; }
    GridCoord position() const { return m_position; }

    // Static objects occupy space but never act
    virtual bool isStatic() const { return true; }

    /**
     * @brief Embeds the object in a world.
     * @return true if the object is now embedded in @p world, false if it
     *         already belongs to a different world
     */
    bool embed(const World& world);

    /**
     * @brief Embeds (if needed) and sets the believed position.
     * @return false if the object belongs to a different world
     */
    bool place(const World& world, int x, int y);

protected:
    void setPosition(GridCoord position) { m_position = position; }

private:
    const std::string m_name;
    const IDType m_id;
    const World* m_world{nullptr};
    GridCoord m_position;
};

/**
 * @brief Static filler that takes up cell capacity (initial occupant counts).
 */
class Obstacle : public GridObject {
public:
    explicit Obstacle(const World* world = nullptr, int x = 0, int y = 0)
        : GridObject("obstacle", world, x, y) {}
};

} // namespace GridAgents

#endif // GRID_OBJECT_HPP
