/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/GridObject.hpp"
#include "core/Logger.hpp"
#include <format>
#include <utility>

namespace GridAgents {

GridObject::GridObject(std::string name, const World* world, int x, int y)
    : GridObject(std::move(name), UniqueID::generate(), world, x, y) {}

GridObject::GridObject(std::string name, IDType id, const World* world, int x, int y)
    : m_name(std::move(name)), m_id(id), m_world(world), m_position(x, y) {}

bool GridObject::embed(const World& world) {
    if (m_world == nullptr) {
        m_world = &world;
        return true;
    }
    if (m_world != &world) {
        WORLD_WARN(std::format("Rejected re-embedding of '{}' ({}) into a different world",
                               m_name, m_id));
        return false;
    }
    return true;
}

bool GridObject::place(const World& world, int x, int y) {
    if (!embed(world)) {
        return false;
    }
    m_position = GridCoord(x, y);
    return true;
}

} // namespace GridAgents
