/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/World.hpp"
#include "agents/GridAgent.hpp"
#include "world/GridErrors.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>
#include <stdexcept>

namespace GridAgents {

World::World(int height, int width, uint64_t maxTicks,
             std::chrono::milliseconds updateInterval,
             const CapacityMap& capacities, const OccupantCountMap& occupants,
             int defaultCapacity)
    : m_grid(this, height, width, capacities, defaultCapacity),
      m_maxTicks(maxTicks),
      m_updateInterval(updateInterval) {
    placeInitialOccupants(occupants);
    WORLD_INFO(std::format("Created {}x{} world (max ticks: {})", width, height, maxTicks));
}

World::~World() = default;

void World::placeInitialOccupants(const OccupantCountMap& occupants) {
    for (const auto& [coord, count] : occupants) {
        Cell* cell = m_grid.at(coord);
        if (cell == nullptr) {
            throw std::invalid_argument(std::format("Initial occupants outside the grid at ({},{})",
                                                    coord.x, coord.y));
        }
        if (count < 0 || count > cell->capacity()) {
            throw std::invalid_argument(std::format(
                "Cell ({},{}) cannot hold {} initial occupants (capacity {})",
                coord.x, coord.y, count, cell->capacity()));
        }
        for (int i = 0; i < count; ++i) {
            if (!cell->placeOccupant(this, std::make_shared<Obstacle>(this, coord.x, coord.y))) {
                throw std::invalid_argument(std::format("Cell ({},{}) refused an initial occupant",
                                                        coord.x, coord.y));
            }
        }
    }
}

bool World::tick() {
    if (m_maxTicks > 0 && m_time >= m_maxTicks) {
        return false;
    }

    // Index loop: the roster is not modified during a tick
    for (size_t i = 0; i < m_agents.size(); ++i) {
        AgentRecord& record = m_agents[i];
        if (record.faulted) {
            continue;
        }

        const Cell* cell = m_grid.at(record.position);
        GridAgent& agent = *record.agent;

        Action action = agent.chooseAction(*this, record.position.x, record.position.y,
                                           cell->occupants());
        if (action.agent() != &agent) {
            WORLD_WARN(std::format("Agent '{}' proposed an action on behalf of another object; ignored",
                                   agent.objectName()));
            action = Action::none(agent);
        }

        const Observation result = applyAction(action);

        try {
            agent.actionResult(result);
        } catch (const UnexpectedObservationType& e) {
            record.faulted = true;
            WORLD_CRITICAL(std::format("Halting agent '{}' ({}): {}", agent.objectName(),
                                       agent.objectID(), e.what()));
        }
    }

    ++m_time;
    WORLD_DEBUG(std::format("Time in the world is now {}", m_time));
    return true;
}

uint64_t World::run(uint64_t ticks) {
    uint64_t executed = 0;
    while ((ticks == 0 || executed < ticks) && tick()) {
        ++executed;
        if (m_yieldHandler && !m_yieldHandler(m_time)) {
            break;
        }
    }
    return executed;
}

Observation World::applyAction(const Action& action) {
    if (action.kind() == ActionKind::NoAction) {
        return std::monostate{};
    }

    AgentRecord* record = findRecord(action.agent());
    if (record == nullptr) {
        WORLD_WARN("Ignoring action from an unregistered agent");
        return std::monostate{};
    }

    Cell* current = m_grid.at(record->position);

    if (action.kind() == ActionKind::Move) {
        const GridCoord destination = record->position.offset(action.direction());
        if (!isCardinal(action.direction()) || !m_grid.inBounds(destination)) {
            return current;
        }

        WORLD_DEBUG(std::format("Moving agent '{}' from ({},{}) {}", record->agent->objectName(),
                                record->position.x, record->position.y,
                                static_cast<int>(action.direction())));

        Cell* resolved = current->vacate(*record->agent, action.direction());
        if (resolved == nullptr) {
            WORLD_ERROR(std::format("Agent '{}' was not found in its cell ({},{})",
                                    record->agent->objectName(), record->position.x,
                                    record->position.y));
            return current;
        }
        record->position = resolved->coord();
        return resolved;
    }

    return std::monostate{};
}

bool World::placeOccupant(GridObjectPtr occupant, int x, int y) {
    Cell* cell = m_grid.at(x, y);
    if (cell == nullptr || !occupant || cell->isOccupied()) {
        return false;
    }
    if (!occupant->place(*this, x, y)) {
        return false;
    }
    return cell->placeOccupant(this, std::move(occupant));
}

bool World::registerAgent(std::shared_ptr<GridAgent> agent, int x, int y) {
    if (!agent) {
        return false;
    }
    if (findRecord(agent->objectID()) != nullptr) {
        WORLD_WARN(std::format("Agent '{}' ({}) is already registered", agent->objectName(),
                               agent->objectID()));
        return false;
    }
    if (agent->world() != nullptr && agent->world() != this) {
        WORLD_WARN(std::format("Agent '{}' belongs to another world", agent->objectName()));
        return false;
    }

    Cell* cell = m_grid.at(x, y);
    if (cell == nullptr || !cell->placeOccupant(this, agent)) {
        WORLD_WARN(std::format("Cell ({},{}) refused agent '{}'", x, y, agent->objectName()));
        return false;
    }

    agent->place(*this, x, y);
    m_agents.push_back(AgentRecord{GridCoord(x, y), agent, false});
    WORLD_INFO(std::format("Registered agent '{}' ({}) at ({},{})", agent->objectName(),
                           agent->objectID(), x, y));
    return true;
}

bool World::removeAgent(GridObject::IDType id) {
    auto it = std::find_if(m_agents.begin(), m_agents.end(),
                           [id](const AgentRecord& r) { return r.agent->objectID() == id; });
    if (it == m_agents.end()) {
        return false;
    }

    Cell* cell = m_grid.at(it->position);
    if (cell == nullptr || !cell->removeOccupant(this, *it->agent)) {
        WORLD_ERROR(std::format("Agent '{}' missing from its cell on removal", it->agent->objectName()));
    }
    m_agents.erase(it);
    return true;
}

std::shared_ptr<GridAgent> World::getAgent(GridObject::IDType id) const {
    const AgentRecord* record = findRecord(id);
    return record ? record->agent : nullptr;
}

std::optional<GridCoord> World::agentPosition(GridObject::IDType id) const {
    const AgentRecord* record = findRecord(id);
    if (record == nullptr) {
        return std::nullopt;
    }
    return record->position;
}

bool World::isAgentFaulted(GridObject::IDType id) const {
    const AgentRecord* record = findRecord(id);
    return record != nullptr && record->faulted;
}

WorldSnapshot World::snapshot() const {
    WorldSnapshot snap;
    snap.tick = m_time;
    snap.agents.reserve(m_agents.size());
    for (const auto& record : m_agents) {
        snap.agents.push_back(AgentSnapshot{record.agent->objectID(), record.agent->objectName(),
                                            record.position.x, record.position.y});
    }
    return snap;
}

World::AgentRecord* World::findRecord(const GridObject* agent) {
    auto it = std::find_if(m_agents.begin(), m_agents.end(),
                           [agent](const AgentRecord& r) { return r.agent.get() == agent; });
    return it != m_agents.end() ? &*it : nullptr;
}

const World::AgentRecord* World::findRecord(GridObject::IDType id) const {
    auto it = std::find_if(m_agents.begin(), m_agents.end(),
                           [id](const AgentRecord& r) { return r.agent->objectID() == id; });
    return it != m_agents.end() ? &*it : nullptr;
}

} // namespace GridAgents
