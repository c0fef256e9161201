/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WORLD_HPP
#define WORLD_HPP

#include "world/Action.hpp"
#include "world/Grid.hpp"
#include "world/GridTypes.hpp"
#include "world/WorldSnapshot.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace GridAgents {

class GridAgent;

/**
 * @brief Owns the grid, the agent roster and the clock.
 *
 * One tick asks every registered agent, in registration order, for an
 * action, resolves it against the grid and feeds the outcome back before
 * the next agent acts. The tick counter advances once all agents are done.
 *
 * Out-of-bounds moves, full cells and missing neighbours are ordinary
 * outcomes: the agent simply observes the cell it is still in.
 *
 * Not thread-safe. Concurrent readers should use snapshots published by
 * the driving loop.
 */
class World {
public:
    // Called between ticks by run(); return false to stop early
    using YieldHandler = std::function<bool(uint64_t tick)>;

    /**
     * @param maxTicks 0 runs without a limit
     * @param updateInterval pacing hint for real-time drivers
     * @param occupants number of static obstacles to place per coordinate
     * @throws std::invalid_argument on bad dimensions, negative capacities,
     *         or occupant counts that do not fit
     */
    World(int height, int width, uint64_t maxTicks = 0,
          std::chrono::milliseconds updateInterval = std::chrono::milliseconds{1000},
          const CapacityMap& capacities = {}, const OccupantCountMap& occupants = {},
          int defaultCapacity = 1);
    ~World();

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    /**
     * @brief Runs one tick of the action protocol.
     * @return false if the maximum tick count has been reached
     */
    bool tick();

    /**
     * @brief Runs @p ticks ticks (0 = until the tick limit or the yield
     *        handler stops it).
     * @return number of ticks executed
     */
    uint64_t run(uint64_t ticks = 0);

    void setYieldHandler(YieldHandler handler) { m_yieldHandler = std::move(handler); }

    uint64_t time() const { return m_time; }
    uint64_t runTime() const { return m_maxTicks; }
    std::chrono::milliseconds updateInterval() const { return m_updateInterval; }
    void reset() { m_time = 0; }

    // (width, height)
    std::pair<int, int> boundary() const { return {m_grid.getWidth(), m_grid.getHeight()}; }

    // nullptr when out of bounds
    const Cell* getLocation(int x, int y) const { return m_grid.at(x, y); }
    const Grid& grid() const { return m_grid; }

    // Places a non-acting object (obstacle, item)
    bool placeOccupant(GridObjectPtr occupant, int x, int y);

    /**
     * @brief Embeds, places and enrols an agent at the end of the roster.
     * @return false if the cell refuses it, the agent belongs to another
     *         world, or it is already registered
     */
    bool registerAgent(std::shared_ptr<GridAgent> agent, int x, int y);

    // Deregisters the agent and takes it off the grid
    bool removeAgent(GridObject::IDType id);

    size_t agentCount() const { return m_agents.size(); }
    std::shared_ptr<GridAgent> getAgent(GridObject::IDType id) const;
    std::optional<GridCoord> agentPosition(GridObject::IDType id) const;
    bool isAgentFaulted(GridObject::IDType id) const;

    /**
     * @brief Resolves one action against the grid.
     * @return monostate for NoAction (or an unknown agent), otherwise the
     *         cell the agent occupies afterwards
     */
    Observation applyAction(const Action& action);

    WorldSnapshot snapshot() const;

private:
    struct AgentRecord {
        GridCoord position;
        std::shared_ptr<GridAgent> agent;
        bool faulted{false};
    };

    AgentRecord* findRecord(const GridObject* agent);
    const AgentRecord* findRecord(GridObject::IDType id) const;
    void placeInitialOccupants(const OccupantCountMap& occupants);

    Grid m_grid;
    uint64_t m_time{0};
    uint64_t m_maxTicks;
    std::chrono::milliseconds m_updateInterval;
    std::vector<AgentRecord> m_agents;
    YieldHandler m_yieldHandler;
};

} // namespace GridAgents

#endif // WORLD_HPP
