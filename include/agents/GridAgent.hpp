/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GRID_AGENT_HPP
#define GRID_AGENT_HPP

#include "agents/ExplorationMap.hpp"
#include "world/Action.hpp"
#include "world/Cell.hpp"
#include "world/GridObject.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <random>
#include <string>
#include <vector>
#include <boost/container/flat_map.hpp>

namespace GridAgents {

class World;

enum class ExplorationState : uint8_t {
    Exploring,
    Backtracking,
    Done
};

inline std::ostream& operator<<(std::ostream& os, const ExplorationState& state) {
    switch (state) {
        case ExplorationState::Exploring: return os << "Exploring";
        case ExplorationState::Backtracking: return os << "Backtracking";
        case ExplorationState::Done: return os << "Done";
        default: return os << "UNKNOWN";
    }
}

/**
 * @brief An autonomous agent that maps unknown terrain.
 *
 * The agent only perceives the cell it stands in. Until the map is complete
 * it runs a frontier-driven depth-first exploration: it steps into unvisited
 * neighbours in North, East, South, West order, backtracks along its path
 * when the current cell has nothing left to try, and once nothing is left
 * anywhere it prunes the map down to decision points. After that (or with
 * exploration disabled) it wanders in random directions.
 *
 * Exploration state belongs to the agent alone; the world only ever sees
 * the Action it proposes and hands back an Observation.
 */
class GridAgent : public GridObject {
public:
    explicit GridAgent(std::string name, const World* world = nullptr, int x = 0, int y = 0,
                       uint32_t seed = std::random_device{}());
    GridAgent(std::string name, IDType id, const World* world = nullptr, int x = 0, int y = 0,
              uint32_t seed = std::random_device{}());

    bool isStatic() const override { return false; }

    /**
     * @brief The agent's policy: maps (world, position, visible occupants)
     *        to exactly one action.
     *
     * Returns NoAction when asked to act in a world the agent is not
     * embedded in.
     */
    virtual const Action& chooseAction(const World& world, int x, int y,
                                       const OccupantList& occupants);

    /**
     * @brief Feeds back the outcome of the last chosen action.
     *
     * The believed position is taken from the observed cell, never from the
     * proposal.
     *
     * @throws UnexpectedObservationType if a Move is answered with anything
     *         other than a cell
     */
    virtual void actionResult(const Observation& result);

    const Action& currentAction() const { return m_currentAction; }

    ExplorationState explorationState() const { return m_state; }
    bool isExplorationEnabled() const { return m_explorationEnabled; }
    void setExplorationEnabled(bool enabled) { m_explorationEnabled = enabled; }

    const ExplorationMap& explorationMap() const { return m_map; }
    const CoordSet& frontier() const { return m_frontier; }
    const std::vector<GridCoord>& backtrackStack() const { return m_backtrack; }
    bool inFrontier(GridCoord target) const { return m_frontier.find(target) != m_frontier.end(); }

    // Direction from the believed position to an orthogonally adjacent
    // target, Nowhere for anything else
    Direction getDirection(GridCoord target) const;
    static Direction directionBetween(GridCoord from, GridCoord to);

    // Collapses corridor cells in the map; returns how many were removed
    size_t pruneMap();

    void addOwned(GridObjectPtr object) { m_owned.push_back(std::move(object)); }
    const std::vector<GridObjectPtr>& owned() const { return m_owned; }

private:
    enum class PendingKind : uint8_t { None, Explore, Backtrack, Revisit, Wander };

    struct PendingMove {
        PendingKind kind{PendingKind::None};
        GridCoord origin;
        GridCoord target;
        Direction direction{Direction::Nowhere};
    };

    Action depthFirstExploration(const World& world, GridCoord here, const OccupantList& occupants);
    Action revisitFrontier(const Cell& cell);
    std::optional<GridCoord> stepTowardFrontier(GridCoord here) const;
    Action randomMove();
    void finishExploration();
    void noteOccupants(GridCoord here, const OccupantList& occupants);

    bool isResolved(GridCoord cell, Direction d) const;
    bool isSettled(GridCoord cell) const;
    void markResolved(GridCoord cell, Direction d);

    Action m_currentAction;
    PendingMove m_pending;
    std::vector<GridObjectPtr> m_owned;

    ExplorationState m_state{ExplorationState::Exploring};
    bool m_explorationEnabled{true};
    ExplorationMap m_map;
    CoordSet m_frontier;
    std::vector<GridCoord> m_backtrack;
    // Per visited cell: bit per direction explored or confirmed blocked.
    // A neighbour held by a mobile occupant is never marked.
    boost::container::flat_map<GridCoord, uint8_t> m_resolved;
    // Cells where something else was seen; pruning keeps them
    CoordSet m_landmarks;
    int m_waitTicks{0};

    std::mt19937 m_rng;
};

using GridAgentPtr = std::shared_ptr<GridAgent>;

} // namespace GridAgents

#endif // GRID_AGENT_HPP
