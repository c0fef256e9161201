/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "agents/GridAgent.hpp"
#include "world/GridErrors.hpp"
#include "world/World.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <deque>
#include <format>
#include <utility>

namespace GridAgents {

namespace {
uint8_t directionBit(Direction d) {
    return static_cast<uint8_t>(1u << directionIndex(d));
}

constexpr uint8_t ALL_DIRECTIONS = 0x0F;

// Ticks spent waiting on a blocked frontier cell before moving on
constexpr int PATIENCE_TICKS = 2;

// Static occupants never leave, so a cell they fill stays blocked
bool filledByStatics(const Cell& cell) {
    const auto statics = std::count_if(cell.occupants().begin(), cell.occupants().end(),
                                       [](const GridObjectPtr& o) { return o && o->isStatic(); });
    return statics >= cell.capacity();
}
} // anonymous namespace

GridAgent::GridAgent(std::string name, const World* world, int x, int y, uint32_t seed)
    : GridObject(std::move(name), world, x, y), m_rng(seed) {
    m_currentAction = Action::none(*this);
}

GridAgent::GridAgent(std::string name, IDType id, const World* world, int x, int y, uint32_t seed)
    : GridObject(std::move(name), id, world, x, y), m_rng(seed) {
    m_currentAction = Action::none(*this);
}

const Action& GridAgent::chooseAction(const World& world, int x, int y,
                                      const OccupantList& occupants) {
    m_pending = PendingMove{};

    // don't act in a world we're not in
    if (this->world() != &world) {
        AGENT_WARN(std::format("Agent '{}' ({}) refused to act in a foreign world",
                               objectName(), objectID()));
        m_currentAction = Action::none(*this);
        return m_currentAction;
    }

    if (m_explorationEnabled && m_state != ExplorationState::Done) {
        m_currentAction = depthFirstExploration(world, GridCoord(x, y), occupants);
    } else {
        m_currentAction = randomMove();
    }
    return m_currentAction;
}

Action GridAgent::randomMove() {
    std::uniform_int_distribution<int> pick(0, DIRECTION_COUNT - 1);
    const Direction d = CARDINAL_DIRECTIONS[static_cast<size_t>(pick(m_rng))];
    m_pending = PendingMove{PendingKind::Wander, position(), position().offset(d), d};
    return Action::move(*this, d);
}

Action GridAgent::depthFirstExploration(const World& world, GridCoord here,
                                        const OccupantList& occupants) {
    const Cell* cell = world.getLocation(here.x, here.y);
    if (cell == nullptr) {
        AGENT_ERROR(std::format("Agent '{}' believes it is outside the grid at ({},{})",
                                objectName(), here.x, here.y));
        return Action::none(*this);
    }

    if (m_map.empty()) {
        m_frontier.insert(here);
    }
    m_map.addNode(here);
    noteOccupants(here, occupants);

    // set when a neighbour is only full because something mobile stands there
    bool deferred = false;
    for (Direction d : CARDINAL_DIRECTIONS) {
        if (isResolved(here, d)) {
            continue;
        }
        const Cell* next = cell->neighbour(d);
        if (next == nullptr) {
            // grid edge or wall
            markResolved(here, d);
            continue;
        }
        const GridCoord target = next->coord();
        if (m_map.contains(target)) {
            // loop closure onto a cell we already know
            m_map.addEdge(here, target, 1);
            markResolved(here, d);
            markResolved(target, opposite(d));
            continue;
        }
        if (next->isOccupied()) {
            if (filledByStatics(*next)) {
                markResolved(here, d);
            } else {
                deferred = true;
            }
            continue;
        }

        m_waitTicks = 0;
        m_backtrack.push_back(here);
        m_state = ExplorationState::Exploring;
        m_pending = PendingMove{PendingKind::Explore, here, target, d};
        return Action::move(*this, d);
    }

    if (deferred) {
        // give whoever is in the way a chance to move on
        if (m_waitTicks < PATIENCE_TICKS) {
            ++m_waitTicks;
            m_state = ExplorationState::Exploring;
            return Action::none(*this);
        }
    } else {
        // nothing left to try from here
        m_frontier.erase(here);
    }
    m_waitTicks = 0;

    while (!m_backtrack.empty()) {
        const GridCoord target = m_backtrack.back();
        m_backtrack.pop_back();
        const Direction d = directionBetween(here, target);
        if (d == Direction::Nowhere) {
            continue;
        }
        m_state = ExplorationState::Backtracking;
        m_pending = PendingMove{PendingKind::Backtrack, here, target, d};
        return Action::move(*this, d);
    }

    return revisitFrontier(*cell);
}

Action GridAgent::revisitFrontier(const Cell& cell) {
    const GridCoord here = cell.coord();

    // loop closures may have settled cells left behind earlier
    for (auto it = m_frontier.begin(); it != m_frontier.end();) {
        if (*it != here && isSettled(*it)) {
            it = m_frontier.erase(it);
        } else {
            ++it;
        }
    }

    if (m_frontier.empty()) {
        finishExploration();
        return Action::none(*this);
    }

    if (const auto step = stepTowardFrontier(here)) {
        const Direction d = directionBetween(here, *step);
        if (d != Direction::Nowhere) {
            m_state = ExplorationState::Backtracking;
            m_pending = PendingMove{PendingKind::Revisit, here, *step, d};
            return Action::move(*this, d);
        }
    }

    // Only this cell is left and it is blocked: step aside so the other
    // occupant can get past, then come back
    std::vector<Direction> sidesteps;
    if (const ExplorationMap::EdgeMap* edges = m_map.edgesFrom(here)) {
        for (const auto& [neighbour, distance] : *edges) {
            const Direction d = directionBetween(here, neighbour);
            if (d != Direction::Nowhere && cell.canGo(d)) {
                sidesteps.push_back(d);
            }
        }
    }
    m_state = ExplorationState::Exploring;
    if (sidesteps.empty()) {
        return Action::none(*this);
    }
    std::uniform_int_distribution<size_t> pick(0, sidesteps.size() - 1);
    const Direction d = sidesteps[pick(m_rng)];
    AGENT_DEBUG(std::format("Agent '{}' steps aside from ({},{})", objectName(), here.x, here.y));
    m_pending = PendingMove{PendingKind::Revisit, here, here.offset(d), d};
    return Action::move(*this, d);
}

std::optional<GridCoord> GridAgent::stepTowardFrontier(GridCoord here) const {
    // Breadth-first over the unpruned map, whose edges join adjacent cells
    boost::container::flat_map<GridCoord, GridCoord> cameFrom{{here, here}};
    std::deque<GridCoord> open{here};
    while (!open.empty()) {
        const GridCoord node = open.front();
        open.pop_front();
        if (node != here && inFrontier(node)) {
            GridCoord step = node;
            while (cameFrom.at(step) != here) {
                step = cameFrom.at(step);
            }
            return step;
        }
        const ExplorationMap::EdgeMap* edges = m_map.edgesFrom(node);
        if (edges == nullptr) {
            continue;
        }
        for (const auto& [next, distance] : *edges) {
            if (cameFrom.emplace(next, node).second) {
                open.push_back(next);
            }
        }
    }
    return std::nullopt;
}

void GridAgent::actionResult(const Observation& result) {
    const PendingMove pending = std::exchange(m_pending, PendingMove{});

    if (m_currentAction.kind() == ActionKind::NoAction) {
        return;
    }

    // a Move must be answered with the cell we ended up in
    const Cell* const* observed = std::get_if<const Cell*>(&result);
    if (observed == nullptr || *observed == nullptr) {
        throw UnexpectedObservationType(std::format(
            "Agent '{}' expected a Cell observation for a Move action, got {}",
            objectName(), observed == nullptr ? "no observation" : "a null cell"));
    }

    const GridCoord arrived = (*observed)->coord();
    setPosition(arrived);

    switch (pending.kind) {
        case PendingKind::Explore:
            if (arrived == pending.target) {
                m_map.addEdge(pending.origin, pending.target, 1);
                markResolved(pending.origin, pending.direction);
                markResolved(pending.target, opposite(pending.direction));
                m_frontier.insert(pending.target);
            } else if (!m_backtrack.empty() && m_backtrack.back() == pending.origin) {
                // refused: undo the push, the direction is retried on a later tick
                m_backtrack.pop_back();
            }
            break;
        case PendingKind::Backtrack:
            if (arrived != pending.target) {
                m_backtrack.push_back(pending.target);
            }
            break;
        case PendingKind::Revisit:
        case PendingKind::Wander:
        case PendingKind::None:
            break;
    }
}

void GridAgent::finishExploration() {
    m_frontier.clear();
    m_backtrack.clear();
    const size_t removed = pruneMap();
    m_state = ExplorationState::Done;
    AGENT_INFO(std::format("Agent '{}' finished exploring: {} decision points, {} corridor cells pruned",
                           objectName(), m_map.nodeCount(), removed));
}

size_t GridAgent::pruneMap() {
    return m_map.prune(m_landmarks);
}

void GridAgent::noteOccupants(GridCoord here, const OccupantList& occupants) {
    const bool sharedCell = std::any_of(occupants.begin(), occupants.end(),
                                        [this](const GridObjectPtr& o) { return o.get() != this; });
    if (sharedCell) {
        m_landmarks.insert(here);
    }
}

bool GridAgent::isResolved(GridCoord cell, Direction d) const {
    auto it = m_resolved.find(cell);
    return it != m_resolved.end() && (it->second & directionBit(d)) != 0;
}

bool GridAgent::isSettled(GridCoord cell) const {
    auto it = m_resolved.find(cell);
    return it != m_resolved.end() && it->second == ALL_DIRECTIONS;
}

void GridAgent::markResolved(GridCoord cell, Direction d) {
    uint8_t& bits = m_resolved[cell];
    const uint8_t before = bits;
    bits = static_cast<uint8_t>(bits | directionBit(d));
    if (bits == ALL_DIRECTIONS && before != ALL_DIRECTIONS) {
        AGENT_DEBUG(std::format("Agent '{}' resolved every direction at ({},{})",
                                objectName(), cell.x, cell.y));
    }
}

Direction GridAgent::getDirection(GridCoord target) const {
    return directionBetween(position(), target);
}

Direction GridAgent::directionBetween(GridCoord from, GridCoord to) {
    for (Direction d : CARDINAL_DIRECTIONS) {
        if (from.offset(d) == to) {
            return d;
        }
    }
    return Direction::Nowhere;
}

} // namespace GridAgents
