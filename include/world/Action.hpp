/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ACTION_HPP
#define ACTION_HPP

#include "world/GridObject.hpp"
#include "world/GridTypes.hpp"
#include <ostream>
#include <utility>
#include <variant>

namespace GridAgents {

class Cell;

enum class ActionKind : int8_t {
    NoAction = -1,
    Move = 0
};

inline std::ostream& operator<<(std::ostream& os, const ActionKind& kind) {
    switch (kind) {
        case ActionKind::NoAction: return os << "NoAction";
        case ActionKind::Move: return os << "Move";
        default: return os << "UNKNOWN";
    }
}

/**
 * @brief What the world hands back to an agent after resolving its action.
 *
 * NoAction resolves to monostate; Move resolves to the cell the agent
 * occupies afterwards (the starting cell if the move was refused).
 */
using Observation = std::variant<std::monostate, const Cell*>;

/**
 * @brief One agent's proposal for one tick. Immutable once built.
 *
 * Records where the agent believed it was when it proposed, so the world
 * and the agent can tell a refused move from a successful one.
 */
class Action {
public:
    Action() = default;

    Action(const GridObject* agent, ActionKind kind, GridObjectPtr target,
           Direction direction, GridCoord origin)
        : m_agent(agent), m_kind(kind), m_target(std::move(target)),
          m_direction(direction), m_origin(origin) {}

    static Action none(const GridObject& agent) {
        return Action(&agent, ActionKind::NoAction, nullptr, Direction::Nowhere, agent.position());
    }

    static Action move(const GridObject& agent, Direction direction) {
        return Action(&agent, ActionKind::Move, nullptr, direction, agent.position());
    }

    const GridObject* agent() const { return m_agent; }
    ActionKind kind() const { return m_kind; }
    // Reserved for actions directed at an object
    const GridObjectPtr& target() const { return m_target; }
    Direction direction() const { return m_direction; }
    int x() const { return m_origin.x; }
    int y() const { return m_origin.y; }
    GridCoord origin() const { return m_origin; }

private:
    const GridObject* m_agent{nullptr};
    ActionKind m_kind{ActionKind::NoAction};
    GridObjectPtr m_target;
    Direction m_direction{Direction::Nowhere};
    GridCoord m_origin;
};

} // namespace GridAgents

#endif // ACTION_HPP
