/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WORLD_SNAPSHOT_HPP
#define WORLD_SNAPSHOT_HPP

#include "world/GridObject.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace GridAgents {

struct AgentSnapshot {
    GridObject::IDType id{UniqueID::INVALID_ID};
    std::string name;
    int x{0};
    int y{0};
};

// Everything a display or monitor needs after a tick
struct WorldSnapshot {
    uint64_t tick{0};
    std::vector<AgentSnapshot> agents;
};

} // namespace GridAgents

#endif // WORLD_SNAPSHOT_HPP
