/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_CONFIG_HPP
#define SIMULATION_CONFIG_HPP

#include "world/GridTypes.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace GridAgents {

class JsonValue;
class World;
class GridAgent;

struct AgentPlacement {
    std::string name;
    int x{0};
    int y{0};
    bool explore{true};
};

/**
 * @brief Everything needed to build a World and its agents.
 *
 * Every field has a default, so an empty JSON object (or no file at all)
 * yields a 10x10 open grid with one exploring agent in the middle.
 *
 * JSON layout:
 * @code
 * {
 *   "world": { "height": 10, "width": 10, "max_ticks": 700,
 *              "tick_interval_ms": 250, "default_capacity": 1,
 *              "seed": 42, "layout": "maze" },
 *   "walls": [[2, 0], [7, 0]],
 *   "capacities": [{ "x": 1, "y": 1, "capacity": 2 }],
 *   "occupants": [{ "x": 1, "y": 1, "count": 1 }],
 *   "agents": [{ "name": "agent1", "x": 5, "y": 5, "explore": true }]
 * }
 * @endcode
 */
struct SimulationConfig {
    static constexpr int DEFAULT_SIZE = 10;

    int height{DEFAULT_SIZE};
    int width{DEFAULT_SIZE};
    uint64_t maxTicks{0};
    std::chrono::milliseconds tickInterval{1000};
    int defaultCapacity{1};
    std::optional<uint32_t> seed;
    std::string layout;

    CapacityMap capacities;
    OccupantCountMap occupants;
    std::vector<AgentPlacement> agents;

    // Reads and parses a JSON file; error describes the first problem found
    static std::optional<SimulationConfig> loadFromFile(const std::string& path, std::string& error);
    static std::optional<SimulationConfig> parse(const std::string& json, std::string& error);
    static std::optional<SimulationConfig> fromJson(const JsonValue& root, std::string& error);

    // One agent at the layout's start point; nullopt for an unknown name
    static std::optional<SimulationConfig> fromLayout(const std::string& name);

    // Human-readable problems; empty when the configuration is usable
    std::vector<std::string> validate() const;

    int capacityAt(GridCoord coord) const;

    /**
     * @throws std::invalid_argument if the configuration does not describe
     *         a valid world
     */
    std::unique_ptr<World> createWorld() const;

    /**
     * @brief Creates the configured agents and registers them with @p world.
     * @throws std::runtime_error if the world refuses a placement
     */
    std::vector<std::shared_ptr<GridAgent>> populate(World& world) const;
};

} // namespace GridAgents

#endif // SIMULATION_CONFIG_HPP
