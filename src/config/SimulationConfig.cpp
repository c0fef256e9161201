/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "config/SimulationConfig.hpp"
#include "agents/GridAgent.hpp"
#include "config/Layouts.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include "world/World.hpp"
#include <cmath>
#include <format>
#include <random>
#include <stdexcept>

namespace GridAgents {

namespace {

// Reads an optional integral member. Absent keys leave out untouched.
bool readInteger(const JsonValue& object, const std::string& key, const std::string& context,
                 int64_t& out, std::string& error) {
    if (!object.hasKey(key)) {
        return true;
    }
    const auto value = object[key].tryAsNumber();
    if (!value || std::floor(*value) != *value) {
        error = std::format("{}.{} must be an integer", context, key);
        return false;
    }
    out = static_cast<int64_t>(*value);
    return true;
}

bool readInt(const JsonValue& object, const std::string& key, const std::string& context,
             int& out, std::string& error) {
    int64_t value = out;
    if (!readInteger(object, key, context, value, error)) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

bool readRequiredCoord(const JsonValue& object, const std::string& context, GridCoord& out,
                       std::string& error) {
    if (!object.hasKey("x") || !object.hasKey("y")) {
        error = std::format("{} needs both x and y", context);
        return false;
    }
    return readInt(object, "x", context, out.x, error) && readInt(object, "y", context, out.y, error);
}

bool readNonNegative(const JsonValue& object, const std::string& key, const std::string& context,
                     uint64_t& out, std::string& error) {
    int64_t value = static_cast<int64_t>(out);
    if (!readInteger(object, key, context, value, error)) {
        return false;
    }
    if (value < 0) {
        error = std::format("{}.{} must not be negative", context, key);
        return false;
    }
    out = static_cast<uint64_t>(value);
    return true;
}

void applyLayout(SimulationConfig& config, const LayoutDefinition& layout) {
    config.layout = layout.name;
    config.width = layout.width;
    config.height = layout.height;
    for (const GridCoord& wall : layout.walls) {
        config.capacities[wall] = 0;
    }
}

bool parseWorldSection(const JsonValue& world, SimulationConfig& config,
                       std::optional<GridCoord>& start, std::string& error) {
    if (world.isNull()) {
        return true;
    }
    if (!world.isObject()) {
        error = "world must be an object";
        return false;
    }

    if (world.hasKey("layout")) {
        const auto name = world["layout"].tryAsString();
        if (!name) {
            error = "world.layout must be a string";
            return false;
        }
        const auto layout = findLayout(*name);
        if (!layout) {
            error = std::format("Unknown layout '{}'", *name);
            return false;
        }
        applyLayout(config, *layout);
        start = layout->start;
    }

    uint64_t interval = static_cast<uint64_t>(config.tickInterval.count());
    uint64_t seed = 0;
    if (!readInt(world, "height", "world", config.height, error) ||
        !readInt(world, "width", "world", config.width, error) ||
        !readInt(world, "default_capacity", "world", config.defaultCapacity, error) ||
        !readNonNegative(world, "max_ticks", "world", config.maxTicks, error) ||
        !readNonNegative(world, "tick_interval_ms", "world", interval, error) ||
        !readNonNegative(world, "seed", "world", seed, error)) {
        return false;
    }
    config.tickInterval = std::chrono::milliseconds(interval);
    if (world.hasKey("seed")) {
        config.seed = static_cast<uint32_t>(seed);
    }
    return true;
}

bool parseWalls(const JsonValue& walls, SimulationConfig& config, std::string& error) {
    if (walls.isNull()) {
        return true;
    }
    const JsonArray* entries = walls.tryAsArray();
    if (entries == nullptr) {
        error = "walls must be an array";
        return false;
    }
    for (const JsonValue& entry : *entries) {
        const auto x = entry[0].tryAsInt();
        const auto y = entry[1].tryAsInt();
        if (entry.size() != 2 || !x || !y) {
            error = "walls entries must be [x, y] pairs";
            return false;
        }
        config.capacities[GridCoord(*x, *y)] = 0;
    }
    return true;
}

bool parseCoordTable(const JsonValue& table, const std::string& section, const std::string& valueKey,
                     CoordIntMap& out, std::string& error) {
    if (table.isNull()) {
        return true;
    }
    const JsonArray* entries = table.tryAsArray();
    if (entries == nullptr) {
        error = std::format("{} must be an array", section);
        return false;
    }
    for (const JsonValue& entry : *entries) {
        GridCoord coord;
        if (!entry.isObject() || !readRequiredCoord(entry, section, coord, error)) {
            if (error.empty()) {
                error = std::format("{} entries must be objects", section);
            }
            return false;
        }
        if (!entry.hasKey(valueKey)) {
            error = std::format("{} entries need '{}'", section, valueKey);
            return false;
        }
        int value = 0;
        if (!readInt(entry, valueKey, section, value, error)) {
            return false;
        }
        out[coord] = value;
    }
    return true;
}

bool parseAgents(const JsonValue& agents, SimulationConfig& config, std::string& error) {
    const JsonArray* entries = agents.tryAsArray();
    if (entries == nullptr) {
        error = "agents must be an array";
        return false;
    }
    for (size_t i = 0; i < entries->size(); ++i) {
        const JsonValue& entry = (*entries)[i];
        if (!entry.isObject()) {
            error = "agents entries must be objects";
            return false;
        }

        AgentPlacement placement;
        placement.name = entry["name"].tryAsString().value_or(std::format("agent{}", i + 1));
        GridCoord coord;
        if (!readRequiredCoord(entry, "agents", coord, error)) {
            return false;
        }
        placement.x = coord.x;
        placement.y = coord.y;
        if (entry.hasKey("explore")) {
            const auto explore = entry["explore"].tryAsBool();
            if (!explore) {
                error = "agents.explore must be a boolean";
                return false;
            }
            placement.explore = *explore;
        }
        config.agents.push_back(std::move(placement));
    }
    return true;
}

} // anonymous namespace

std::optional<SimulationConfig> SimulationConfig::loadFromFile(const std::string& path,
                                                               std::string& error) {
    JsonReader reader;
    if (!reader.loadFromFile(path)) {
        error = reader.getLastError();
        CONFIG_ERROR(std::format("Failed to read {}: {}", path, error));
        return std::nullopt;
    }
    auto config = fromJson(reader.getRoot(), error);
    if (config) {
        CONFIG_INFO(std::format("Loaded configuration from {}", path));
    } else {
        CONFIG_ERROR(std::format("Invalid configuration in {}: {}", path, error));
    }
    return config;
}

std::optional<SimulationConfig> SimulationConfig::parse(const std::string& json, std::string& error) {
    JsonReader reader;
    if (!reader.parse(json)) {
        error = reader.getLastError();
        return std::nullopt;
    }
    return fromJson(reader.getRoot(), error);
}

std::optional<SimulationConfig> SimulationConfig::fromJson(const JsonValue& root, std::string& error) {
    error.clear();
    if (!root.isObject()) {
        error = "Configuration root must be a JSON object";
        return std::nullopt;
    }

    SimulationConfig config;
    std::optional<GridCoord> start;

    if (!parseWorldSection(root["world"], config, start, error) ||
        !parseWalls(root["walls"], config, error) ||
        !parseCoordTable(root["capacities"], "capacities", "capacity", config.capacities, error) ||
        !parseCoordTable(root["occupants"], "occupants", "count", config.occupants, error)) {
        return std::nullopt;
    }

    if (root.hasKey("agents")) {
        if (!parseAgents(root["agents"], config, error)) {
            return std::nullopt;
        }
    } else {
        const GridCoord at = start.value_or(GridCoord(config.width / 2, config.height / 2));
        config.agents.push_back(AgentPlacement{"agent1", at.x, at.y, true});
    }

    return config;
}

std::optional<SimulationConfig> SimulationConfig::fromLayout(const std::string& name) {
    const auto layout = findLayout(name);
    if (!layout) {
        return std::nullopt;
    }
    SimulationConfig config;
    applyLayout(config, *layout);
    config.agents.push_back(AgentPlacement{"agent1", layout->start.x, layout->start.y, true});
    return config;
}

int SimulationConfig::capacityAt(GridCoord coord) const {
    auto it = capacities.find(coord);
    return it != capacities.end() ? it->second : defaultCapacity;
}

std::vector<std::string> SimulationConfig::validate() const {
    std::vector<std::string> problems;

    if (height <= 0 || width <= 0) {
        problems.push_back(std::format("Grid dimensions must be positive (got {}x{})", width, height));
        return problems;
    }
    if (defaultCapacity < 0) {
        problems.push_back(std::format("Default capacity must not be negative (got {})", defaultCapacity));
    }

    auto inBounds = [this](GridCoord c) { return c.x >= 0 && c.y >= 0 && c.x < width && c.y < height; };

    for (const auto& [coord, capacity] : capacities) {
        if (!inBounds(coord)) {
            problems.push_back(std::format("Capacity override at ({},{}) is outside the grid", coord.x, coord.y));
        } else if (capacity < 0) {
            problems.push_back(std::format("Capacity at ({},{}) must not be negative", coord.x, coord.y));
        }
    }

    CoordIntMap load;
    for (const auto& [coord, count] : occupants) {
        if (!inBounds(coord)) {
            problems.push_back(std::format("Occupants at ({},{}) are outside the grid", coord.x, coord.y));
        } else if (count < 0) {
            problems.push_back(std::format("Occupant count at ({},{}) must not be negative", coord.x, coord.y));
        } else {
            load[coord] += count;
        }
    }

    for (const AgentPlacement& agent : agents) {
        const GridCoord coord(agent.x, agent.y);
        if (!inBounds(coord)) {
            problems.push_back(std::format("Agent '{}' starts outside the grid at ({},{})",
                                           agent.name, agent.x, agent.y));
        } else if (capacityAt(coord) == 0) {
            problems.push_back(std::format("Agent '{}' starts on a blocked cell ({},{})",
                                           agent.name, agent.x, agent.y));
        } else {
            load[coord] += 1;
        }
    }

    for (const auto& [coord, count] : load) {
        const int capacity = capacityAt(coord);
        if (capacity > 0 && count > capacity) {
            problems.push_back(std::format("Cell ({},{}) holds {} occupants but has capacity {}",
                                           coord.x, coord.y, count, capacity));
        } else if (capacity == 0 && count > 0) {
            problems.push_back(std::format("Blocked cell ({},{}) cannot hold occupants", coord.x, coord.y));
        }
    }

    return problems;
}

std::unique_ptr<World> SimulationConfig::createWorld() const {
    const auto problems = validate();
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            CONFIG_ERROR(problem);
        }
        throw std::invalid_argument(problems.front());
    }
    return std::make_unique<World>(height, width, maxTicks, tickInterval, capacities, occupants,
                                   defaultCapacity);
}

std::vector<std::shared_ptr<GridAgent>> SimulationConfig::populate(World& world) const {
    std::vector<std::shared_ptr<GridAgent>> created;
    created.reserve(agents.size());

    for (size_t i = 0; i < agents.size(); ++i) {
        const AgentPlacement& placement = agents[i];
        const uint32_t agentSeed = seed ? static_cast<uint32_t>(*seed + i) : std::random_device{}();

        auto agent = std::make_shared<GridAgent>(placement.name, &world, placement.x, placement.y,
                                                 agentSeed);
        agent->setExplorationEnabled(placement.explore);
        if (!world.registerAgent(agent, placement.x, placement.y)) {
            throw std::runtime_error(std::format("World refused agent '{}' at ({},{})",
                                                 placement.name, placement.x, placement.y));
        }
        created.push_back(std::move(agent));
    }

    CONFIG_INFO(std::format("Populated world with {} agents", created.size()));
    return created;
}

} // namespace GridAgents
