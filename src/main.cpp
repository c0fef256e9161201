/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "agents/GridAgent.hpp"
#include "config/Layouts.hpp"
#include "config/SimulationConfig.hpp"
#include "core/Logger.hpp"
#include "core/SimulationRunner.hpp"
#include "render/GridViewer.hpp"
#include "world/World.hpp"
#include <SDL3/SDL.h>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <exception>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

// Headless runs need an end
constexpr uint64_t DEFAULT_HEADLESS_TICKS = 700;

struct CommandLine {
    std::string source;
    bool headless{false};
    std::optional<uint64_t> ticks;
};

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [config.json | layout] [--headless] [--ticks N]\n"
              << "Layouts:";
    for (const auto& name : GridAgents::layoutNames()) {
        std::cout << ' ' << name;
    }
    std::cout << '\n';
}

std::optional<CommandLine> parseCommandLine(int argc, char* argv[]) {
    CommandLine options;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);
        if (arg == "--headless") {
            options.headless = true;
        } else if (arg == "--ticks") {
            if (i + 1 >= argc) {
                return std::nullopt;
            }
            const std::string_view value(argv[++i]);
            uint64_t ticks = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), ticks);
            if (ec != std::errc() || ptr != value.data() + value.size()) {
                return std::nullopt;
            }
            options.ticks = ticks;
        } else if (arg.starts_with("--") || !options.source.empty()) {
            return std::nullopt;
        } else {
            options.source = std::string(arg);
        }
    }
    return options;
}

std::optional<GridAgents::SimulationConfig> loadConfig(const std::string& source) {
    if (source.empty()) {
        return GridAgents::SimulationConfig::fromLayout("open");
    }
    if (source.ends_with(".json")) {
        std::string error;
        auto config = GridAgents::SimulationConfig::loadFromFile(source, error);
        if (!config) {
            APP_ERROR(std::format("Could not load '{}': {}", source, error));
        }
        return config;
    }
    auto config = GridAgents::SimulationConfig::fromLayout(source);
    if (!config) {
        APP_ERROR(std::format("Unknown layout '{}'", source));
    }
    return config;
}

void logSnapshot(const GridAgents::WorldSnapshot& snapshot) {
    for (const auto& agent : snapshot.agents) {
        APP_INFO(std::format("tick {}: {} at ({},{})", snapshot.tick, agent.name, agent.x, agent.y));
    }
}

void runHeadless(GridAgents::SimulationRunner& runner) {
    uint64_t lastTick = UINT64_MAX;
    while (true) {
        // Read the running flag first so the final publish is never missed
        const bool running = runner.isRunning();
        const uint64_t published = runner.publishedTick();
        if (published != lastTick) {
            logSnapshot(runner.latestSnapshot());
            lastTick = published;
        }
        if (!running) {
            break;
        }
        SDL_Delay(1);
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const auto options = parseCommandLine(argc, argv);
    if (!options) {
        printUsage(argv[0]);
        return 1;
    }
    GridAgents::Logger::SetSession(options->source);

    const auto config = loadConfig(options->source);
    if (!config) {
        printUsage(argv[0]);
        return 1;
    }

    std::unique_ptr<GridAgents::World> world;
    std::vector<GridAgents::GridAgentPtr> agents;
    try {
        world = config->createWorld();
        agents = config->populate(*world);
    } catch (const std::exception& e) {
        APP_CRITICAL(std::format("Could not build the world: {}", e.what()));
        return 1;
    }

    uint64_t ticks = options->ticks.value_or(0);
    if (options->headless && ticks == 0 && world->runTime() == 0) {
        ticks = DEFAULT_HEADLESS_TICKS;
    }

    // Headless runs don't need real-time pacing
    const auto interval = options->headless ? std::chrono::milliseconds{0} : config->tickInterval;
    GridAgents::SimulationRunner runner(*world, interval);

    int exitCode = 0;
    if (options->headless) {
        if (!runner.start(ticks)) {
            return 1;
        }
        runHeadless(runner);
    } else {
        GridAgents::GridViewer viewer(world->grid());
        if (!viewer.init(GRIDAGENTS_APP_NAME) || !runner.start(ticks)) {
            return 1;
        }
        viewer.run(runner);
    }

    try {
        const uint64_t executed = runner.wait();
        std::cout << std::format("Ran {} ticks (world time {})\n", executed, world->time());
    } catch (const std::exception& e) {
        APP_CRITICAL(std::format("Simulation failed: {}", e.what()));
        exitCode = 1;
    }

    for (const auto& agent : agents) {
        const auto& map = agent->explorationMap();
        std::cout << std::format("{} at ({},{}): {} map nodes, {} edges{}\n", agent->objectName(),
                                 agent->x(), agent->y(), map.nodeCount(), map.edgeCount(),
                                 world->isAgentFaulted(agent->objectID()) ? " [faulted]" : "");
    }

    return exitCode;
}
