/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/SimulationRunner.hpp"
#include "core/Logger.hpp"
#include "world/World.hpp"
#include <SDL3/SDL_timer.h>
#include <algorithm>
#include <exception>
#include <format>

namespace GridAgents {

namespace {
// Longest single sleep, so a stop request is noticed quickly even with
// long tick intervals
constexpr Uint64 MAX_SLEEP_SLICE_NS = 10 * SDL_NS_PER_MS;
} // anonymous namespace

SimulationRunner::SimulationRunner(World& world, std::chrono::milliseconds tickInterval)
    : m_world(world)
    , m_tickInterval(tickInterval)
{
}

SimulationRunner::~SimulationRunner() {
    stop();
    if (m_workerFuture.valid()) {
        try {
            m_workerFuture.get();
        } catch (const std::exception& e) {
            RUNNER_ERROR("Worker ended with an exception during shutdown: " + std::string(e.what()));
        }
    }
}

bool SimulationRunner::start(uint64_t ticks) {
    if (m_running.load()) {
        RUNNER_WARN("SimulationRunner already running");
        return false;
    }
    if (m_workerFuture.valid()) {
        // collect the previous run before starting another
        wait();
    }

    m_stopRequested.store(false, std::memory_order_relaxed);
    m_running.store(true, std::memory_order_relaxed);
    m_snapshots.publish(m_world.snapshot());

    m_workerFuture = std::async(std::launch::async, [this, ticks]() { return runWorker(ticks); });
    RUNNER_INFO(std::format("Simulation started ({} ms per tick)", m_tickInterval.count()));
    return true;
}

void SimulationRunner::stop() {
    m_stopRequested.store(true, std::memory_order_relaxed);
}

uint64_t SimulationRunner::wait() {
    if (m_workerFuture.valid()) {
        m_ticksExecuted = m_workerFuture.get();
    }
    return m_ticksExecuted;
}

bool SimulationRunner::isRunning() const {
    return m_running.load(std::memory_order_relaxed);
}

uint64_t SimulationRunner::runWorker(uint64_t ticks) {
    const Uint64 intervalNS = static_cast<Uint64>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(m_tickInterval).count());
    uint64_t executed = 0;

    try {
        while (!m_stopRequested.load(std::memory_order_relaxed) && (ticks == 0 || executed < ticks)) {
            const Uint64 tickStart = SDL_GetTicksNS();

            if (!m_world.tick()) {
                RUNNER_INFO(std::format("World reached its tick limit at tick {}", m_world.time()));
                break;
            }
            ++executed;
            m_snapshots.publish(m_world.snapshot());

            // Pace to the configured interval, waking periodically for stop()
            const Uint64 deadline = tickStart + intervalNS;
            Uint64 now = SDL_GetTicksNS();
            while (now < deadline && !m_stopRequested.load(std::memory_order_relaxed)) {
                SDL_DelayPrecise(std::min(deadline - now, MAX_SLEEP_SLICE_NS));
                now = SDL_GetTicksNS();
            }
        }
    } catch (const std::exception& e) {
        RUNNER_CRITICAL("Exception in simulation worker: " + std::string(e.what()));
        m_running.store(false, std::memory_order_relaxed);
        throw;
    }

    m_running.store(false, std::memory_order_relaxed);
    RUNNER_INFO(std::format("Simulation stopped after {} ticks", executed));
    return executed;
}

} // namespace GridAgents
