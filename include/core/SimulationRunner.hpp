/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SIMULATION_RUNNER_HPP
#define SIMULATION_RUNNER_HPP

#include "core/SnapshotBuffer.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>

namespace GridAgents {

class World;

/**
 * SimulationRunner drives a World in real time on a worker thread.
 *
 * - One tick per interval, paced with SDL's precise delay
 * - A snapshot is published after every tick for concurrent readers
 * - Cancellation is cooperative: the stop flag is checked between ticks,
 *   never inside one
 *
 * The World must outlive the runner and must not be touched by other
 * threads while the runner is active.
 */
class SimulationRunner {
public:
    /**
     * @param world world to drive
     * @param tickInterval delay between ticks (0 runs flat out)
     */
    explicit SimulationRunner(World& world, std::chrono::milliseconds tickInterval);

    /**
     * Destructor - stops and joins the worker
     */
    ~SimulationRunner();

    /**
     * Start the worker
     * @param ticks number of ticks to run, 0 = until the world's tick limit
     *        or stop()
     * @return false if already running
     */
    bool start(uint64_t ticks = 0);

    /**
     * Request a stop after the current tick. Thread-safe.
     */
    void stop();

    /**
     * Block until the worker has finished
     * @return number of ticks executed by the last run
     */
    uint64_t wait();

    bool isRunning() const;
    bool stopRequested() const { return m_stopRequested.load(std::memory_order_relaxed); }

    const SnapshotBuffer& snapshots() const { return m_snapshots; }
    WorldSnapshot latestSnapshot() const { return m_snapshots.latest(); }
    uint64_t publishedTick() const { return m_snapshots.publishedTick(); }

private:
    uint64_t runWorker(uint64_t ticks);

    World& m_world;
    std::chrono::milliseconds m_tickInterval;
    SnapshotBuffer m_snapshots;

    std::atomic<bool> m_running{false};
    std::atomic<bool> m_stopRequested{false};
    std::future<uint64_t> m_workerFuture;
    uint64_t m_ticksExecuted{0};

    // Prevent copying
    SimulationRunner(const SimulationRunner&) = delete;
    SimulationRunner& operator=(const SimulationRunner&) = delete;
};

} // namespace GridAgents

#endif // SIMULATION_RUNNER_HPP
