/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SNAPSHOT_BUFFER_HPP
#define SNAPSHOT_BUFFER_HPP

#include "world/WorldSnapshot.hpp"
#include <atomic>
#include <cstdint>
#include <mutex>
#include <utility>

namespace GridAgents {

/**
 * Hand-off point between the simulation thread and readers (viewer,
 * headless logger). The writer replaces the whole snapshot once per tick;
 * readers get a copy and may be up to one tick behind.
 */
class SnapshotBuffer {
public:
    void publish(WorldSnapshot snapshot) {
        const uint64_t tick = snapshot.tick;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_latest = std::move(snapshot);
        }
        m_publishedTick.store(tick, std::memory_order_release);
        m_hasSnapshot.store(true, std::memory_order_release);
    }

    WorldSnapshot latest() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_latest;
    }

    // Cheap poll for readers that only redraw on change
    uint64_t publishedTick() const { return m_publishedTick.load(std::memory_order_acquire); }
    bool hasSnapshot() const { return m_hasSnapshot.load(std::memory_order_acquire); }

private:
    mutable std::mutex m_mutex;
    WorldSnapshot m_latest;
    std::atomic<uint64_t> m_publishedTick{0};
    std::atomic<bool> m_hasSnapshot{false};
};

} // namespace GridAgents

#endif // SNAPSHOT_BUFFER_HPP
