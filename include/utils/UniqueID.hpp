/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef UNIQUE_ID_HPP
#define UNIQUE_ID_HPP

#include <atomic>
#include <cstdint>

namespace GridAgents {
    /**
     * @brief Thread-safe generator for grid object identities.
     *
     * IDs are never reused for the lifetime of the process. Callers that
     * supply their own IDs are responsible for keeping them unique.
     */
    class UniqueID {
    public:
        using IDType = uint64_t;

        /**
         * @brief Generates a new unique ID. The first ID generated is 1.
         */
        static IDType generate() {
            return m_nextID.fetch_add(1, std::memory_order_relaxed);
        }

        /**
         * @brief Marks an object that has not been given an identity.
         */
        static constexpr IDType INVALID_ID = 0;

    private:
        static inline std::atomic<IDType> m_nextID{1};
    };

} // namespace GridAgents

#endif // UNIQUE_ID_HPP
