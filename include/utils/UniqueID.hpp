/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef UNIQUE_ID_HPP
#define UNIQUE_ID_HPP

#include <atomic>
#include <cstdint>

namespace PolyForge {
    /**
     * @brief A thread-safe generator for opaque 64-bit identifiers.
     *
     * Drawables and scenes take their identity from here at construction.
     * Identifiers are never reused for the lifetime of the process, so a
     * destroyed object's id can never alias a live one.
     */
    class UniqueID {
    public:
        using IDType = uint64_t;

        /**
         * @brief Generates a new unique ID.
         * @return A new, unique 64-bit integer. The first ID generated is 1.
         */
        static IDType generate() {
            return m_nextID.fetch_add(1, std::memory_order_relaxed);
        }

        /**
         * @brief A constant representing an invalid or uninitialized ID.
         */
        static constexpr IDType INVALID_ID = 0;

    private:
        // Starts at 1, so that INVALID_ID (0) is never generated.
        static inline std::atomic<IDType> m_nextID{1};
    };

} // namespace PolyForge

#endif // UNIQUE_ID_HPP
