#pragma once

#include <cstdint>

#include "ks/ecs/Component.hpp"

namespace ks::save {

/**
 * @brief Marks an entity for filtered saves.
 *
 * Persisted entities are also despawned, with their descendants, before a load.
 * Every entity created by a load receives this marker.
 */
struct Persist : ecs::Component {};

/**
 * @brief Marks an entity to be despawned, with its descendants, before a load.
 *
 * Unload entities are never written to a filtered save. Use it for state that
 * is rebuilt from loaded data, such as visuals spawned for persisted entities.
 */
struct Unload : ecs::Component {};

/**
 * @brief Transient tag on an entity that a load just created.
 *
 * Holds the index the entity had when it was saved. Removed at the end of the
 * post-load phase.
 */
struct Restored : ecs::Component {
    Restored() = default;
    explicit Restored(std::uint32_t index) : previousIndex(index) {}

    std::uint32_t previousIndex = 0;
};

} // namespace ks::save
