#pragma once

#include <vector>

#include "ks/ecs/Entity.hpp"
#include "ks/save/SceneSnapshot.hpp"

namespace ks::ecs {
class World;
class ComponentRegistry;
}

namespace ks::save {

/**
 * Builds scene snapshots from a live world.
 */
struct SceneExtractor {
    // Captures exactly `entities` (dead handles are skipped) with every attached
    // component whose type is in `registry`. Unregistered components are left out.
    // A parent link is kept only when the parent is part of the same selection.
    static SceneSnapshot Extract(const ecs::World& world,
                                 const ecs::ComponentRegistry& registry,
                                 const std::vector<ecs::Entity>& entities);
};

} // namespace ks::save
