#include "ks/save/SceneExtractor.hpp"

#include "ks/core/Logger.hpp"
#include "ks/ecs/ComponentRegistry.hpp"
#include "ks/ecs/World.hpp"

#include <algorithm>
#include <unordered_set>

namespace ks::save {

SceneSnapshot SceneExtractor::Extract(const ecs::World& world,
                                      const ecs::ComponentRegistry& registry,
                                      const std::vector<ecs::Entity>& entities) {
    std::unordered_set<ecs::Entity, ecs::EntityHash> selection;
    selection.reserve(entities.size());

    SceneSnapshot snapshot;
    snapshot.entities.reserve(entities.size());
    std::vector<ecs::Entity> extracted;
    extracted.reserve(entities.size());

    for (const ecs::Entity entity : entities) {
        if (!world.IsAlive(entity)) {
            core::Logger::Warning("[SceneExtractor] Skipping dead entity {}", entity);
            continue;
        }
        if (!selection.insert(entity).second) {
            continue;
        }

        SceneEntity sceneEntity;
        sceneEntity.index = entity.index;

        for (const auto& type : world.ComponentTypes(entity)) {
            const auto* binding = registry.FindByType(type);
            if (!binding) {
                core::Logger::Debug("[SceneExtractor] Entity {} has unregistered component '{}' (skipped)",
                                    entity, type.name());
                continue;
            }
            const ecs::Component* component = world.GetRaw(entity, type);
            sceneEntity.components.push_back({binding->typeName, binding->serialize(*component)});
        }

        // Component maps are unordered; keep the snapshot stable.
        std::sort(sceneEntity.components.begin(), sceneEntity.components.end(),
                  [](const SceneComponent& a, const SceneComponent& b) { return a.typeName < b.typeName; });

        snapshot.entities.push_back(std::move(sceneEntity));
        extracted.push_back(entity);
    }

    for (std::size_t i = 0; i < extracted.size(); ++i) {
        if (auto parent = world.GetParent(extracted[i]); parent && selection.count(*parent) != 0) {
            snapshot.entities[i].parent = parent->index;
        }
    }

    core::Logger::Debug("[SceneExtractor] Extracted {} of {} requested entities",
                        snapshot.entities.size(), entities.size());
    return snapshot;
}

} // namespace ks::save
