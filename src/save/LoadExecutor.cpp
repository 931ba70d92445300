#include "ks/save/LoadExecutor.hpp"

#include "ks/core/Error.hpp"
#include "ks/core/Logger.hpp"
#include "ks/ecs/ComponentRegistry.hpp"
#include "ks/ecs/World.hpp"
#include "ks/save/Markers.hpp"
#include "ks/save/SceneSerializer.hpp"

#include <memory>
#include <string>
#include <typeindex>
#include <utility>
#include <vector>

#include <exception>

namespace ks::save {

std::string_view LoadStateName(LoadState state) {
    switch (state) {
        case LoadState::Idle:          return "Idle";
        case LoadState::Unloading:     return "Unloading";
        case LoadState::Reading:       return "Reading";
        case LoadState::Applying:      return "Applying";
        case LoadState::AwaitingFixup: return "AwaitingFixup";
    }
    return "Unknown";
}

LoadExecutor::LoadExecutor(const ecs::ComponentRegistry& registry)
    : m_registry(registry) {}

void LoadExecutor::TransitionTo(LoadState state) {
    core::Logger::Debug("[LoadExecutor] {} -> {}", LoadStateName(m_state), LoadStateName(state));
    m_state = state;
}

SaveLoadResult LoadExecutor::Run(ecs::World& world, const LoadRequest& request) {
    SaveLoadResult result;
    result.kind = RequestKind::Load;
    result.path = request.path;

    if (m_state != LoadState::Idle) {
        core::Logger::Warning("[LoadExecutor] Load requested while {}; finishing previous load first",
                              LoadStateName(m_state));
        Finish(world);
    }

    TransitionTo(LoadState::Unloading);
    const std::size_t unloaded = UnloadWorld(world);
    core::Logger::Debug("[LoadExecutor] Unloaded {} entities", unloaded);

    TransitionTo(LoadState::Reading);
    SceneSnapshot snapshot;
    try {
        const std::string text = SceneSerializer::ReadFromFile(request.path);
        snapshot = SceneSerializer::Deserialize(text, m_registry);
    } catch (const core::Error& ex) {
        result.message = ex.what();
        core::Logger::Error("[LoadExecutor] load failed: {}", result.message);
        TransitionTo(LoadState::Idle);
        return result;
    }

    TransitionTo(LoadState::Applying);
    try {
        m_loaded = ApplyScene(world, m_registry, snapshot);
    } catch (const core::SchemaError& ex) {
        result.message = ex.what();
        core::Logger::Error("[LoadExecutor] world write failed: {}", result.message);
        TransitionTo(LoadState::Idle);
        return result;
    }

    TransitionTo(LoadState::AwaitingFixup);
    result.success = true;
    result.entityCount = m_loaded->Size();
    result.message = fmt::format("{} entities restored", result.entityCount);
    core::Logger::Info("[LoadExecutor] load successful: {} ({} entities)",
                       request.path.string(), result.entityCount);
    return result;
}

void LoadExecutor::Finish(ecs::World& world) {
    for (const ecs::Entity entity : world.EntitiesWith<Restored>()) {
        world.Remove<Restored>(entity);
    }
    m_loaded.reset();
    if (m_state != LoadState::Idle) {
        TransitionTo(LoadState::Idle);
    }
}

std::size_t LoadExecutor::UnloadWorld(ecs::World& world) {
    std::vector<ecs::Entity> entities = world.EntitiesWith<Persist>();
    const auto unload = world.EntitiesWith<Unload>();
    entities.insert(entities.end(), unload.begin(), unload.end());

    const std::size_t before = world.Size();
    for (const ecs::Entity entity : entities) {
        // Already gone if an ancestor was despawned first.
        if (world.IsAlive(entity)) {
            world.DespawnRecursive(entity);
        }
    }
    return before - world.Size();
}

LoadedEntities LoadExecutor::ApplyScene(ecs::World& world,
                                        const ecs::ComponentRegistry& registry,
                                        const SceneSnapshot& snapshot) {
    struct PendingComponent {
        std::type_index type;
        std::unique_ptr<ecs::Component> component;
    };

    std::vector<std::vector<PendingComponent>> decoded(snapshot.entities.size());
    for (std::size_t i = 0; i < snapshot.entities.size(); ++i) {
        for (const auto& sceneComponent : snapshot.entities[i].components) {
            const auto* binding = registry.FindByName(sceneComponent.typeName);
            if (!binding) {
                throw core::SchemaError(sceneComponent.typeName, "component type is not registered");
            }
            try {
                decoded[i].push_back({binding->type, binding->deserialize(sceneComponent.data)});
            } catch (const std::exception& ex) {
                throw core::SchemaError(sceneComponent.typeName,
                    fmt::format("entity {}: {}", snapshot.entities[i].index, ex.what()));
            }
        }
    }

    LoadedEntities loaded;
    std::vector<ecs::Entity> spawned;
    spawned.reserve(snapshot.entities.size());
    for (std::size_t i = 0; i < snapshot.entities.size(); ++i) {
        const std::uint32_t previousIndex = snapshot.entities[i].index;
        const ecs::Entity entity = world.Spawn();
        for (auto& pending : decoded[i]) {
            world.AddRaw(entity, pending.type, std::move(pending.component));
        }
        world.Add<Persist>(entity);
        world.Add<Restored>(entity, previousIndex);
        loaded.Insert(previousIndex, entity);
        spawned.push_back(entity);
        core::Logger::Debug("[LoadExecutor] entity update required: {} -> {}", previousIndex, entity);
    }

    for (std::size_t i = 0; i < snapshot.entities.size(); ++i) {
        const auto& parentIndex = snapshot.entities[i].parent;
        if (!parentIndex) {
            continue;
        }
        if (auto parent = loaded.FindIndex(*parentIndex)) {
            world.SetParent(spawned[i], *parent);
        } else {
            core::Logger::Warning("[LoadExecutor] Parent index {} of restored entity {} is not in the scene",
                                  *parentIndex, spawned[i]);
        }
    }
    return loaded;
}

} // namespace ks::save
