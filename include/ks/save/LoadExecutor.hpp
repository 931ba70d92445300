#pragma once

#include <optional>
#include <string_view>

#include "ks/save/LoadedEntities.hpp"
#include "ks/save/Request.hpp"
#include "ks/save/SceneSnapshot.hpp"

namespace ks::ecs {
class World;
class ComponentRegistry;
}

namespace ks::save {

enum class LoadState {
    Idle,
    Unloading,
    Reading,
    Applying,
    AwaitingFixup
};

std::string_view LoadStateName(LoadState state);

/**
 * @brief Executes load requests.
 *
 * Run() clears every Persist or Unload entity (with descendants), reads and
 * parses the file, then spawns the scene under new identities tagged Persist
 * and Restored. On success the executor stays in AwaitingFixup and exposes the
 * index mapping until Finish() is called. A read or parse failure returns to
 * Idle with the world already unloaded.
 */
class LoadExecutor {
public:
    explicit LoadExecutor(const ecs::ComponentRegistry& registry);

    SaveLoadResult Run(ecs::World& world, const LoadRequest& request);

    // Removes Restored tags and drops the mapping. Safe to call in any state.
    void Finish(ecs::World& world);

    LoadState GetState() const { return m_state; }
    const LoadedEntities* GetLoaded() const { return m_loaded ? &*m_loaded : nullptr; }

    // Returns the number of entities despawned, descendants included.
    static std::size_t UnloadWorld(ecs::World& world);

    // Spawns every scene entity. All components are decoded before the first
    // spawn, so a core::SchemaError leaves the world untouched.
    static LoadedEntities ApplyScene(ecs::World& world,
                                     const ecs::ComponentRegistry& registry,
                                     const SceneSnapshot& snapshot);

private:
    void TransitionTo(LoadState state);

    const ecs::ComponentRegistry& m_registry;
    LoadState m_state = LoadState::Idle;
    std::optional<LoadedEntities> m_loaded;
};

} // namespace ks::save
