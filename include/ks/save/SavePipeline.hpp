#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <typeinfo>
#include <vector>

#include "ks/core/Logger.hpp"
#include "ks/ecs/ComponentRegistry.hpp"
#include "ks/save/FixupRegistry.hpp"
#include "ks/save/LoadExecutor.hpp"
#include "ks/save/LoadedEntities.hpp"
#include "ks/save/Request.hpp"
#include "ks/save/SaveExecutor.hpp"
#include "ks/utils/Config.hpp"

namespace ks::ecs {
class World;
}

namespace ks::save {

/**
 * @brief Ordinary per-tick logic driven by a SavePipeline.
 */
class PipelineSystem {
public:
    virtual ~PipelineSystem() = default;

    /**
     * @brief Unique system name used for diagnostics and lookup.
     */
    virtual std::string_view GetName() const = 0;

    /**
     * @brief Called once per tick after the load phases and before the save phase.
     */
    virtual void Update(ecs::World& world, float deltaTime) = 0;

    /**
     * @brief Called during post-load on ticks where a load succeeded, after the
     * registered fix-ups ran. Restored entities still carry their Restored tag.
     */
    virtual void OnPostLoad(ecs::World& world, const LoadedEntities& loaded) {
        (void)world;
        (void)loaded;
    }
};

using PipelineSystemPtr = std::shared_ptr<PipelineSystem>;

/**
 * @brief Drives save and load requests around the ordinary tick.
 *
 * Each Update() runs, in order:
 *  1. Load: if a load request is pending, unload, read and apply the scene.
 *  2. Post-Load: right after Load; registered fix-ups and OnPostLoad hooks see
 *     the index mapping, then Restored tags and the mapping are discarded.
 *  3. Systems: every registered PipelineSystem::Update.
 *  4. Save: if a save request is pending, write the scene.
 *
 * Requests are fire-and-forget. Their outcome is logged, kept in
 * GetLastResult() and passed to the completion callback. A reference that
 * cannot be fixed up raises core::IntegrityError out of Update() after the
 * load state has been cleaned up. Exceptions thrown by fix-ups or OnPostLoad
 * hooks get the same cleanup before they propagate.
 */
class SavePipeline {
public:
    using CompletionCallback = std::function<void(const SaveLoadResult&)>;

    explicit SavePipeline(utils::SaveConfig config = {});
    SavePipeline(const SavePipeline&) = delete;
    SavePipeline& operator=(const SavePipeline&) = delete;

    // Registration
    ecs::ComponentRegistry& GetComponentRegistry() { return m_components; }
    const ecs::ComponentRegistry& GetComponentRegistry() const { return m_components; }
    FixupRegistry& GetFixupRegistry() { return m_fixups; }

    template<typename T>
    bool RegisterComponent(const std::string& typeName) {
        return m_components.Register<T>(typeName);
    }

    // Registers T::FromLoaded under the name T was registered with.
    template<typename T>
    bool RegisterFixup() {
        return m_fixups.Register<T>(FixupName<T>());
    }

    template<typename T>
    bool RegisterFixup(FixupRegistry::FixupFunc<T> fixup) {
        return m_fixups.Register<T>(FixupName<T>(), std::move(fixup));
    }

    // Systems
    void RegisterSystem(const PipelineSystemPtr& system);
    bool UnregisterSystem(std::string_view name);
    void ClearSystems() { m_systems.clear(); }
    const std::vector<PipelineSystemPtr>& GetSystems() const { return m_systems; }

    // Requests
    void RequestSave(const std::filesystem::path& path);
    void RequestDump(const std::filesystem::path& path);
    void RequestLoad(const std::filesystem::path& path);
    bool HasPendingRequest() const { return m_requests.HasPending(); }
    const Request* GetPendingRequest() const { return m_requests.Peek(); }

    void Update(ecs::World& world, float deltaTime);

    // State
    LoadState GetLoadState() const { return m_loadExecutor.GetState(); }
    // Non-null only while post-load runs.
    const LoadedEntities* GetLoadedEntities() const { return m_loadExecutor.GetLoaded(); }
    const std::optional<SaveLoadResult>& GetLastResult() const { return m_lastResult; }
    void SetCompletionCallback(CompletionCallback callback) { m_onComplete = std::move(callback); }
    std::uint64_t GetTickCount() const { return m_tickCount; }

    const utils::SaveConfig& GetConfig() const { return m_config; }
    void SetConfig(const utils::SaveConfig& config);

private:
    template<typename T>
    std::string FixupName() const {
        if (const auto* binding = m_components.Find<T>()) {
            return binding->typeName;
        }
        core::Logger::Warning("[SavePipeline] Fix-up registered for '{}' which is not a saved component",
                              typeid(T).name());
        return typeid(T).name();
    }

    void RunLoadPhase(ecs::World& world);
    void RunPostLoadPhase(ecs::World& world);
    void RunSystems(ecs::World& world, float deltaTime);
    void RunSavePhase(ecs::World& world);

    void FinishLoad(ecs::World& world);
    void FailLoad(ecs::World& world, const std::string& message);
    void Complete(SaveLoadResult result);
    std::filesystem::path ResolvePath(const std::filesystem::path& path) const;

    utils::SaveConfig m_config;
    ecs::ComponentRegistry m_components;
    FixupRegistry m_fixups;
    SaveExecutor m_saveExecutor;
    LoadExecutor m_loadExecutor;
    RequestSlot m_requests;

    std::vector<PipelineSystemPtr> m_systems;
    std::optional<SaveLoadResult> m_loadResult;
    std::optional<SaveLoadResult> m_lastResult;
    CompletionCallback m_onComplete;
    std::uint64_t m_tickCount = 0;
};

} // namespace ks::save
