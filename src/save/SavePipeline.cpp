#include "ks/save/SavePipeline.hpp"

#include "ks/core/Error.hpp"
#include "ks/ecs/World.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace ks::save {

namespace {
SaveOptions ToSaveOptions(const utils::SaveConfig& config) {
    SaveOptions options;
    options.indent = config.indent;
    return options;
}
} // namespace

SavePipeline::SavePipeline(utils::SaveConfig config)
    : m_config(std::move(config)),
      m_saveExecutor(m_components, ToSaveOptions(m_config)),
      m_loadExecutor(m_components) {}

void SavePipeline::SetConfig(const utils::SaveConfig& config) {
    m_config = config;
    m_saveExecutor.SetOptions(ToSaveOptions(m_config));
}

void SavePipeline::RegisterSystem(const PipelineSystemPtr& system) {
    if (!system) {
        core::Logger::Warning("[SavePipeline] Attempted to register null PipelineSystem");
        return;
    }

    std::string_view nameView = system->GetName();
    if (nameView.empty()) {
        core::Logger::Warning("[SavePipeline] PipelineSystem with empty name ignored");
        return;
    }

    auto duplicate = std::find_if(m_systems.begin(), m_systems.end(),
        [nameView](const PipelineSystemPtr& existing) {
            return existing && existing->GetName() == nameView;
        });
    if (duplicate != m_systems.end()) {
        core::Logger::Warning("[SavePipeline] PipelineSystem '{}' already registered", nameView);
        return;
    }

    m_systems.push_back(system);
}

bool SavePipeline::UnregisterSystem(std::string_view name) {
    auto it = std::find_if(m_systems.begin(), m_systems.end(),
        [name](const PipelineSystemPtr& system) {
            return system && system->GetName() == name;
        });
    if (it == m_systems.end()) {
        return false;
    }
    m_systems.erase(it);
    return true;
}

void SavePipeline::RequestSave(const std::filesystem::path& path) {
    m_requests.Submit(SaveRequest{ResolvePath(path), SaveMode::Filtered});
}

void SavePipeline::RequestDump(const std::filesystem::path& path) {
    m_requests.Submit(SaveRequest{ResolvePath(path), SaveMode::Dump});
}

void SavePipeline::RequestLoad(const std::filesystem::path& path) {
    m_requests.Submit(LoadRequest{ResolvePath(path)});
}

void SavePipeline::Update(ecs::World& world, float deltaTime) {
    ++m_tickCount;

    if (m_requests.HasPendingLoad()) {
        RunLoadPhase(world);
        RunPostLoadPhase(world);
    }

    RunSystems(world, deltaTime);

    if (m_requests.HasPendingSave()) {
        RunSavePhase(world);
    }
}

void SavePipeline::RunLoadPhase(ecs::World& world) {
    auto request = m_requests.Take();
    const auto& load = std::get<LoadRequest>(*request);
    core::Logger::Debug("[SavePipeline] Tick {}: load phase for '{}'", m_tickCount, load.path.string());
    m_loadResult = m_loadExecutor.Run(world, load);
}

void SavePipeline::RunPostLoadPhase(ecs::World& world) {
    const LoadedEntities* loaded = m_loadExecutor.GetLoaded();
    if (loaded) {
        try {
            const std::size_t rewritten = m_fixups.Apply(world, *loaded);
            core::Logger::Debug("[SavePipeline] Post-load fixed {} component(s)", rewritten);
            for (auto& system : m_systems) {
                if (system) {
                    system->OnPostLoad(world, *loaded);
                }
            }
        } catch (const core::IntegrityError& ex) {
            core::Logger::Error("[SavePipeline] Reference fix-up failed: {}", ex.what());
            FailLoad(world, ex.what());
            throw;
        } catch (const std::exception& ex) {
            core::Logger::Error("[SavePipeline] Post-load failed: {}", ex.what());
            FailLoad(world, ex.what());
            throw;
        }
    }
    FinishLoad(world);
}

void SavePipeline::RunSystems(ecs::World& world, float deltaTime) {
    for (auto& system : m_systems) {
        if (system) {
            system->Update(world, deltaTime);
        }
    }
}

void SavePipeline::RunSavePhase(ecs::World& world) {
    auto request = m_requests.Take();
    const auto& save = std::get<SaveRequest>(*request);
    core::Logger::Debug("[SavePipeline] Tick {}: save phase for '{}'", m_tickCount, save.path.string());
    Complete(m_saveExecutor.Run(world, save));
}

void SavePipeline::FinishLoad(ecs::World& world) {
    m_loadExecutor.Finish(world);
    if (m_loadResult) {
        SaveLoadResult result = std::move(*m_loadResult);
        m_loadResult.reset();
        Complete(std::move(result));
    }
}

// Restored tags and the mapping never outlive the tick, even when post-load throws.
void SavePipeline::FailLoad(ecs::World& world, const std::string& message) {
    if (m_loadResult) {
        m_loadResult->success = false;
        m_loadResult->message = message;
    }
    FinishLoad(world);
}

void SavePipeline::Complete(SaveLoadResult result) {
    m_lastResult = std::move(result);
    if (m_onComplete) {
        m_onComplete(*m_lastResult);
    }
}

std::filesystem::path SavePipeline::ResolvePath(const std::filesystem::path& path) const {
    if (m_config.directory.empty() || path.is_absolute()) {
        return path;
    }
    return m_config.directory / path;
}

} // namespace ks::save
