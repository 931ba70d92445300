#include "ks/save/SaveExecutor.hpp"

#include "ks/core/Error.hpp"
#include "ks/core/Logger.hpp"
#include "ks/ecs/ComponentRegistry.hpp"
#include "ks/ecs/World.hpp"
#include "ks/save/Markers.hpp"
#include "ks/save/SceneExtractor.hpp"
#include "ks/save/SceneSerializer.hpp"

#include <nlohmann/json.hpp>

namespace ks::save {

SaveExecutor::SaveExecutor(const ecs::ComponentRegistry& registry, SaveOptions options)
    : m_registry(registry), m_options(options) {}

std::vector<ecs::Entity> SaveExecutor::SelectEntities(const ecs::World& world, SaveMode mode) {
    switch (mode) {
        case SaveMode::Filtered: return world.EntitiesWith<Persist>();
        case SaveMode::Dump:     return world.Entities();
    }
    return {};
}

SaveLoadResult SaveExecutor::Run(const ecs::World& world, const SaveRequest& request) const {
    SaveLoadResult result;
    result.kind = request.mode == SaveMode::Dump ? RequestKind::Dump : RequestKind::Save;
    result.path = request.path;

    const auto entities = SelectEntities(world, request.mode);

    std::string text;
    try {
        const SceneSnapshot snapshot = SceneExtractor::Extract(world, m_registry, entities);
        result.entityCount = snapshot.Size();
        text = SceneSerializer::Serialize(snapshot, m_options.indent);
    } catch (const nlohmann::json::exception& ex) {
        result.message = fmt::format("serialization failed: {}", ex.what());
        core::Logger::Error("[SaveExecutor] {} '{}': {}", RequestKindName(result.kind),
                            request.path.string(), result.message);
        return result;
    } catch (const std::exception& ex) {
        result.message = fmt::format("extraction failed: {}", ex.what());
        core::Logger::Error("[SaveExecutor] {} '{}': {}", RequestKindName(result.kind),
                            request.path.string(), result.message);
        return result;
    }

    try {
        SceneSerializer::WriteToFile(request.path, text);
    } catch (const core::IoError& ex) {
        result.message = ex.what();
        core::Logger::Error("[SaveExecutor] {} failed: {}", RequestKindName(result.kind), result.message);
        return result;
    }

    result.success = true;
    result.message = fmt::format("{} entities written", result.entityCount);
    core::Logger::Info("[SaveExecutor] {} successful: {} ({} entities)",
                       RequestKindName(result.kind), request.path.string(), result.entityCount);
    return result;
}

} // namespace ks::save
