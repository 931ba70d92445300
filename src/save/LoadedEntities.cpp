#include "ks/save/LoadedEntities.hpp"

#include "ks/core/Error.hpp"
#include "ks/core/Logger.hpp"

namespace ks::save {

void LoadedEntities::Insert(std::uint32_t previousIndex, ecs::Entity entity) {
    auto [it, inserted] = m_entities.emplace(previousIndex, entity);
    if (!inserted) {
        core::Logger::Warning("[LoadedEntities] Index {} mapped twice ({} replaced by {})",
                              previousIndex, it->second, entity);
        it->second = entity;
    }
}

std::optional<ecs::Entity> LoadedEntities::FindIndex(std::uint32_t previousIndex) const {
    auto it = m_entities.find(previousIndex);
    if (it == m_entities.end()) {
        return std::nullopt;
    }
    return it->second;
}

ecs::Entity LoadedEntities::Resolve(ecs::Entity previous) const {
    if (auto entity = Find(previous)) {
        return *entity;
    }
    throw core::IntegrityError(previous.index, "is referenced by a loaded component but was not saved");
}

void RemapEntity(ecs::Entity& entity, const LoadedEntities& loaded) {
    if (!entity.IsValid()) {
        return;
    }
    entity = loaded.Resolve(entity);
}

void RemapEntity(std::optional<ecs::Entity>& entity, const LoadedEntities& loaded) {
    if (entity) {
        RemapEntity(*entity, loaded);
    }
}

void RemapEntity(std::vector<ecs::Entity>& entities, const LoadedEntities& loaded) {
    for (auto& entity : entities) {
        RemapEntity(entity, loaded);
    }
}

} // namespace ks::save
