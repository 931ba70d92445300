#pragma once

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

#include "ks/ecs/Entity.hpp"

namespace ks::save {

/**
 * @brief Mapping from the index an entity had when saved to the entity a load created.
 *
 * Loads never preserve identities: the saved index may already be taken by an
 * entity that does not take part in saving. Components that reference other
 * entities use this mapping during the post-load phase to point at the new
 * entities. Lookups use the index alone since generations are not saved.
 */
class LoadedEntities {
public:
    void Insert(std::uint32_t previousIndex, ecs::Entity entity);

    std::optional<ecs::Entity> Find(ecs::Entity previous) const { return FindIndex(previous.index); }
    std::optional<ecs::Entity> FindIndex(std::uint32_t previousIndex) const;

    // Throws core::IntegrityError when `previous` was not part of the loaded scene.
    ecs::Entity Resolve(ecs::Entity previous) const;

    std::size_t Size() const { return m_entities.size(); }
    bool Empty() const { return m_entities.empty(); }

    auto begin() const { return m_entities.begin(); }
    auto end() const { return m_entities.end(); }

private:
    std::unordered_map<std::uint32_t, ecs::Entity> m_entities;
};

// Rewrite a saved reference in place. Invalid handles are left untouched.
void RemapEntity(ecs::Entity& entity, const LoadedEntities& loaded);
void RemapEntity(std::optional<ecs::Entity>& entity, const LoadedEntities& loaded);
void RemapEntity(std::vector<ecs::Entity>& entities, const LoadedEntities& loaded);

} // namespace ks::save
