#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ks::save {

struct SceneComponent {
    std::string typeName;
    nlohmann::json data;
};

struct SceneEntity {
    // Index the entity had in the world it was extracted from.
    std::uint32_t index = 0;
    // Index of the parent, present only when the parent was extracted too.
    std::optional<std::uint32_t> parent;
    std::vector<SceneComponent> components;

    const SceneComponent* FindComponent(const std::string& typeName) const;
};

/**
 * @brief Detached capture of a set of entities and their registered components.
 *
 * Holds no reference to the world it came from.
 */
struct SceneSnapshot {
    std::vector<SceneEntity> entities;

    bool Empty() const { return entities.empty(); }
    std::size_t Size() const { return entities.size(); }
    const SceneEntity* FindEntity(std::uint32_t index) const;
};

inline const SceneComponent* SceneEntity::FindComponent(const std::string& typeName) const {
    for (const auto& component : components) {
        if (component.typeName == typeName) {
            return &component;
        }
    }
    return nullptr;
}

inline const SceneEntity* SceneSnapshot::FindEntity(std::uint32_t index) const {
    for (const auto& entity : entities) {
        if (entity.index == index) {
            return &entity;
        }
    }
    return nullptr;
}

} // namespace ks::save
