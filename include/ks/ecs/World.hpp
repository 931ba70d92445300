#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "ks/ecs/Component.hpp"
#include "ks/ecs/Entity.hpp"

namespace ks::ecs {

/**
 * @brief Arena-backed entity store.
 *
 * Entities live in index slots; despawned slots go on a free list and are
 * reused with a bumped generation. Each entity owns at most one component of
 * each type and may have one parent and any number of children.
 */
class World {
public:
    World() = default;
    World(const World&) = delete;
    World& operator=(const World&) = delete;

    // Entities
    Entity Spawn();
    bool Despawn(Entity entity);
    // Despawns the entity and every descendant. Returns false if the entity was not alive.
    bool DespawnRecursive(Entity entity);
    bool IsAlive(Entity entity) const;
    std::size_t Size() const { return m_aliveCount; }
    // Live entities in index order.
    std::vector<Entity> Entities() const;

    // Components
    template<typename T, typename... Args>
    T& Add(Entity entity, Args&&... args) {
        static_assert(std::is_base_of_v<Component, T>, "T must inherit from Component");
        auto component = std::make_unique<T>(std::forward<Args>(args)...);
        T& ref = *component;
        AddRaw(entity, std::type_index(typeid(T)), std::move(component));
        return ref;
    }

    template<typename T>
    T* Get(Entity entity) {
        return static_cast<T*>(GetRaw(entity, std::type_index(typeid(T))));
    }

    template<typename T>
    const T* Get(Entity entity) const {
        return static_cast<const T*>(GetRaw(entity, std::type_index(typeid(T))));
    }

    template<typename T>
    bool Has(Entity entity) const {
        return GetRaw(entity, std::type_index(typeid(T))) != nullptr;
    }

    template<typename T>
    bool Remove(Entity entity) {
        return RemoveRaw(entity, std::type_index(typeid(T)));
    }

    // Calls fn(Entity, T&) for every live entity carrying T.
    template<typename T, typename Fn>
    void View(Fn&& fn) {
        const std::type_index type(typeid(T));
        for (std::uint32_t index = 0; index < m_slots.size(); ++index) {
            Slot& slot = m_slots[index];
            if (!slot.alive) {
                continue;
            }
            auto it = slot.components.find(type);
            if (it != slot.components.end()) {
                fn(Entity{index, slot.generation}, static_cast<T&>(*it->second));
            }
        }
    }

    template<typename T>
    std::vector<Entity> EntitiesWith() const {
        const std::type_index type(typeid(T));
        std::vector<Entity> result;
        for (std::uint32_t index = 0; index < m_slots.size(); ++index) {
            const Slot& slot = m_slots[index];
            if (slot.alive && slot.components.count(type) != 0) {
                result.push_back(Entity{index, slot.generation});
            }
        }
        return result;
    }

    // Type-erased access used by the component registry.
    void AddRaw(Entity entity, std::type_index type, std::unique_ptr<Component> component);
    Component* GetRaw(Entity entity, std::type_index type);
    const Component* GetRaw(Entity entity, std::type_index type) const;
    bool RemoveRaw(Entity entity, std::type_index type);
    std::vector<std::type_index> ComponentTypes(Entity entity) const;

    // Hierarchy
    bool SetParent(Entity child, Entity parent);
    void RemoveParent(Entity child);
    std::optional<Entity> GetParent(Entity entity) const;
    std::vector<Entity> GetChildren(Entity entity) const;

private:
    struct Slot {
        std::uint32_t generation = 0;
        bool alive = false;
        std::unordered_map<std::type_index, std::unique_ptr<Component>> components;
        std::optional<Entity> parent;
        std::vector<Entity> children;
    };

    Slot* Resolve(Entity entity);
    const Slot* Resolve(Entity entity) const;
    void DetachFromParent(Entity child, Slot& slot);
    void Release(Entity entity, Slot& slot);

    std::vector<Slot> m_slots;
    std::vector<std::uint32_t> m_freeIndices;
    std::size_t m_aliveCount = 0;
};

} // namespace ks::ecs
