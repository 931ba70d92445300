#include "ks/ecs/World.hpp"

#include "ks/core/Error.hpp"
#include "ks/core/Logger.hpp"

#include <algorithm>

namespace ks::ecs {

Entity World::Spawn() {
    std::uint32_t index;
    if (!m_freeIndices.empty()) {
        index = m_freeIndices.back();
        m_freeIndices.pop_back();
    } else {
        index = static_cast<std::uint32_t>(m_slots.size());
        m_slots.emplace_back();
    }

    Slot& slot = m_slots[index];
    slot.alive = true;
    ++m_aliveCount;
    return Entity{index, slot.generation};
}

bool World::Despawn(Entity entity) {
    Slot* slot = Resolve(entity);
    if (!slot) {
        return false;
    }
    Release(entity, *slot);
    return true;
}

bool World::DespawnRecursive(Entity entity) {
    if (!IsAlive(entity)) {
        return false;
    }

    std::vector<Entity> toDespawn;
    toDespawn.push_back(entity);
    std::size_t cursor = 0;
    while (cursor < toDespawn.size()) {
        const Slot* slot = Resolve(toDespawn[cursor++]);
        if (!slot) {
            continue;
        }
        for (const Entity child : slot->children) {
            if (IsAlive(child)) {
                toDespawn.push_back(child);
            }
        }
    }

    // Leaves first so every parent still exists while its children detach.
    for (auto it = toDespawn.rbegin(); it != toDespawn.rend(); ++it) {
        if (Slot* slot = Resolve(*it)) {
            Release(*it, *slot);
        }
    }
    return true;
}

bool World::IsAlive(Entity entity) const {
    return Resolve(entity) != nullptr;
}

std::vector<Entity> World::Entities() const {
    std::vector<Entity> result;
    result.reserve(m_aliveCount);
    for (std::uint32_t index = 0; index < m_slots.size(); ++index) {
        if (m_slots[index].alive) {
            result.push_back(Entity{index, m_slots[index].generation});
        }
    }
    return result;
}

void World::AddRaw(Entity entity, std::type_index type, std::unique_ptr<Component> component) {
    Slot* slot = Resolve(entity);
    if (!slot) {
        throw core::Error(fmt::format("Cannot add component to dead entity {}", entity));
    }
    if (!component) {
        throw core::Error(fmt::format("Cannot add null component to entity {}", entity));
    }
    slot->components[type] = std::move(component);
}

Component* World::GetRaw(Entity entity, std::type_index type) {
    Slot* slot = Resolve(entity);
    if (!slot) {
        return nullptr;
    }
    auto it = slot->components.find(type);
    return it != slot->components.end() ? it->second.get() : nullptr;
}

const Component* World::GetRaw(Entity entity, std::type_index type) const {
    const Slot* slot = Resolve(entity);
    if (!slot) {
        return nullptr;
    }
    auto it = slot->components.find(type);
    return it != slot->components.end() ? it->second.get() : nullptr;
}

bool World::RemoveRaw(Entity entity, std::type_index type) {
    Slot* slot = Resolve(entity);
    if (!slot) {
        return false;
    }
    return slot->components.erase(type) != 0;
}

std::vector<std::type_index> World::ComponentTypes(Entity entity) const {
    std::vector<std::type_index> types;
    const Slot* slot = Resolve(entity);
    if (!slot) {
        return types;
    }
    types.reserve(slot->components.size());
    for (const auto& entry : slot->components) {
        types.push_back(entry.first);
    }
    return types;
}

bool World::SetParent(Entity child, Entity parent) {
    Slot* childSlot = Resolve(child);
    Slot* parentSlot = Resolve(parent);
    if (!childSlot || !parentSlot) {
        core::Logger::Warning("[World] SetParent ignored: {} or {} is not alive", child, parent);
        return false;
    }
    if (child == parent) {
        core::Logger::Warning("[World] Cannot parent entity {} to itself", child);
        return false;
    }

    // Walk up from the new parent to reject cycles.
    std::optional<Entity> ancestor = parent;
    while (ancestor) {
        if (*ancestor == child) {
            core::Logger::Warning("[World] Cannot create cyclic parent-child relationship for {}", child);
            return false;
        }
        ancestor = GetParent(*ancestor);
    }

    if (childSlot->parent == parent) {
        return true;
    }

    DetachFromParent(child, *childSlot);
    childSlot->parent = parent;
    parentSlot->children.push_back(child);
    return true;
}

void World::RemoveParent(Entity child) {
    if (Slot* slot = Resolve(child)) {
        DetachFromParent(child, *slot);
    }
}

std::optional<Entity> World::GetParent(Entity entity) const {
    const Slot* slot = Resolve(entity);
    return slot ? slot->parent : std::nullopt;
}

std::vector<Entity> World::GetChildren(Entity entity) const {
    const Slot* slot = Resolve(entity);
    return slot ? slot->children : std::vector<Entity>{};
}

World::Slot* World::Resolve(Entity entity) {
    if (entity.index >= m_slots.size()) {
        return nullptr;
    }
    Slot& slot = m_slots[entity.index];
    return slot.alive && slot.generation == entity.generation ? &slot : nullptr;
}

const World::Slot* World::Resolve(Entity entity) const {
    if (entity.index >= m_slots.size()) {
        return nullptr;
    }
    const Slot& slot = m_slots[entity.index];
    return slot.alive && slot.generation == entity.generation ? &slot : nullptr;
}

void World::DetachFromParent(Entity child, Slot& slot) {
    if (!slot.parent) {
        return;
    }
    if (Slot* parentSlot = Resolve(*slot.parent)) {
        auto& siblings = parentSlot->children;
        siblings.erase(std::remove(siblings.begin(), siblings.end(), child), siblings.end());
    }
    slot.parent.reset();
}

void World::Release(Entity entity, Slot& slot) {
    DetachFromParent(entity, slot);

    // Children of a plain despawn become roots.
    for (const Entity child : slot.children) {
        if (Slot* childSlot = Resolve(child)) {
            childSlot->parent.reset();
        }
    }
    slot.children.clear();
    slot.components.clear();

    slot.alive = false;
    ++slot.generation;
    --m_aliveCount;
    m_freeIndices.push_back(entity.index);
}

} // namespace ks::ecs
