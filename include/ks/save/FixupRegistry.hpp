#pragma once

#include <functional>
#include <string>
#include <type_traits>
#include <vector>

#include "ks/ecs/World.hpp"
#include "ks/save/LoadedEntities.hpp"
#include "ks/save/Markers.hpp"

namespace ks::save {

/**
 * @brief Per-type entity reference rewrites run during the post-load phase.
 *
 * Any saved component that stores entity handles must be registered here,
 * otherwise its references keep pointing at pre-load indices. Rewrites only
 * touch components on entities tagged Restored, so each loaded component is
 * fixed exactly once.
 *
 * @example
 * struct CurrentWeapon : ks::ecs::Component {
 *     std::optional<ks::ecs::Entity> weapon;
 *     void FromLoaded(const ks::save::LoadedEntities& loaded) { ks::save::RemapEntity(weapon, loaded); }
 * };
 * fixups.Register<CurrentWeapon>("CurrentWeapon");
 */
class FixupRegistry {
public:
    template<typename T>
    using FixupFunc = std::function<void(T&, const LoadedEntities&)>;

    // Uses T::FromLoaded(const LoadedEntities&).
    template<typename T>
    bool Register(const std::string& typeName) {
        return Register<T>(typeName, [](T& component, const LoadedEntities& loaded) {
            component.FromLoaded(loaded);
        });
    }

    template<typename T>
    bool Register(const std::string& typeName, FixupFunc<T> fixup) {
        static_assert(std::is_base_of_v<ecs::Component, T>, "T must inherit from Component");
        if (!fixup || IsRegistered(typeName)) {
            return false;
        }
        m_entries.push_back({typeName, [fixup](ecs::World& world, const LoadedEntities& loaded) {
            std::size_t rewritten = 0;
            world.View<T>([&](ecs::Entity entity, T& component) {
                if (world.Has<Restored>(entity)) {
                    fixup(component, loaded);
                    ++rewritten;
                }
            });
            return rewritten;
        }});
        return true;
    }

    bool Unregister(const std::string& typeName);
    bool IsRegistered(const std::string& typeName) const;
    std::vector<std::string> GetRegisteredTypes() const;
    void Clear() { m_entries.clear(); }

    /**
     * @brief Run every registered rewrite in registration order.
     * @return number of components rewritten
     * @throws core::IntegrityError if a reference has no mapping
     */
    std::size_t Apply(ecs::World& world, const LoadedEntities& loaded) const;

private:
    struct Entry {
        std::string typeName;
        std::function<std::size_t(ecs::World&, const LoadedEntities&)> apply;
    };

    std::vector<Entry> m_entries;
};

} // namespace ks::save
