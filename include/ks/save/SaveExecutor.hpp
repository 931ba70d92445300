#pragma once

#include <vector>

#include "ks/ecs/Entity.hpp"
#include "ks/save/Request.hpp"

namespace ks::ecs {
class World;
class ComponentRegistry;
}

namespace ks::save {

struct SaveOptions {
    int indent = 2;
};

/**
 * @brief Executes save and dump requests.
 *
 * Never modifies the world. Failures are logged and reported in the returned
 * result, never thrown.
 */
class SaveExecutor {
public:
    SaveExecutor(const ecs::ComponentRegistry& registry, SaveOptions options = {});

    SaveLoadResult Run(const ecs::World& world, const SaveRequest& request) const;

    // Filtered: entities with Persist. Dump: every live entity.
    static std::vector<ecs::Entity> SelectEntities(const ecs::World& world, SaveMode mode);

    const SaveOptions& GetOptions() const { return m_options; }
    void SetOptions(const SaveOptions& options) { m_options = options; }

private:
    const ecs::ComponentRegistry& m_registry;
    SaveOptions m_options;
};

} // namespace ks::save
