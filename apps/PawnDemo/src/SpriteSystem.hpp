#pragma once

#include "ks/save/SavePipeline.hpp"

namespace pawn {

/**
 * @brief Spawns a visual entity for every pawn and keeps it at the pawn's position.
 *
 * Visual entities carry Unload: they are cleared before a load and rebuilt
 * from the loaded pawns on the same tick.
 */
class SpriteSystem : public ks::save::PipelineSystem {
public:
    std::string_view GetName() const override { return "PawnSprites"; }
    void Update(ks::ecs::World& world, float deltaTime) override;
    void OnPostLoad(ks::ecs::World& world, const ks::save::LoadedEntities& loaded) override;

    std::size_t GetSpawnedCount() const { return m_spawned; }

private:
    std::size_t m_spawned = 0;
};

} // namespace pawn
