#include "SpriteSystem.hpp"
#include "PawnComponents.hpp"

#include "ks/core/Logger.hpp"
#include "ks/ecs/World.hpp"
#include "ks/save/Markers.hpp"

#include <vector>

namespace pawn {

void SpriteSystem::Update(ks::ecs::World& world, float deltaTime) {
    (void)deltaTime;

    std::vector<ks::ecs::Entity> missing;
    for (const ks::ecs::Entity entity : world.EntitiesWith<Pawn>()) {
        const Sprite* sprite = world.Get<Sprite>(entity);
        if (!sprite || !world.IsAlive(sprite->model)) {
            missing.push_back(entity);
        }
    }
    for (const ks::ecs::Entity entity : missing) {
        const ks::ecs::Entity model = world.Spawn();
        world.Add<SpriteTransform>(model);
        world.Add<ks::save::Unload>(model);
        world.Add<Sprite>(entity, model);
        ++m_spawned;
    }

    world.View<Sprite>([&world](ks::ecs::Entity entity, Sprite& sprite) {
        const Position* position = world.Get<Position>(entity);
        SpriteTransform* transform = world.Get<SpriteTransform>(sprite.model);
        if (position && transform) {
            transform->translation = glm::vec3(position->value, 0.0f);
        }
    });
}

void SpriteSystem::OnPostLoad(ks::ecs::World& world, const ks::save::LoadedEntities& loaded) {
    (void)world;
    ks::core::Logger::Info("[PawnSprites] {} entities restored; sprites rebuild this tick", loaded.Size());
}

} // namespace pawn
