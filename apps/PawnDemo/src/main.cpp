#include <filesystem>
#include <memory>

#include "PawnComponents.hpp"
#include "SpriteSystem.hpp"
#include "ks/core/Logger.hpp"
#include "ks/ecs/World.hpp"
#include "ks/save/Markers.hpp"
#include "ks/save/SavePipeline.hpp"
#include "ks/utils/Config.hpp"

namespace {

constexpr float kTickSeconds = 1.0f / 60.0f;
constexpr const char* kSaveFile = "pawn.json";

void SetupPipeline(ks::save::SavePipeline& pipeline) {
    pawn::RegisterPawnComponents(pipeline);
    pipeline.RegisterSystem(std::make_shared<pawn::SpriteSystem>());
}

bool SaveStep(const ks::utils::SaveConfig& config) {
    ks::ecs::World world;
    ks::save::SavePipeline pipeline(config);
    SetupPipeline(pipeline);

    const ks::ecs::Entity weapon = world.Spawn();
    world.Add<pawn::Weapon>(weapon);
    world.Add<ks::save::Persist>(weapon);

    const ks::ecs::Entity pawnEntity = world.Spawn();
    world.Add<pawn::Pawn>(pawnEntity);
    world.Add<pawn::CurrentWeapon>(pawnEntity, weapon);
    world.Add<pawn::Position>(pawnEntity, glm::vec2(4.0f, 7.0f));
    world.Add<ks::save::Persist>(pawnEntity);
    pipeline.Update(world, kTickSeconds);

    if (!world.Has<pawn::Sprite>(pawnEntity)) {
        ks::core::Logger::Error("[PawnDemo] Pawn {} has no sprite before save", pawnEntity);
        return false;
    }

    pipeline.RequestSave(kSaveFile);
    pipeline.Update(world, kTickSeconds);

    const auto& result = pipeline.GetLastResult();
    return result && result->success;
}

bool LoadStep(const ks::utils::SaveConfig& config) {
    ks::ecs::World world;
    ks::save::SavePipeline pipeline(config);
    SetupPipeline(pipeline);

    // Occupy the saved indices so loaded entities are forced onto new ones.
    world.Spawn();
    world.Spawn();
    world.Spawn();

    pipeline.RequestLoad(kSaveFile);
    pipeline.Update(world, kTickSeconds);

    const auto pawns = world.EntitiesWith<pawn::Pawn>();
    const auto weapons = world.EntitiesWith<pawn::Weapon>();
    if (pawns.size() != 1 || weapons.size() != 1) {
        ks::core::Logger::Error("[PawnDemo] Expected one pawn and one weapon, found {} and {}",
                                pawns.size(), weapons.size());
        return false;
    }

    const auto* current = world.Get<pawn::CurrentWeapon>(pawns.front());
    if (!current || !current->weapon || *current->weapon != weapons.front()) {
        ks::core::Logger::Error("[PawnDemo] Pawn {} does not hold weapon {}", pawns.front(), weapons.front());
        return false;
    }
    if (!world.Has<pawn::Sprite>(pawns.front())) {
        ks::core::Logger::Error("[PawnDemo] Pawn {} has no sprite after load", pawns.front());
        return false;
    }

    ks::core::Logger::Info("[PawnDemo] Pawn {} holds weapon {} after load", pawns.front(), weapons.front());
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    const std::filesystem::path configPath =
        argc > 1 ? std::filesystem::path(argv[1]) : std::filesystem::path(KS_DEMO_CONFIG_PATH);
    auto configResult = ks::utils::ConfigLoader::Load(configPath);
    if (configResult.HasErrors()) {
        return 1;
    }
    ks::utils::ConfigLoader::ApplyLogging(configResult.config.logging);

    if (!SaveStep(configResult.config.save)) {
        return 1;
    }
    if (!LoadStep(configResult.config.save)) {
        return 1;
    }
    return 0;
}
