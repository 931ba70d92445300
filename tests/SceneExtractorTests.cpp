#include "PawnComponents.hpp"

#include "ks/ecs/ComponentRegistry.hpp"
#include "ks/ecs/World.hpp"
#include "ks/save/Markers.hpp"
#include "ks/save/SceneExtractor.hpp"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

namespace {

ks::ecs::ComponentRegistry MakeRegistry() {
    ks::ecs::ComponentRegistry registry;
    registry.RegisterTag<pawn::Pawn>("Pawn");
    registry.RegisterTag<pawn::Weapon>("Weapon");
    registry.Register<pawn::Position>("Position");
    registry.Register<pawn::CurrentWeapon>("CurrentWeapon");
    return registry;
}

} // namespace

TEST_CASE("SceneExtractor captures registered components only", "[save][extractor]") {
    const auto registry = MakeRegistry();
    ks::ecs::World world;

    const auto weapon = world.Spawn();
    world.Add<pawn::Weapon>(weapon);
    const auto pawnEntity = world.Spawn();
    world.Add<pawn::Pawn>(pawnEntity);
    world.Add<pawn::Position>(pawnEntity, glm::vec2(1.0f, 2.0f));
    world.Add<pawn::CurrentWeapon>(pawnEntity, weapon);
    world.Add<pawn::SpriteTransform>(pawnEntity);
    world.Add<ks::save::Persist>(pawnEntity);

    const auto snapshot = ks::save::SceneExtractor::Extract(world, registry, {pawnEntity});

    REQUIRE(snapshot.Size() == 1);
    const auto& entity = snapshot.entities.front();
    REQUIRE(entity.index == pawnEntity.index);
    REQUIRE_FALSE(entity.parent.has_value());

    std::vector<std::string> names;
    for (const auto& component : entity.components) {
        names.push_back(component.typeName);
    }
    REQUIRE(names == std::vector<std::string>{"CurrentWeapon", "Pawn", "Position"});

    const auto* current = entity.FindComponent("CurrentWeapon");
    REQUIRE(current != nullptr);
    REQUIRE(current->data["weapon"].get<std::uint32_t>() == weapon.index);
    REQUIRE(entity.FindComponent("Position")->data["xy"][1].get<float>() == 2.0f);
}

TEST_CASE("SceneExtractor keeps exactly the requested entities", "[save][extractor]") {
    const auto registry = MakeRegistry();
    ks::ecs::World world;
    const auto a = world.Spawn();
    const auto b = world.Spawn();
    const auto dead = world.Spawn();
    world.Despawn(dead);
    world.Spawn();

    const auto snapshot = ks::save::SceneExtractor::Extract(world, registry, {b, a, dead, b});

    REQUIRE(snapshot.Size() == 2);
    REQUIRE(snapshot.entities[0].index == b.index);
    REQUIRE(snapshot.entities[1].index == a.index);
    REQUIRE(snapshot.entities[0].components.empty());
}

TEST_CASE("SceneExtractor records parents inside the selection", "[save][extractor][hierarchy]") {
    const auto registry = MakeRegistry();
    ks::ecs::World world;
    const auto outsider = world.Spawn();
    const auto root = world.Spawn();
    const auto child = world.Spawn();
    world.SetParent(root, outsider);
    world.SetParent(child, root);

    const auto snapshot = ks::save::SceneExtractor::Extract(world, registry, {root, child});

    REQUIRE(snapshot.Size() == 2);
    REQUIRE_FALSE(snapshot.FindEntity(root.index)->parent.has_value());
    REQUIRE(snapshot.FindEntity(child.index)->parent == root.index);
}

TEST_CASE("SceneExtractor of an empty selection is empty", "[save][extractor]") {
    const auto registry = MakeRegistry();
    ks::ecs::World world;
    world.Spawn();

    REQUIRE(ks::save::SceneExtractor::Extract(world, registry, {}).Empty());
}
