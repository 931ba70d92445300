#include "PawnComponents.hpp"

#include "ks/core/Error.hpp"
#include "ks/ecs/World.hpp"
#include "ks/save/FixupRegistry.hpp"
#include "ks/save/Markers.hpp"

#include <catch2/catch_test_macros.hpp>

TEST_CASE("FixupRegistry rewrites references on restored entities only", "[save][fixup]") {
    ks::ecs::World world;
    ks::save::FixupRegistry fixups;
    REQUIRE(fixups.Register<pawn::CurrentWeapon>("CurrentWeapon"));

    const auto weapon = world.Spawn();
    const auto restored = world.Spawn();
    world.Add<pawn::CurrentWeapon>(restored, ks::ecs::Entity{0, 0});
    world.Add<ks::save::Restored>(restored, 1u);

    // Live reference that did not come from the load; the index is deliberately in the mapping.
    const auto untouched = world.Spawn();
    world.Add<pawn::CurrentWeapon>(untouched, ks::ecs::Entity{0, 0});

    ks::save::LoadedEntities loaded;
    loaded.Insert(0, weapon);
    loaded.Insert(1, restored);

    REQUIRE(fixups.Apply(world, loaded) == 1);
    REQUIRE(world.Get<pawn::CurrentWeapon>(restored)->weapon == weapon);
    REQUIRE(world.Get<pawn::CurrentWeapon>(untouched)->weapon == ks::ecs::Entity{0, 0});
}

TEST_CASE("FixupRegistry accepts custom rewrite functions", "[save][fixup]") {
    ks::ecs::World world;
    ks::save::FixupRegistry fixups;
    int calls = 0;
    REQUIRE(fixups.Register<pawn::Inventory>(
        "Inventory", [&calls](pawn::Inventory& inventory, const ks::save::LoadedEntities& loaded) {
            ++calls;
            ks::save::RemapEntity(inventory.items, loaded);
        }));
    REQUIRE_FALSE(fixups.Register<pawn::Inventory>("Inventory"));
    REQUIRE(fixups.GetRegisteredTypes() == std::vector<std::string>{"Inventory"});

    const auto holder = world.Spawn();
    auto& inventory = world.Add<pawn::Inventory>(holder);
    inventory.items = {ks::ecs::Entity{3, 0}, ks::ecs::Entity{4, 0}};
    world.Add<ks::save::Restored>(holder, 2u);

    ks::save::LoadedEntities loaded;
    loaded.Insert(3, ks::ecs::Entity{10, 1});
    loaded.Insert(4, ks::ecs::Entity{11, 1});

    fixups.Apply(world, loaded);
    REQUIRE(calls == 1);
    REQUIRE(world.Get<pawn::Inventory>(holder)->items ==
            std::vector<ks::ecs::Entity>{{10, 1}, {11, 1}});

    REQUIRE(fixups.Unregister("Inventory"));
    REQUIRE(fixups.Apply(world, loaded) == 0);
}

TEST_CASE("FixupRegistry propagates missing mappings", "[save][fixup]") {
    ks::ecs::World world;
    ks::save::FixupRegistry fixups;
    fixups.Register<pawn::CurrentWeapon>("CurrentWeapon");

    const auto holder = world.Spawn();
    world.Add<pawn::CurrentWeapon>(holder, ks::ecs::Entity{7, 0});
    world.Add<ks::save::Restored>(holder, 0u);

    ks::save::LoadedEntities loaded;
    loaded.Insert(0, holder);

    REQUIRE_THROWS_AS(fixups.Apply(world, loaded), ks::core::IntegrityError);
}
