#include "ks/core/Error.hpp"
#include "ks/save/LoadedEntities.hpp"

#include <catch2/catch_test_macros.hpp>

namespace {

ks::save::LoadedEntities MakeMapping() {
    ks::save::LoadedEntities loaded;
    loaded.Insert(0, ks::ecs::Entity{5, 2});
    loaded.Insert(1, ks::ecs::Entity{6, 0});
    return loaded;
}

} // namespace

TEST_CASE("LoadedEntities maps saved indices to new entities", "[save][mapping]") {
    const auto loaded = MakeMapping();

    REQUIRE(loaded.Size() == 2);
    REQUIRE(loaded.FindIndex(0) == ks::ecs::Entity{5, 2});
    REQUIRE_FALSE(loaded.FindIndex(3).has_value());

    // Generations are not saved, so lookups ignore them.
    REQUIRE(loaded.Find(ks::ecs::Entity{1, 7}) == ks::ecs::Entity{6, 0});
    REQUIRE(loaded.Resolve(ks::ecs::Entity{1, 0}) == ks::ecs::Entity{6, 0});
}

TEST_CASE("LoadedEntities raises an integrity error for unsaved references", "[save][mapping]") {
    const auto loaded = MakeMapping();
    try {
        loaded.Resolve(ks::ecs::Entity{42, 0});
        FAIL("Expected an integrity error");
    } catch (const ks::core::IntegrityError& ex) {
        REQUIRE(ex.index() == 42);
    }
}

TEST_CASE("RemapEntity rewrites single, optional and list references", "[save][mapping]") {
    const auto loaded = MakeMapping();

    ks::ecs::Entity single{0, 0};
    ks::save::RemapEntity(single, loaded);
    REQUIRE(single == ks::ecs::Entity{5, 2});

    ks::ecs::Entity invalid = ks::ecs::kInvalidEntity;
    ks::save::RemapEntity(invalid, loaded);
    REQUIRE_FALSE(invalid.IsValid());

    std::optional<ks::ecs::Entity> none;
    ks::save::RemapEntity(none, loaded);
    REQUIRE_FALSE(none.has_value());

    std::optional<ks::ecs::Entity> some = ks::ecs::Entity{1, 0};
    ks::save::RemapEntity(some, loaded);
    REQUIRE(some == ks::ecs::Entity{6, 0});

    std::vector<ks::ecs::Entity> list{{1, 0}, {0, 0}};
    ks::save::RemapEntity(list, loaded);
    REQUIRE(list == std::vector<ks::ecs::Entity>{{6, 0}, {5, 2}});

    std::vector<ks::ecs::Entity> broken{{1, 0}, {9, 0}};
    REQUIRE_THROWS_AS(ks::save::RemapEntity(broken, loaded), ks::core::IntegrityError);
}
