#include "ks/ecs/ComponentRegistry.hpp"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace {

struct Speed : ks::ecs::Component {
    float value = 0.0f;
};

void to_json(nlohmann::json& j, const Speed& speed) {
    j = nlohmann::json{{"value", speed.value}};
}

void from_json(const nlohmann::json& j, Speed& speed) {
    speed.value = j.at("value").get<float>();
}

struct Marker : ks::ecs::Component {};

struct Score : ks::ecs::Component {
    int points = 0;
};

} // namespace

TEST_CASE("ComponentRegistry binds names to types", "[ecs][registry]") {
    ks::ecs::ComponentRegistry registry;
    REQUIRE(registry.Register<Speed>("Speed"));
    REQUIRE(registry.RegisterTag<Marker>("Marker"));

    const auto* byName = registry.FindByName("Speed");
    REQUIRE(byName != nullptr);
    REQUIRE(byName->type == std::type_index(typeid(Speed)));
    REQUIRE(registry.Find<Marker>() == registry.FindByName("Marker"));
    REQUIRE(registry.FindByName("Missing") == nullptr);
    REQUIRE(registry.Find<Score>() == nullptr);
    REQUIRE(registry.GetRegisteredTypes() == std::vector<std::string>{"Marker", "Speed"});
}

TEST_CASE("ComponentRegistry rejects duplicate names and types", "[ecs][registry]") {
    ks::ecs::ComponentRegistry registry;
    REQUIRE(registry.Register<Speed>("Speed"));
    REQUIRE_FALSE(registry.Register<Speed>("Velocity"));
    REQUIRE_FALSE(registry.RegisterTag<Marker>("Speed"));
    REQUIRE(registry.GetRegisteredTypes().size() == 1);
}

TEST_CASE("ComponentRegistry converts components through their bindings", "[ecs][registry]") {
    ks::ecs::ComponentRegistry registry;
    registry.Register<Speed>("Speed");
    registry.RegisterTag<Marker>("Marker");

    Speed speed;
    speed.value = 2.5f;
    const auto* binding = registry.Find<Speed>();
    const nlohmann::json data = binding->serialize(speed);
    REQUIRE(data["value"].get<float>() == 2.5f);

    auto restored = binding->deserialize(data);
    REQUIRE(static_cast<Speed&>(*restored).value == 2.5f);

    REQUIRE(registry.Find<Marker>()->serialize(Marker{}) == nlohmann::json::object());
    REQUIRE_THROWS(binding->deserialize(nlohmann::json{{"other", 1}}));
}

TEST_CASE("ComponentRegistry accepts explicit conversion functions", "[ecs][registry]") {
    ks::ecs::ComponentRegistry registry;
    REQUIRE(registry.Register<Score>(
        "Score",
        [](const Score& score) { return nlohmann::json(score.points); },
        [](const nlohmann::json& data, Score& score) {
            if (!data.is_number_integer()) {
                throw std::invalid_argument("score must be an integer");
            }
            score.points = data.get<int>();
        }));

    const auto* binding = registry.FindByName("Score");
    auto restored = binding->deserialize(nlohmann::json(12));
    REQUIRE(static_cast<Score&>(*restored).points == 12);
    REQUIRE_THROWS_AS(binding->deserialize(nlohmann::json("twelve")), std::invalid_argument);
}

TEST_CASE("ComponentRegistry unregisters and clears", "[ecs][registry]") {
    ks::ecs::ComponentRegistry registry;
    registry.Register<Speed>("Speed");
    registry.RegisterTag<Marker>("Marker");

    REQUIRE(registry.Unregister("Speed"));
    REQUIRE_FALSE(registry.Unregister("Speed"));
    REQUIRE_FALSE(registry.IsRegistered("Speed"));
    REQUIRE(registry.Find<Marker>()->typeName == "Marker");

    REQUIRE(registry.Register<Speed>("Speed"));
    registry.Clear();
    REQUIRE(registry.GetRegisteredTypes().empty());
}
