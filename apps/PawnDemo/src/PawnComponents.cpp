#include "PawnComponents.hpp"

#include "ks/save/SavePipeline.hpp"
#include "ks/utils/JsonMath.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace pawn {

void to_json(json& j, const Position& position) {
    j = json{{"xy", ks::utils::Vec2ToJson(position.value)}};
}

void from_json(const json& j, Position& position) {
    position.value = ks::utils::JsonToVec2(j.at("xy"));
}

void to_json(json& j, const Health& health) {
    j = json{{"current", health.current}, {"maximum", health.maximum}};
}

void from_json(const json& j, Health& health) {
    health.current = j.at("current").get<int>();
    health.maximum = j.value("maximum", health.current);
}

void to_json(json& j, const CurrentWeapon& current) {
    j = json::object();
    j["weapon"] = current.weapon ? json(*current.weapon) : json(nullptr);
}

void from_json(const json& j, CurrentWeapon& current) {
    current.weapon.reset();
    auto it = j.find("weapon");
    if (it != j.end() && !it->is_null()) {
        current.weapon = it->get<ks::ecs::Entity>();
    }
}

void to_json(json& j, const Inventory& inventory) {
    j = json{{"items", inventory.items}};
}

void from_json(const json& j, Inventory& inventory) {
    inventory.items = j.value("items", std::vector<ks::ecs::Entity>{});
}

void RegisterPawnComponents(ks::save::SavePipeline& pipeline) {
    auto& registry = pipeline.GetComponentRegistry();
    registry.RegisterTag<Pawn>("Pawn");
    registry.RegisterTag<Weapon>("Weapon");
    registry.Register<Position>("Position");
    registry.Register<Health>("Health");
    registry.Register<CurrentWeapon>("CurrentWeapon");
    registry.Register<Inventory>("Inventory");

    pipeline.RegisterFixup<CurrentWeapon>();
    pipeline.RegisterFixup<Inventory>();
}

} // namespace pawn
