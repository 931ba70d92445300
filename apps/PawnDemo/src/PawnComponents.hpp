#pragma once
#include "ks/ecs/Component.hpp"
#include "ks/ecs/Entity.hpp"
#include "ks/save/LoadedEntities.hpp"

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>
#include <nlohmann/json_fwd.hpp>

#include <optional>
#include <string>
#include <vector>

namespace ks::save {
class SavePipeline;
}

namespace pawn {

struct Pawn : ks::ecs::Component {};

struct Weapon : ks::ecs::Component {};

struct Position : ks::ecs::Component {
    Position() = default;
    explicit Position(glm::vec2 xy) : value(xy) {}

    glm::vec2 value{0.0f};
};

struct Health : ks::ecs::Component {
    int current = 100;
    int maximum = 100;
};

// Saved reference to the weapon entity a pawn holds.
struct CurrentWeapon : ks::ecs::Component {
    CurrentWeapon() = default;
    explicit CurrentWeapon(ks::ecs::Entity entity) : weapon(entity) {}

    std::optional<ks::ecs::Entity> weapon;

    void FromLoaded(const ks::save::LoadedEntities& loaded) { ks::save::RemapEntity(weapon, loaded); }
};

struct Inventory : ks::ecs::Component {
    std::vector<ks::ecs::Entity> items;

    void FromLoaded(const ks::save::LoadedEntities& loaded) { ks::save::RemapEntity(items, loaded); }
};

// Runtime only: the visual entity spawned for a pawn. Never saved.
struct Sprite : ks::ecs::Component {
    Sprite() = default;
    explicit Sprite(ks::ecs::Entity entity) : model(entity) {}

    ks::ecs::Entity model;
};

struct SpriteTransform : ks::ecs::Component {
    glm::vec3 translation{0.0f};
};

void to_json(nlohmann::json& json, const Position& position);
void from_json(const nlohmann::json& json, Position& position);
void to_json(nlohmann::json& json, const Health& health);
void from_json(const nlohmann::json& json, Health& health);
void to_json(nlohmann::json& json, const CurrentWeapon& current);
void from_json(const nlohmann::json& json, CurrentWeapon& current);
void to_json(nlohmann::json& json, const Inventory& inventory);
void from_json(const nlohmann::json& json, Inventory& inventory);

/**
 * @brief Registers every saved pawn component and the reference fix-ups.
 *
 * Call once per pipeline before any save or load request runs.
 */
void RegisterPawnComponents(ks::save::SavePipeline& pipeline);

} // namespace pawn
