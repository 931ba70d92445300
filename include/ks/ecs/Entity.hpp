#pragma once

#include <cstdint>
#include <functional>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace ks::ecs {

/**
 * @brief Handle naming one entity in a World.
 *
 * The index is a slot in the world's arena and is recycled after a despawn.
 * The generation is bumped on every recycle so stale handles stop resolving.
 * Only the index is meaningful across a save/load boundary.
 */
struct Entity {
    static constexpr std::uint32_t kInvalidIndex = std::numeric_limits<std::uint32_t>::max();

    std::uint32_t index = kInvalidIndex;
    std::uint32_t generation = 0;

    constexpr bool IsValid() const { return index != kInvalidIndex; }

    constexpr bool operator==(const Entity&) const = default;
};

inline constexpr Entity kInvalidEntity{};

struct EntityHash {
    std::size_t operator()(const Entity& e) const {
        return std::hash<std::uint64_t>{}(static_cast<std::uint64_t>(e.generation) << 32 | e.index);
    }
};

// Entity references are persisted by index only; the generation is never written.
inline void to_json(nlohmann::json& json, const Entity& entity) {
    if (entity.IsValid()) {
        json = entity.index;
    } else {
        json = nullptr;
    }
}

inline void from_json(const nlohmann::json& json, Entity& entity) {
    if (json.is_null()) {
        entity = kInvalidEntity;
        return;
    }
    if (!json.is_number_unsigned()) {
        throw std::invalid_argument("entity reference must be an unsigned index, got " + json.dump());
    }
    const auto raw = json.get<std::uint64_t>();
    if (raw >= Entity::kInvalidIndex) {
        throw std::out_of_range("entity reference " + json.dump() + " is out of range");
    }
    entity = Entity{static_cast<std::uint32_t>(raw), 0};
}

} // namespace ks::ecs

template<>
struct fmt::formatter<ks::ecs::Entity> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const ks::ecs::Entity& entity, FormatContext& ctx) const {
        if (!entity.IsValid()) {
            return fmt::format_to(ctx.out(), "<invalid>");
        }
        return fmt::format_to(ctx.out(), "{}v{}", entity.index, entity.generation);
    }
};
