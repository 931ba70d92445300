#pragma once

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>
#include <nlohmann/json.hpp>

namespace ks::utils {

inline nlohmann::json Vec2ToJson(const glm::vec2& v) {
    return nlohmann::json::array({v.x, v.y});
}

inline nlohmann::json Vec3ToJson(const glm::vec3& v) {
    return nlohmann::json::array({v.x, v.y, v.z});
}

// Malformed input yields `fallback`.
inline glm::vec2 JsonToVec2(const nlohmann::json& j, const glm::vec2& fallback = glm::vec2(0.0f)) {
    if (j.is_array() && j.size() >= 2 && j[0].is_number() && j[1].is_number()) {
        return glm::vec2(j[0].get<float>(), j[1].get<float>());
    }
    return fallback;
}

inline glm::vec3 JsonToVec3(const nlohmann::json& j, const glm::vec3& fallback = glm::vec3(0.0f)) {
    if (j.is_array() && j.size() >= 3 && j[0].is_number() && j[1].is_number() && j[2].is_number()) {
        return glm::vec3(j[0].get<float>(), j[1].get<float>(), j[2].get<float>());
    }
    return fallback;
}

} // namespace ks::utils
