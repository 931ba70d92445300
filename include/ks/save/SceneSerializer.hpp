#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "ks/save/SceneSnapshot.hpp"

namespace ks::ecs {
class ComponentRegistry;
}

namespace ks::save {

/**
 * @brief Converts scene snapshots to and from JSON text and save files.
 *
 * Document layout:
 * @code
 * {
 *   "entities": [
 *     { "entity": 4, "parent": 2, "components": { "Position": { "x": 1.0, "y": 2.0 } } }
 *   ]
 * }
 * @endcode
 * Components are keyed by their registered type name. "parent" is omitted for
 * root entities. Read failures throw core::FormatError, core::SchemaError or
 * core::IoError.
 */
class SceneSerializer {
public:
    static nlohmann::json ToJson(const SceneSnapshot& snapshot);
    static SceneSnapshot FromJson(const nlohmann::json& json, const ecs::ComponentRegistry& registry);

    static std::string Serialize(const SceneSnapshot& snapshot, int indent = 2);
    static SceneSnapshot Deserialize(std::string_view text, const ecs::ComponentRegistry& registry);

    // Replaces the whole file. The text goes to a sibling temporary file that is
    // renamed over `path`, so a failed write never truncates an existing save.
    static void WriteToFile(const std::filesystem::path& path, std::string_view text);
    static std::string ReadFromFile(const std::filesystem::path& path);

private:
    static SceneEntity EntityFromJson(const nlohmann::json& entityJson,
                                      const ecs::ComponentRegistry& registry);
};

} // namespace ks::save
