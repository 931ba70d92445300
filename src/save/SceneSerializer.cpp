#include "ks/save/SceneSerializer.hpp"

#include "ks/core/Error.hpp"
#include "ks/core/Logger.hpp"
#include "ks/ecs/ComponentRegistry.hpp"

#include <fstream>
#include <optional>
#include <iterator>
#include <system_error>
#include <unordered_set>

#include <nlohmann/json.hpp>
using json = nlohmann::json;

namespace ks::save {

namespace {
constexpr const char* kEntitiesKey = "entities";
constexpr const char* kEntityKey = "entity";
constexpr const char* kParentKey = "parent";
constexpr const char* kComponentsKey = "components";
constexpr const char* kTempSuffix = ".tmp";

// Entity indices are unsigned 32-bit; the top value is reserved for the invalid handle.
std::optional<std::uint32_t> ReadIndex(const json& value) {
    if (!value.is_number_unsigned()) {
        return std::nullopt;
    }
    const auto raw = value.get<std::uint64_t>();
    if (raw >= ecs::Entity::kInvalidIndex) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(raw);
}
} // namespace

json SceneSerializer::ToJson(const SceneSnapshot& snapshot) {
    json entitiesJson = json::array();
    for (const auto& entity : snapshot.entities) {
        json entityJson;
        entityJson[kEntityKey] = entity.index;
        if (entity.parent) {
            entityJson[kParentKey] = *entity.parent;
        }
        json componentsJson = json::object();
        for (const auto& component : entity.components) {
            componentsJson[component.typeName] = component.data;
        }
        entityJson[kComponentsKey] = std::move(componentsJson);
        entitiesJson.push_back(std::move(entityJson));
    }

    json sceneJson;
    sceneJson[kEntitiesKey] = std::move(entitiesJson);
    return sceneJson;
}

SceneSnapshot SceneSerializer::FromJson(const json& sceneJson, const ecs::ComponentRegistry& registry) {
    if (!sceneJson.is_object()) {
        throw core::FormatError("scene document must be an object");
    }
    auto entitiesIt = sceneJson.find(kEntitiesKey);
    if (entitiesIt == sceneJson.end() || !entitiesIt->is_array()) {
        throw core::FormatError("scene document has no 'entities' array");
    }

    SceneSnapshot snapshot;
    snapshot.entities.reserve(entitiesIt->size());
    std::unordered_set<std::uint32_t> indices;
    for (const auto& entityJson : *entitiesIt) {
        SceneEntity entity = EntityFromJson(entityJson, registry);
        if (!indices.insert(entity.index).second) {
            throw core::FormatError("duplicate entity index " + std::to_string(entity.index));
        }
        snapshot.entities.push_back(std::move(entity));
    }

    for (const auto& entity : snapshot.entities) {
        if (entity.parent && indices.count(*entity.parent) == 0) {
            throw core::FormatError("entity " + std::to_string(entity.index) +
                                    " has parent " + std::to_string(*entity.parent) +
                                    " which is not in the scene");
        }
    }
    return snapshot;
}

SceneEntity SceneSerializer::EntityFromJson(const json& entityJson, const ecs::ComponentRegistry& registry) {
    if (!entityJson.is_object()) {
        throw core::FormatError("entity record must be an object");
    }
    auto indexIt = entityJson.find(kEntityKey);
    if (indexIt == entityJson.end()) {
        throw core::FormatError("entity record is missing its 'entity' index");
    }
    const auto index = ReadIndex(*indexIt);
    if (!index) {
        throw core::FormatError("entity index " + indexIt->dump() + " is not a valid entity index");
    }

    SceneEntity entity;
    entity.index = *index;

    auto parentIt = entityJson.find(kParentKey);
    if (parentIt != entityJson.end() && !parentIt->is_null()) {
        entity.parent = ReadIndex(*parentIt);
        if (!entity.parent) {
            throw core::FormatError("entity " + std::to_string(entity.index) + " has a malformed 'parent'");
        }
    }

    auto componentsIt = entityJson.find(kComponentsKey);
    if (componentsIt == entityJson.end()) {
        return entity;
    }
    if (!componentsIt->is_object()) {
        throw core::FormatError("entity " + std::to_string(entity.index) + " has a malformed 'components'");
    }
    for (auto it = componentsIt->begin(); it != componentsIt->end(); ++it) {
        if (!registry.IsRegistered(it.key())) {
            throw core::SchemaError(it.key(), "component type is not registered");
        }
        entity.components.push_back({it.key(), it.value()});
    }
    return entity;
}

std::string SceneSerializer::Serialize(const SceneSnapshot& snapshot, int indent) {
    return ToJson(snapshot).dump(indent);
}

SceneSnapshot SceneSerializer::Deserialize(std::string_view text, const ecs::ComponentRegistry& registry) {
    json sceneJson;
    try {
        sceneJson = json::parse(text.begin(), text.end());
    } catch (const json::parse_error& ex) {
        throw core::FormatError(ex.what());
    }
    return FromJson(sceneJson, registry);
}

void SceneSerializer::WriteToFile(const std::filesystem::path& path, std::string_view text) {
    std::error_code ec;
    if (path.has_parent_path() && !std::filesystem::exists(path.parent_path(), ec)) {
        if (!std::filesystem::create_directories(path.parent_path(), ec)) {
            throw core::IoError("directory creation", path.parent_path().string(), ec.message());
        }
    }

    const std::filesystem::path target = path.string() + kTempSuffix;
    {
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw core::IoError("file creation", target.string(), "unable to open for writing");
        }
        out.write(text.data(), static_cast<std::streamsize>(text.size()));
        out.flush();
        if (!out.good()) {
            out.close();
            std::filesystem::remove(target, ec);
            throw core::IoError("write", target.string(), "stream error while writing");
        }
    }

    std::filesystem::rename(target, path, ec);
    if (ec) {
        const std::string reason = ec.message();
        std::filesystem::remove(target, ec);
        throw core::IoError("rename", path.string(), reason);
    }
    core::Logger::Debug("[SceneSerializer] Wrote {} bytes to {}", text.size(), path.string());
}

std::string SceneSerializer::ReadFromFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw core::IoError("open", path.string(), "file not found or unreadable");
    }
    std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) {
        throw core::IoError("read", path.string(), "stream error while reading");
    }
    return text;
}

} // namespace ks::save
