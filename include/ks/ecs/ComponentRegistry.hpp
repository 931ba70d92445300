#pragma once

#include "ks/ecs/Component.hpp"
#include "ks/ecs/World.hpp"

#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace ks::ecs {

/**
 * @brief Table of component types that may be written to and read from a scene.
 *
 * Each entry binds a durable type name to a C++ type together with the
 * functions that turn an attached instance into a structured value and back.
 * Types that are not registered are invisible to scene extraction: they are
 * left out of every snapshot without an error, so transient or visual state
 * stays out of save files. Forgetting to register a gameplay type loses its
 * data the same silent way.
 *
 * @example
 * ComponentRegistry registry;
 * registry.Register<Position>("Position");   // uses to_json/from_json for Position
 * registry.RegisterTag<Weapon>("Weapon");    // empty marker, stored as {}
 */
class ComponentRegistry {
public:
    using SerializeFunc = std::function<nlohmann::json(const Component&)>;
    using DeserializeFunc = std::function<std::unique_ptr<Component>(const nlohmann::json&)>;

    struct Binding {
        std::string typeName;
        std::type_index type;
        SerializeFunc serialize;
        DeserializeFunc deserialize;
    };

    /**
     * @brief Register T using the nlohmann to_json/from_json overloads found by ADL.
     * @return false if the name or the type is already registered
     */
    template<typename T>
    bool Register(const std::string& typeName) {
        return Register<T>(
            typeName,
            [](const T& component) { return nlohmann::json(component); },
            [](const nlohmann::json& data, T& component) { data.get_to(component); });
    }

    /**
     * @brief Register T with explicit conversion functions.
     */
    template<typename T>
    bool Register(const std::string& typeName,
                  std::function<nlohmann::json(const T&)> serialize,
                  std::function<void(const nlohmann::json&, T&)> deserialize) {
        static_assert(std::is_base_of_v<Component, T>, "T must inherit from Component");
        static_assert(std::is_default_constructible_v<T>, "T must be default constructible");

        Binding binding{
            typeName,
            std::type_index(typeid(T)),
            [serialize](const Component& component) {
                return serialize(static_cast<const T&>(component));
            },
            [deserialize](const nlohmann::json& data) -> std::unique_ptr<Component> {
                auto component = std::make_unique<T>();
                deserialize(data, *component);
                return component;
            }};
        return AddBinding(std::move(binding));
    }

    /**
     * @brief Register a field-less marker component; it is stored as an empty object.
     */
    template<typename T>
    bool RegisterTag(const std::string& typeName) {
        return Register<T>(
            typeName,
            [](const T&) { return nlohmann::json::object(); },
            [](const nlohmann::json&, T&) {});
    }

    bool Unregister(const std::string& typeName);

    const Binding* FindByName(const std::string& typeName) const;
    const Binding* FindByType(std::type_index type) const;

    template<typename T>
    const Binding* Find() const {
        return FindByType(std::type_index(typeid(T)));
    }

    bool IsRegistered(const std::string& typeName) const { return FindByName(typeName) != nullptr; }

    // Sorted by name.
    std::vector<std::string> GetRegisteredTypes() const;

    void Clear();

private:
    bool AddBinding(Binding binding);

    std::vector<Binding> m_bindings;
    std::unordered_map<std::string, std::size_t> m_byName;
    std::unordered_map<std::type_index, std::size_t> m_byType;
};

} // namespace ks::ecs
