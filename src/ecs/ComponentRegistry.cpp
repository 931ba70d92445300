#include "ks/ecs/ComponentRegistry.hpp"
#include "ks/core/Logger.hpp"

#include <algorithm>

namespace ks::ecs {

bool ComponentRegistry::AddBinding(Binding binding) {
    if (binding.typeName.empty() || !binding.serialize || !binding.deserialize) {
        core::Logger::Warning("[ComponentRegistry] Invalid registration for type '{}'", binding.typeName);
        return false;
    }
    if (m_byName.count(binding.typeName) != 0) {
        core::Logger::Warning("[ComponentRegistry] Component '{}' already registered", binding.typeName);
        return false;
    }
    if (m_byType.count(binding.type) != 0) {
        core::Logger::Warning("[ComponentRegistry] Type of '{}' already registered as '{}'",
                              binding.typeName, m_bindings[m_byType.at(binding.type)].typeName);
        return false;
    }

    const std::size_t slot = m_bindings.size();
    m_byName.emplace(binding.typeName, slot);
    m_byType.emplace(binding.type, slot);
    m_bindings.push_back(std::move(binding));
    return true;
}

bool ComponentRegistry::Unregister(const std::string& typeName) {
    auto it = m_byName.find(typeName);
    if (it == m_byName.end()) {
        return false;
    }
    m_bindings.erase(m_bindings.begin() + static_cast<std::ptrdiff_t>(it->second));

    m_byName.clear();
    m_byType.clear();
    for (std::size_t i = 0; i < m_bindings.size(); ++i) {
        m_byName.emplace(m_bindings[i].typeName, i);
        m_byType.emplace(m_bindings[i].type, i);
    }
    return true;
}

const ComponentRegistry::Binding* ComponentRegistry::FindByName(const std::string& typeName) const {
    auto it = m_byName.find(typeName);
    return it != m_byName.end() ? &m_bindings[it->second] : nullptr;
}

const ComponentRegistry::Binding* ComponentRegistry::FindByType(std::type_index type) const {
    auto it = m_byType.find(type);
    return it != m_byType.end() ? &m_bindings[it->second] : nullptr;
}

std::vector<std::string> ComponentRegistry::GetRegisteredTypes() const {
    std::vector<std::string> types;
    types.reserve(m_bindings.size());
    for (const auto& binding : m_bindings) {
        types.push_back(binding.typeName);
    }
    std::sort(types.begin(), types.end());
    return types;
}

void ComponentRegistry::Clear() {
    m_bindings.clear();
    m_byName.clear();
    m_byType.clear();
}

} // namespace ks::ecs
