#include "ks/save/FixupRegistry.hpp"
#include "ks/core/Logger.hpp"

#include <algorithm>

namespace ks::save {

bool FixupRegistry::Unregister(const std::string& typeName) {
    auto it = std::find_if(m_entries.begin(), m_entries.end(),
                           [&typeName](const Entry& entry) { return entry.typeName == typeName; });
    if (it == m_entries.end()) {
        return false;
    }
    m_entries.erase(it);
    return true;
}

bool FixupRegistry::IsRegistered(const std::string& typeName) const {
    return std::any_of(m_entries.begin(), m_entries.end(),
                       [&typeName](const Entry& entry) { return entry.typeName == typeName; });
}

std::vector<std::string> FixupRegistry::GetRegisteredTypes() const {
    std::vector<std::string> types;
    types.reserve(m_entries.size());
    for (const auto& entry : m_entries) {
        types.push_back(entry.typeName);
    }
    return types;
}

std::size_t FixupRegistry::Apply(ecs::World& world, const LoadedEntities& loaded) const {
    std::size_t total = 0;
    for (const auto& entry : m_entries) {
        const std::size_t rewritten = entry.apply(world, loaded);
        core::Logger::Debug("[FixupRegistry] Rewrote {} '{}' component(s)", rewritten, entry.typeName);
        total += rewritten;
    }
    return total;
}

} // namespace ks::save
