#include "ks/save/Request.hpp"
#include "ks/core/Logger.hpp"

#include <utility>

namespace ks::save {

std::string_view RequestKindName(RequestKind kind) {
    switch (kind) {
        case RequestKind::Save: return "save";
        case RequestKind::Dump: return "dump";
        case RequestKind::Load: return "load";
    }
    return "unknown";
}

RequestKind KindOf(const Request& request) {
    if (const auto* save = std::get_if<SaveRequest>(&request)) {
        return save->mode == SaveMode::Dump ? RequestKind::Dump : RequestKind::Save;
    }
    return RequestKind::Load;
}

const std::filesystem::path& PathOf(const Request& request) {
    return std::visit([](const auto& r) -> const std::filesystem::path& { return r.path; }, request);
}

void RequestSlot::Submit(Request request) {
    if (m_pending) {
        core::Logger::Warning("[RequestSlot] Pending {} request for '{}' replaced by {} request for '{}'",
                              RequestKindName(KindOf(*m_pending)), PathOf(*m_pending).string(),
                              RequestKindName(KindOf(request)), PathOf(request).string());
    }
    m_pending = std::move(request);
}

bool RequestSlot::HasPendingSave() const {
    return m_pending && std::holds_alternative<SaveRequest>(*m_pending);
}

bool RequestSlot::HasPendingLoad() const {
    return m_pending && std::holds_alternative<LoadRequest>(*m_pending);
}

std::optional<Request> RequestSlot::Take() {
    std::optional<Request> request = std::move(m_pending);
    m_pending.reset();
    return request;
}

} // namespace ks::save
