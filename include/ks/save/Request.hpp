#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace ks::save {

enum class SaveMode {
    // Entities carrying Persist.
    Filtered,
    // Every live entity. Diagnostic only: loading a dump duplicates entities
    // that are not cleared by the unload step.
    Dump
};

struct SaveRequest {
    std::filesystem::path path;
    SaveMode mode = SaveMode::Filtered;
};

struct LoadRequest {
    std::filesystem::path path;
};

using Request = std::variant<SaveRequest, LoadRequest>;

enum class RequestKind {
    Save,
    Dump,
    Load
};

std::string_view RequestKindName(RequestKind kind);
RequestKind KindOf(const Request& request);
const std::filesystem::path& PathOf(const Request& request);

/**
 * @brief Outcome of one executed request.
 */
struct SaveLoadResult {
    RequestKind kind = RequestKind::Save;
    std::filesystem::path path;
    bool success = false;
    std::string message;
    std::size_t entityCount = 0;
};

/**
 * @brief Single pending request.
 *
 * Submitting while a request is pending replaces it (last write wins); the
 * replaced request is dropped with a warning.
 */
class RequestSlot {
public:
    void Submit(Request request);

    bool HasPending() const { return m_pending.has_value(); }
    bool HasPendingSave() const;
    bool HasPendingLoad() const;

    const Request* Peek() const { return m_pending ? &*m_pending : nullptr; }
    std::optional<Request> Take();
    void Clear() { m_pending.reset(); }

private:
    std::optional<Request> m_pending;
};

} // namespace ks::save
