#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace ks::core {

class Error : public std::runtime_error {
public:
    explicit Error(std::string message);
    virtual ~Error() = default;
};

inline Error::Error(std::string message)
    : std::runtime_error(std::move(message)) {}

/**
 * @brief Open, create, read, write or rename failure on a save file.
 */
class IoError : public Error {
public:
    IoError(std::string_view operation, std::string_view path, std::string details);

    std::string_view operation() const noexcept { return m_operation; }
    std::string_view path() const noexcept { return m_path; }
    std::string_view details() const noexcept { return m_details; }

private:
    static std::string BuildMessage(std::string_view operation,
                                    std::string_view path,
                                    const std::string& details);

    std::string m_operation;
    std::string m_path;
    std::string m_details;
};

inline std::string IoError::BuildMessage(std::string_view operation,
                                         std::string_view path,
                                         const std::string& details) {
    std::string message;
    message.reserve(operation.size() + path.size() + details.size() + 24);
    message.append("I/O error during ");
    message.append(operation);
    message.append(" of '");
    message.append(path);
    message.append("'");
    if (!details.empty()) {
        message.append(": ");
        message.append(details);
    }
    return message;
}

inline IoError::IoError(std::string_view operation, std::string_view path, std::string details)
    : Error(BuildMessage(operation, path, details)),
      m_operation(operation),
      m_path(path),
      m_details(std::move(details)) {}

/**
 * @brief The byte stream is not a well-formed scene document.
 */
class FormatError : public Error {
public:
    explicit FormatError(std::string details)
        : Error("Format error: " + details), m_details(std::move(details)) {}

    std::string_view details() const noexcept { return m_details; }

private:
    std::string m_details;
};

/**
 * @brief A scene record names a component type the live registry does not know,
 * or its data does not decode into that type.
 */
class SchemaError : public Error {
public:
    SchemaError(std::string_view typeName, std::string details);

    std::string_view typeName() const noexcept { return m_typeName; }
    std::string_view details() const noexcept { return m_details; }

private:
    std::string m_typeName;
    std::string m_details;
};

inline SchemaError::SchemaError(std::string_view typeName, std::string details)
    : Error("Schema error [" + std::string(typeName) + "]" + (details.empty() ? "" : ": " + details)),
      m_typeName(typeName),
      m_details(std::move(details)) {}

/**
 * @brief An entity reference could not be resolved after a load.
 *
 * Raised when a restored component points at an entity index that was not part
 * of the loaded scene. Never recovered locally.
 */
class IntegrityError : public Error {
public:
    IntegrityError(std::uint32_t index, std::string details)
        : Error("Integrity error: entity index " + std::to_string(index) +
                (details.empty() ? "" : " " + details)),
          m_index(index),
          m_details(std::move(details)) {}

    std::uint32_t index() const noexcept { return m_index; }
    std::string_view details() const noexcept { return m_details; }

private:
    std::uint32_t m_index;
    std::string m_details;
};

} // namespace ks::core
