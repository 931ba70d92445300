#pragma once
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace ks::core {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

/**
 * @brief Process-wide log sink.
 *
 * Lines look like `[12:30:05.042] [Warning] [Tag] message`. Each one goes to
 * stderr, to the log file when one is set and to every listener. Debug lines
 * are compiled in only with KS_DEBUG and can still be muted at runtime.
 */
class Logger {
public:
    using Listener = std::function<void(LogLevel, const std::string&)>;

    template<typename... Args>
    static void Debug(fmt::format_string<Args...> format, Args&&... args) {
#ifdef KS_DEBUG
        if (IsDebugEnabled()) {
            Write(LogLevel::Debug, fmt::format(format, std::forward<Args>(args)...));
        }
#else
        (void)format;
        ((void)args, ...);
#endif
    }

    template<typename... Args>
    static void Info(fmt::format_string<Args...> format, Args&&... args) {
        Write(LogLevel::Info, fmt::format(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    static void Warning(fmt::format_string<Args...> format, Args&&... args) {
        Write(LogLevel::Warning, fmt::format(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    static void Error(fmt::format_string<Args...> format, Args&&... args) {
        Write(LogLevel::Error, fmt::format(format, std::forward<Args>(args)...));
    }

    // No effect in builds without KS_DEBUG.
    static void SetDebugEnabled(bool enabled);
    static bool IsDebugEnabled();

    // Appends to `path`, creating parent directories. An empty path closes the file.
    static void SetLogFile(const std::filesystem::path& path);

    // Returns a token for RemoveListener.
    static std::size_t AddListener(Listener listener);
    static void RemoveListener(std::size_t token);

private:
    static void Write(LogLevel level, const std::string& message);
};

} // namespace ks::core
