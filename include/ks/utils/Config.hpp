#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace ks::utils {

struct SaveConfig {
    // Relative request paths resolve against this directory. Empty keeps them as given.
    std::filesystem::path directory;
    // JSON indentation of written scenes; -1 writes a single line.
    int indent = 2;
};

struct LoggingConfig {
    std::filesystem::path file;
    bool debug = false;
};

struct AppConfig {
    SaveConfig save;
    LoggingConfig logging;
    std::filesystem::path configDirectory;
};

struct ConfigLoadResult {
    AppConfig config;
    bool loadedFromFile = false;
    std::vector<std::string> errors;      // Critical errors that should prevent startup
    std::vector<std::string> warnings;    // Non-critical issues that should be logged

    bool HasErrors() const { return !errors.empty(); }
    bool HasWarnings() const { return !warnings.empty(); }
};

class ConfigLoader {
public:
    /**
     * @brief Load a JSON config file. A missing file yields defaults rooted at
     * the current directory.
     *
     * @code
     * { "save": { "directory": "saves", "indent": 2 },
     *   "logging": { "file": "logs/keepsake.log", "debug": false } }
     * @endcode
     */
    static ConfigLoadResult Load(const std::filesystem::path& path);

    // Points the logger at the configured file and debug level.
    static void ApplyLogging(const LoggingConfig& logging);

private:
    static AppConfig CreateDefault(const std::filesystem::path& baseDir);
    static void ValidateConfig(AppConfig& config, ConfigLoadResult& result);
    static void ValidateSaveConfig(SaveConfig& save, ConfigLoadResult& result);
};

} // namespace ks::utils
