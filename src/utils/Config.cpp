#include "ks/utils/Config.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "ks/core/Logger.hpp"

namespace ks::utils {

namespace {

constexpr int kMinIndent = -1;
constexpr int kMaxIndent = 8;

std::filesystem::path NormalizePath(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::path normalized = std::filesystem::weakly_canonical(path, ec);
    if (ec) {
        normalized = std::filesystem::absolute(path);
    }
    return normalized.lexically_normal();
}

std::filesystem::path ResolvePath(const std::filesystem::path& baseDir, const std::string& value) {
    if (value.empty()) {
        return NormalizePath(baseDir);
    }
    std::filesystem::path raw(value);
    if (raw.is_relative()) {
        return NormalizePath(baseDir / raw);
    }
    return NormalizePath(raw);
}

template <typename T>
T GetOrDefault(const nlohmann::json& obj, const char* key, const T& fallback) {
    if (!obj.is_object()) {
        return fallback;
    }
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return fallback;
    }
    try {
        return it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        ks::core::Logger::Warning("[ConfigLoader] Failed to parse key '{}': {}", key, e.what());
        return fallback;
    }
}

} // namespace

AppConfig ConfigLoader::CreateDefault(const std::filesystem::path& baseDir) {
    AppConfig config{};
    config.configDirectory = baseDir;
    config.save.directory = NormalizePath(baseDir / "saves");
    return config;
}

ConfigLoadResult ConfigLoader::Load(const std::filesystem::path& path) {
    const std::filesystem::path baseDir = path.empty() || !path.has_parent_path()
                                              ? std::filesystem::current_path()
                                              : path.parent_path();

    ConfigLoadResult result;
    result.config = CreateDefault(baseDir);

    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        ks::core::Logger::Warning("[ConfigLoader] Config file '{}' not found, using defaults",
                                  path.empty() ? "<none>" : path.string());
        return result;
    }

    std::ifstream file(path);
    if (!file) {
        result.errors.push_back(fmt::format("Failed to open config file '{}'", path.string()));
        ks::core::Logger::Error("[ConfigLoader] {}", result.errors.back());
        return result;
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::exception& e) {
        result.errors.push_back(fmt::format("Failed to parse JSON '{}': {}", path.string(), e.what()));
        ks::core::Logger::Error("[ConfigLoader] {}", result.errors.back());
        return result;
    }

    const auto saveObj = json.contains("save") ? json["save"] : nlohmann::json::object();
    if (saveObj.contains("directory") && saveObj["directory"].is_string()) {
        result.config.save.directory = ResolvePath(baseDir, saveObj["directory"].get<std::string>());
    }
    result.config.save.indent = GetOrDefault<int>(saveObj, "indent", result.config.save.indent);

    const auto loggingObj = json.contains("logging") ? json["logging"] : nlohmann::json::object();
    if (loggingObj.contains("file") && loggingObj["file"].is_string()) {
        result.config.logging.file = ResolvePath(baseDir, loggingObj["file"].get<std::string>());
    }
    result.config.logging.debug = GetOrDefault<bool>(loggingObj, "debug", result.config.logging.debug);

    result.config.configDirectory = baseDir;
    result.loadedFromFile = true;

    ValidateConfig(result.config, result);

    for (const auto& warning : result.warnings) {
        ks::core::Logger::Warning("[ConfigLoader] {}", warning);
    }
    for (const auto& error : result.errors) {
        ks::core::Logger::Error("[ConfigLoader] {}", error);
    }

    ks::core::Logger::Info("[ConfigLoader] Loaded config from '{}'", path.string());
    return result;
}

void ConfigLoader::ApplyLogging(const LoggingConfig& logging) {
    ks::core::Logger::SetDebugEnabled(logging.debug);
    ks::core::Logger::SetLogFile(logging.file);
}

void ConfigLoader::ValidateConfig(AppConfig& config, ConfigLoadResult& result) {
    ValidateSaveConfig(config.save, result);
}

void ConfigLoader::ValidateSaveConfig(SaveConfig& save, ConfigLoadResult& result) {
    if (save.indent < kMinIndent || save.indent > kMaxIndent) {
        result.warnings.push_back(
            fmt::format("save.indent ({}) should be between {} and {}, clamping",
                        save.indent, kMinIndent, kMaxIndent));
        save.indent = std::clamp(save.indent, kMinIndent, kMaxIndent);
    }

    if (save.directory.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(save.directory, ec);
    if (ec) {
        result.errors.push_back(
            fmt::format("Cannot create save directory '{}': {}", save.directory.string(), ec.message()));
    }
}

} // namespace ks::utils
