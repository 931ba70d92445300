#include "ks/core/Logger.hpp"
#include "ks/ecs/Entity.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {

struct LoggerFileGuard {
    std::filesystem::path path;
    LoggerFileGuard() = default;
    explicit LoggerFileGuard(std::filesystem::path p) : path(std::move(p)) {}
    ~LoggerFileGuard() {
        ks::core::Logger::SetLogFile({});
        if (!path.empty()) {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }
    }
};

} // namespace

TEST_CASE("Logger writes formatted messages to file", "[logger]") {
    const std::filesystem::path tempFile =
        std::filesystem::temp_directory_path() / "keepsake_logger_test.log";
    std::error_code ec;
    std::filesystem::remove(tempFile, ec);

    LoggerFileGuard guard(tempFile);

    ks::core::Logger::SetLogFile(tempFile);
    ks::core::Logger::Info("Test message {}", 42);

    std::ifstream file(tempFile);
    REQUIRE(file.is_open());

    std::string line;
    std::getline(file, line);
    file.close();

    REQUIRE(line.find("[Info] Test message 42") != std::string::npos);
}

TEST_CASE("Logger listeners receive log lines", "[logger]") {
    std::vector<std::string> captured;
    const auto token = ks::core::Logger::AddListener(
        [&captured](ks::core::LogLevel level, const std::string& line) {
            if (level == ks::core::LogLevel::Warning) {
                captured.push_back(line);
            }
        });

    ks::core::Logger::Warning("Captured warning {}", 7);
    ks::core::Logger::RemoveListener(token);
    ks::core::Logger::Warning("Not captured");

    REQUIRE(captured.size() == 1);
    REQUIRE(captured.front().find("[Warning] Captured warning 7") != std::string::npos);
}

TEST_CASE("Logger formats entity handles", "[logger]") {
    std::vector<std::string> captured;
    const auto token = ks::core::Logger::AddListener(
        [&captured](ks::core::LogLevel, const std::string& line) { captured.push_back(line); });

    ks::core::Logger::Error("Entity {} and {}", ks::ecs::Entity{3, 1}, ks::ecs::kInvalidEntity);
    ks::core::Logger::RemoveListener(token);

    REQUIRE(captured.size() == 1);
    REQUIRE(captured.front().find("[Error] Entity 3v1 and <invalid>") != std::string::npos);
}

TEST_CASE("Logger debug output can be disabled", "[logger]") {
    ks::core::Logger::SetDebugEnabled(false);
    REQUIRE_FALSE(ks::core::Logger::IsDebugEnabled());

    std::vector<std::string> captured;
    const auto token = ks::core::Logger::AddListener(
        [&captured](ks::core::LogLevel, const std::string& line) { captured.push_back(line); });
    ks::core::Logger::Debug("Hidden {}", 1);
    ks::core::Logger::RemoveListener(token);

    REQUIRE(captured.empty());
}

TEST_CASE("Logger stops writing after the log file is cleared", "[logger]") {
    const std::filesystem::path tempFile =
        std::filesystem::temp_directory_path() / "keepsake_logger_close.log";
    std::error_code ec;
    std::filesystem::remove(tempFile, ec);

    LoggerFileGuard guard(tempFile);

    ks::core::Logger::SetLogFile(tempFile);
    ks::core::Logger::Info("Kept");
    ks::core::Logger::SetLogFile({});
    ks::core::Logger::Info("Dropped");

    std::ifstream file(tempFile);
    REQUIRE(file.is_open());
    std::vector<std::string> lines;
    for (std::string line; std::getline(file, line);) {
        lines.push_back(line);
    }

    REQUIRE(lines.size() == 1);
    REQUIRE(lines.front().find("[Info] Kept") != std::string::npos);
}
