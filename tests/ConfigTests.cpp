#include "TestHelpers.hpp"

#include "ks/utils/Config.hpp"
#include "ks/utils/JsonMath.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>

TEST_CASE("ConfigLoader falls back to defaults for a missing file", "[config]") {
    TempDirectory temp;
    const auto result = ks::utils::ConfigLoader::Load(temp.path / "absent.json");

    REQUIRE_FALSE(result.HasErrors());
    REQUIRE_FALSE(result.loadedFromFile);
    REQUIRE(result.config.save.directory.filename() == "saves");
    REQUIRE(result.config.save.indent == 2);
    REQUIRE(result.config.logging.file.empty());
}

TEST_CASE("ConfigLoader resolves paths against the config directory", "[config]") {
    TempDirectory temp;
    const auto path = temp.path / "config.json";
    WriteTextFile(path, R"({
        "save": { "directory": "slots", "indent": -1 },
        "logging": { "file": "logs/app.log", "debug": true }
    })");

    const auto result = ks::utils::ConfigLoader::Load(path);

    REQUIRE_FALSE(result.HasErrors());
    REQUIRE(result.loadedFromFile);
    REQUIRE(result.config.save.directory.filename() == "slots");
    REQUIRE(std::filesystem::is_directory(result.config.save.directory));
    REQUIRE(result.config.save.indent == -1);
    REQUIRE(result.config.logging.file.filename() == "app.log");
    REQUIRE(result.config.logging.file.is_absolute());
    REQUIRE(result.config.logging.debug);
}

TEST_CASE("ConfigLoader clamps out-of-range indentation", "[config]") {
    TempDirectory temp;
    const auto path = temp.path / "config.json";
    WriteTextFile(path, R"({ "save": { "indent": 40 } })");

    const auto result = ks::utils::ConfigLoader::Load(path);

    REQUIRE_FALSE(result.HasErrors());
    REQUIRE(result.HasWarnings());
    REQUIRE(result.config.save.indent == 8);
}

TEST_CASE("ConfigLoader ignores mistyped values", "[config]") {
    TempDirectory temp;
    const auto path = temp.path / "config.json";
    WriteTextFile(path, R"({ "save": { "indent": "wide" }, "logging": { "debug": "loud" } })");

    const auto result = ks::utils::ConfigLoader::Load(path);

    REQUIRE_FALSE(result.HasErrors());
    REQUIRE(result.config.save.indent == 2);
    REQUIRE_FALSE(result.config.logging.debug);
}

TEST_CASE("ConfigLoader reports malformed JSON", "[config]") {
    TempDirectory temp;
    const auto path = temp.path / "config.json";
    WriteTextFile(path, "{ \"save\": ");

    const auto result = ks::utils::ConfigLoader::Load(path);
    REQUIRE(result.HasErrors());
    REQUIRE_FALSE(result.loadedFromFile);
}

TEST_CASE("JsonMath converts vectors", "[config][json]") {
    REQUIRE(ks::utils::JsonToVec2(ks::utils::Vec2ToJson(glm::vec2(1.5f, -2.0f))) == glm::vec2(1.5f, -2.0f));
    REQUIRE(ks::utils::JsonToVec3(ks::utils::Vec3ToJson(glm::vec3(1.0f, 2.0f, 3.0f))) == glm::vec3(1.0f, 2.0f, 3.0f));
    REQUIRE(ks::utils::JsonToVec2(nlohmann::json("bad"), glm::vec2(9.0f)) == glm::vec2(9.0f));
    REQUIRE(ks::utils::JsonToVec3(nlohmann::json::array({1, 2})) == glm::vec3(0.0f));
}
