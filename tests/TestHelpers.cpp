#include "TestHelpers.hpp"

#include <fstream>
#include <iterator>
#include <random>
#include <stdexcept>
#include <system_error>

namespace {

std::filesystem::path MakeTempDirectory() {
    auto base = std::filesystem::temp_directory_path();
    std::random_device rd;
    std::uniform_int_distribution<int> dist(0, 0xFFFFFF);
    std::filesystem::path dir;
    do {
        dir = base / ("Keepsake_" + std::to_string(dist(rd)));
    } while (std::filesystem::exists(dir));
    std::filesystem::create_directories(dir);
    return dir;
}

} // namespace

TempDirectory::TempDirectory() : path(MakeTempDirectory()) {}

TempDirectory::~TempDirectory() {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
}

std::string ReadTextFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to read file: " + path.string());
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void WriteTextFile(const std::filesystem::path& path, const std::string& contents) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        throw std::runtime_error("Failed to write file: " + path.string());
    }
    out << contents;
}
