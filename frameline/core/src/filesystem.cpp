#include <frameline/core/filesystem.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace frameline::core {

bool FileSystem::exists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

std::string FileSystem::read_text(const std::string& path) {
    std::ifstream file(path);
    if (!file) return {};

    return std::string(
        std::istreambuf_iterator<char>(file),
        std::istreambuf_iterator<char>()
    );
}

bool FileSystem::write_text(const std::string& path, const std::string& text) {
    // Write to a sibling file first so readers never observe a truncated store
    std::string temp_path = path + ".tmp";
    {
        std::ofstream file(temp_path, std::ios::trunc);
        if (!file) return false;
        file << text;
        if (!file.good()) return false;
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        return false;
    }
    return true;
}

bool FileSystem::create_directories(const std::string& path) {
    if (path.empty()) return true;

    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    return !ec && std::filesystem::is_directory(path, ec);
}

std::string FileSystem::join(const std::string& directory, const std::string& file_name) {
    if (directory.empty()) return file_name;
    return (std::filesystem::path(directory) / file_name).string();
}

} // namespace frameline::core
