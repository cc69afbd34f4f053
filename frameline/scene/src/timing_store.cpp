#include <frameline/scene/timing_store.hpp>
#include <frameline/core/filesystem.hpp>
#include <frameline/core/log.hpp>
#include <cctype>
#include <cstdio>

namespace frameline::scene {

using core::FileSystem;
using core::log;
using core::LogLevel;

std::string make_storage_key(const std::string& project_name, const std::string& scene_name) {
    return "scene-" + project_name + "-" + scene_name;
}

std::optional<std::string> MemoryTimingStore::read(const std::string& key) const {
    auto it = m_values.find(key);
    if (it == m_values.end()) return std::nullopt;
    return it->second;
}

bool MemoryTimingStore::write(const std::string& key, const std::string& value) {
    m_values[key] = value;
    return true;
}

bool MemoryTimingStore::remove(const std::string& key) {
    return m_values.erase(key) > 0;
}

FileTimingStore::FileTimingStore(std::string directory)
    : m_directory(std::move(directory)) {}

std::string FileTimingStore::path_for(const std::string& key) const {
    // Percent-encode anything outside [A-Za-z0-9._-] so distinct keys never share a file
    static const char* hex = "0123456789ABCDEF";
    std::string file_name;
    file_name.reserve(key.size() + 5);
    for (char c : key) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.') {
            file_name += c;
        } else {
            file_name += '%';
            file_name += hex[uc >> 4];
            file_name += hex[uc & 0x0F];
        }
    }
    return FileSystem::join(m_directory, file_name + ".json");
}

std::optional<std::string> FileTimingStore::read(const std::string& key) const {
    std::string path = path_for(key);
    if (!FileSystem::exists(path)) {
        return std::nullopt;
    }
    return FileSystem::read_text(path);
}

bool FileTimingStore::write(const std::string& key, const std::string& value) {
    if (!FileSystem::create_directories(m_directory)) {
        log(LogLevel::Error, ("Failed to create timing directory: " + m_directory).c_str());
        return false;
    }

    std::string path = path_for(key);
    if (!FileSystem::write_text(path, value)) {
        log(LogLevel::Error, ("Failed to write timing file: " + path).c_str());
        return false;
    }
    return true;
}

bool FileTimingStore::remove(const std::string& key) {
    std::string path = path_for(key);
    if (!FileSystem::exists(path)) return false;
    return std::remove(path.c_str()) == 0;
}

} // namespace frameline::scene
