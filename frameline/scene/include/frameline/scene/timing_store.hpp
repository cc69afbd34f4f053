#pragma once

#include <optional>
#include <string>
#include <unordered_map>

namespace frameline::scene {

// "scene-{project}-{scene}"
std::string make_storage_key(const std::string& project_name, const std::string& scene_name);

// Key-value persistence for finalized scene timings
class ITimingStore {
public:
    virtual ~ITimingStore() = default;

    virtual std::optional<std::string> read(const std::string& key) const = 0;
    virtual bool write(const std::string& key, const std::string& value) = 0;
    virtual bool remove(const std::string& key) = 0;
};

// Process-local store
class MemoryTimingStore : public ITimingStore {
public:
    std::optional<std::string> read(const std::string& key) const override;
    bool write(const std::string& key, const std::string& value) override;
    bool remove(const std::string& key) override;

    size_t size() const { return m_values.size(); }

private:
    std::unordered_map<std::string, std::string> m_values;
};

// One JSON file per key inside a directory
class FileTimingStore : public ITimingStore {
public:
    explicit FileTimingStore(std::string directory);

    std::optional<std::string> read(const std::string& key) const override;
    bool write(const std::string& key, const std::string& value) override;
    bool remove(const std::string& key) override;

    const std::string& get_directory() const { return m_directory; }
    std::string path_for(const std::string& key) const;

private:
    std::string m_directory;
};

} // namespace frameline::scene
