#pragma once

#include <cstdint>
#include <string>

namespace frameline::core {

struct StageConfig {
    uint32_t width = 1920;
    uint32_t height = 1080;
    float resolution_scale = 1.0f;
    std::string color_space = "srgb";   // "srgb" or "display-p3"
    uint32_t motion_blur = 1;           // Sub-frame samples, 1 disables blur
    std::string background;             // Empty = transparent
};

struct PlaybackSettings {
    std::string project_name = "Untitled";
    double frame_rate = 30.0;
    uint32_t layout_retry_limit = 10;
    std::string timing_directory = "timing/";

    StageConfig stage;

    // Load settings from JSON file
    bool load(const std::string& path);

    // Save settings to JSON file
    bool save(const std::string& path) const;

    bool load_from_string(const std::string& content);
    std::string to_string() const;

    // Reset to defaults
    void reset();
};

} // namespace frameline::core
