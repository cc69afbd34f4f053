#include <frameline/core/settings.hpp>
#include <frameline/core/filesystem.hpp>
#include <frameline/core/log.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>

namespace frameline::core {

using json = nlohmann::json;

namespace {

// Reads a count through a signed type so negative values are caught instead of wrapping
uint32_t read_count(const json& j, const char* key, uint32_t fallback, int64_t min_value) {
    int64_t value = j.value(key, static_cast<int64_t>(fallback));
    if (value < min_value || value > static_cast<int64_t>(UINT32_MAX)) {
        log(LogLevel::Warn, (std::string("Playback settings: ") + key + " out of range, keeping previous value").c_str());
        return fallback;
    }
    return static_cast<uint32_t>(value);
}

} // anonymous namespace

bool PlaybackSettings::load(const std::string& path) {
    std::string content = FileSystem::read_text(path);
    if (content.empty()) {
        log(LogLevel::Warn, ("Playback settings not found: " + path).c_str());
        return false;
    }
    return load_from_string(content);
}

bool PlaybackSettings::load_from_string(const std::string& content) {
    try {
        json j = json::parse(content);

        // Parse into a copy so a malformed file leaves the current values intact
        PlaybackSettings parsed = *this;
        parsed.project_name = j.value("project_name", parsed.project_name);
        parsed.frame_rate = j.value("frame_rate", parsed.frame_rate);
        parsed.layout_retry_limit = read_count(j, "layout_retry_limit", parsed.layout_retry_limit, 0);
        parsed.timing_directory = j.value("timing_directory", parsed.timing_directory);

        if (j.contains("stage")) {
            auto& s = j["stage"];
            parsed.stage.width = s.value("width", parsed.stage.width);
            parsed.stage.height = s.value("height", parsed.stage.height);
            parsed.stage.resolution_scale = s.value("resolution_scale", parsed.stage.resolution_scale);
            parsed.stage.color_space = s.value("color_space", parsed.stage.color_space);
            parsed.stage.motion_blur = read_count(s, "motion_blur", parsed.stage.motion_blur, 1);
            if (s.contains("background") && s["background"].is_null()) {
                parsed.stage.background.clear();
            } else {
                parsed.stage.background = s.value("background", parsed.stage.background);
            }
        }

        if (parsed.frame_rate <= 0.0) {
            log(LogLevel::Warn, "Playback settings: frame_rate must be positive, keeping previous value");
            parsed.frame_rate = frame_rate;
        }

        *this = parsed;
        return true;
    } catch (const json::exception& e) {
        log(LogLevel::Error, (std::string("Failed to parse playback settings: ") + e.what()).c_str());
        return false;
    }
}

std::string PlaybackSettings::to_string() const {
    json j;

    j["project_name"] = project_name;
    j["frame_rate"] = frame_rate;
    j["layout_retry_limit"] = layout_retry_limit;
    j["timing_directory"] = timing_directory;

    j["stage"] = {
        {"width", stage.width},
        {"height", stage.height},
        {"resolution_scale", stage.resolution_scale},
        {"color_space", stage.color_space},
        {"motion_blur", stage.motion_blur},
    };
    if (stage.background.empty()) {
        j["stage"]["background"] = nullptr;
    } else {
        j["stage"]["background"] = stage.background;
    }

    return j.dump(4);
}

bool PlaybackSettings::save(const std::string& path) const {
    return FileSystem::write_text(path, to_string());
}

void PlaybackSettings::reset() {
    *this = PlaybackSettings{};
}

} // namespace frameline::core
