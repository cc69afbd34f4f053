#pragma once

#include <frameline/scene/scene.hpp>
#include <frameline/scene/timing_store.hpp>
#include <frameline/core/frame_clock.hpp>
#include <frameline/core/settings.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace frameline::render {
class Stage;
}

namespace frameline::scene {

// ============================================================================
// Project - Ordered scenes sharing one frame clock and timing store
// ============================================================================

class Project {
public:
    // Without a store, timings are kept in memory only
    Project(std::string name, double frame_rate = 30.0,
            std::shared_ptr<ITimingStore> store = nullptr);

    // Name, frame rate, retry limit and a file store from the settings
    explicit Project(const core::PlaybackSettings& settings);

    // Non-copyable
    Project(const Project&) = delete;
    Project& operator=(const Project&) = delete;

    const std::string& get_name() const { return m_name; }
    const core::FrameClock& get_clock() const { return m_clock; }
    ITimingStore& get_timing_store() { return *m_store; }

    double frames_to_seconds(int64_t frames) const { return m_clock.frames_to_seconds(frames); }
    int64_t seconds_to_frames(double seconds) const { return m_clock.seconds_to_frames(seconds); }

    int64_t get_frame() const { return m_frame; }

    // Scenes
    Scene& add_scene(std::string name, SceneRoutine routine);
    const std::vector<std::unique_ptr<Scene>>& get_scenes() const { return m_scenes; }
    Scene* find_scene(const std::string& name) const;
    Scene* get_next_scene(const Scene* scene) const;

    Scene* get_current_scene() const { return m_current; }
    Scene* get_previous_scene() const { return m_previous; }

    // Scene whose routine is running right now, null outside Scene::advance()
    Scene* get_active_scene() const { return m_active; }

    // Marks a scene as active for the lifetime of the scope
    class ActiveSceneScope {
    public:
        ActiveSceneScope(Project& project, Scene& scene);
        ~ActiveSceneScope();

        ActiveSceneScope(const ActiveSceneScope&) = delete;
        ActiveSceneScope& operator=(const ActiveSceneScope&) = delete;

    private:
        Project& m_project;
        Scene* m_outer;
    };

    // ========================================================================
    // Playback
    // ========================================================================

    // Rewinds to frame 0 with the first scene freshly reset
    void reset();

    // Advances one frame; returns true once the last scene has finished
    bool next();

    bool is_finished() const { return !m_current || m_current->is_finished(); }

    // Plays every scene on its own to measure first frames, durations and
    // transition lengths, then marks all scenes as cached and rewinds
    void recalculate();

    // Composites the current frame (and the previous scene during a
    // transition) into the stage
    void render(render::Stage& stage);

    void set_layout_retry_limit(uint32_t limit);
    uint32_t get_layout_retry_limit() const { return m_layout_retry_limit; }

private:
    std::string m_name;
    core::FrameClock m_clock;
    std::shared_ptr<ITimingStore> m_store;
    uint32_t m_layout_retry_limit = Scene::kDefaultLayoutRetryLimit;

    std::vector<std::unique_ptr<Scene>> m_scenes;
    Scene* m_current = nullptr;
    Scene* m_previous = nullptr;
    Scene* m_active = nullptr;
    int64_t m_frame = 0;
};

} // namespace frameline::scene
