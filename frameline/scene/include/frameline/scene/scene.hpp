#pragma once

#include <frameline/scene/node.hpp>
#include <frameline/scene/time_event.hpp>
#include <frameline/scene/transition.hpp>
#include <frameline/render/renderable.hpp>
#include <frameline/thread/scheduler.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace frameline::scene {

class Project;
class Scene;

// Builds a fresh instance of a scene's animation routine
using SceneRoutine = std::function<thread::TaskPtr(Scene&, Project&)>;

enum class SceneState : uint8_t {
    Initial,
    AfterTransitionIn,
    CanTransitionOut,
    Finished
};

const char* to_string(SceneState state);

// ============================================================================
// Scene - One animation unit driven frame by frame
// ============================================================================

class Scene : public render::IRenderable {
public:
    static constexpr uint32_t kDefaultLayoutRetryLimit = 10;

    Scene(Project& project, std::string name, SceneRoutine routine);
    ~Scene() override = default;

    // Non-copyable
    Scene(const Scene&) = delete;
    Scene& operator=(const Scene&) = delete;

    const std::string& get_name() const { return m_name; }
    Project& get_project() const { return m_project; }
    const std::string& get_storage_key() const { return m_storage_key; }

    // Timeline
    int64_t first_frame = 0;
    int64_t duration = 0;
    int64_t transition_duration = 0;

    int64_t last_frame() const { return first_frame + duration; }
    void set_last_frame(int64_t frame) { duration = frame - first_frame; }

    // ========================================================================
    // Playback
    // ========================================================================

    // Clears the scene, restarts its routine and runs the first step
    void reset(Scene* previous = nullptr);

    // Runs the routine until it ends the current frame or finishes.
    // Failures of awaited operations the routine does not handle propagate.
    void advance();

    // Task that plays the transition in and then enters AfterTransitionIn
    thread::TaskPtr transition(SceneTransition strategy = nullptr);

    // Signals that the routine may hand over to the next scene
    void can_finish();

    SceneState get_state() const { return m_state; }
    bool is_after_transition_in() const { return m_state == SceneState::AfterTransitionIn; }
    bool is_finished() const { return m_state == SceneState::Finished; }
    bool can_transition_out() const {
        return m_state == SceneState::CanTransitionOut || m_state == SceneState::Finished;
    }

    Scene* get_previous_scene() const { return m_previous; }

    // Swaps the routine (if given) and forgets live time events
    void reload(SceneRoutine routine = nullptr);

    void set_threads_callback(thread::ThreadsCallback callback) { m_threads_callback = std::move(callback); }
    const thread::Scheduler* get_scheduler() const { return m_scheduler.get(); }

    // ========================================================================
    // Time events
    // ========================================================================

    // Frame at which the named event should happen
    int64_t get_frame_event(const std::string& name);
    void set_frame_event(const std::string& name, double offset, bool preserve = true);

    std::vector<TimeEvent> get_time_events() const { return m_time_events.events(); }
    const TimeEventLedger& get_ledger() const { return m_time_events; }

    [[nodiscard]] core::ScopedConnection on_time_events_changed(TimeEventLedger::ChangedSignal::Handler handler) {
        return m_time_events.subscribe(std::move(handler));
    }

    // Finalizes timing and persists stored events
    void mark_as_cached();
    bool is_marked_as_cached() const { return m_cached; }
    bool is_preserving_events() const { return m_time_events.is_preserving(); }

    // ========================================================================
    // Contents
    // ========================================================================

    Node& get_root() { return *m_root; }
    const Node& get_root() const { return *m_root; }

    Node& add(std::unique_ptr<Node> node);

    // "{scene}.{type}.{n}", n counting from 0 per type since the last reset
    std::string generate_node_id(const std::string& type);

    void hide() { m_root->hide(); }
    void show() { m_root->show(); }
    bool is_visible() const { return m_root->is_visible(); }

    // Returns whether the first pass found the layout dirty
    bool update_layout();
    void set_layout_retry_limit(uint32_t limit) { m_layout_retry_limit = limit; }
    uint32_t get_layout_retry_limit() const { return m_layout_retry_limit; }

    // IRenderable
    void render(render::Canvas& canvas, double sub_frame = 0.0) override;
    bool previous_on_top() const override { return m_previous_on_top; }
    void set_previous_on_top(bool value) { m_previous_on_top = value; }

private:
    friend class TransitionTask;
    void enter_after_transition_in();

    Project& m_project;
    std::string m_name;
    std::string m_storage_key;
    SceneRoutine m_routine;

    std::unique_ptr<Node> m_root;
    std::unique_ptr<thread::Scheduler> m_scheduler;
    thread::ThreadsCallback m_threads_callback;

    Scene* m_previous = nullptr;
    SceneState m_state = SceneState::Initial;
    bool m_cached = false;
    bool m_previous_on_top = false;
    uint32_t m_layout_retry_limit = kDefaultLayoutRetryLimit;

    TimeEventLedger m_time_events;
    std::unordered_map<std::string, uint32_t> m_counters;
};

// Ends frames until the project reaches the frame of the named time event
thread::TaskPtr wait_until(Scene& scene, std::string event);

} // namespace frameline::scene
