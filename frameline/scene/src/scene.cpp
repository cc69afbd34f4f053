#include <frameline/scene/scene.hpp>
#include <frameline/scene/project.hpp>
#include <frameline/thread/tasks.hpp>
#include <frameline/core/log.hpp>
#include <optional>

namespace frameline::scene {

using core::log;
using core::LogLevel;

const char* to_string(SceneState state) {
    switch (state) {
        case SceneState::Initial: return "Initial";
        case SceneState::AfterTransitionIn: return "AfterTransitionIn";
        case SceneState::CanTransitionOut: return "CanTransitionOut";
        case SceneState::Finished: return "Finished";
        default: return "Unknown";
    }
}

Scene::Scene(Project& project, std::string name, SceneRoutine routine)
    : m_project(project)
    , m_name(std::move(name))
    , m_routine(std::move(routine))
    , m_root(Node::group(m_name))
    , m_layout_retry_limit(project.get_layout_retry_limit()) {
    m_storage_key = make_storage_key(m_project.get_name(), m_name);

    if (auto stored = m_project.get_timing_store().read(m_storage_key)) {
        TimeEventMap events;
        if (parse_time_events(*stored, events)) {
            m_time_events.set_stored(std::move(events));
        } else {
            log(LogLevel::Warn, ("Scene " + m_name + ": ignoring malformed stored timings").c_str());
        }
    }
}

void Scene::reset(Scene* previous) {
    m_root->set_position(Vec2(0.0f));
    m_root->set_opacity(1.0f);
    m_root->set_velocity(Vec2(0.0f));
    m_root->show();
    m_counters.clear();
    m_root->clear_children();
    m_previous = previous;

    thread::TaskPtr runner = m_routine ? m_routine(*this, m_project) : nullptr;
    if (!runner) {
        log(LogLevel::Warn, ("Scene " + m_name + " has no routine, finishing immediately").c_str());
        runner = thread::run(nullptr, m_name);
    }

    // Late-bound so the callback can be swapped between resets
    m_scheduler = std::make_unique<thread::Scheduler>(runner,
        [this](const thread::Scheduler& scheduler) {
            if (m_threads_callback) {
                m_threads_callback(scheduler);
            }
        });

    m_state = SceneState::Initial;
    advance();
}

void Scene::advance() {
    if (!m_scheduler) {
        log(LogLevel::Warn, ("Scene " + m_name + " advanced before reset").c_str());
        return;
    }

    Project::ActiveSceneScope scope(m_project, *this);

    thread::Step result = m_scheduler->next();
    update_layout();
    while (!result.done && result.yield.kind == thread::YieldKind::Await) {
        thread::Resume outcome = thread::settle(result.yield.future);
        result = m_scheduler->next(outcome);
        update_layout();
    }

    if (result.done) {
        m_state = SceneState::Finished;
    }
}

thread::TaskPtr Scene::transition(SceneTransition strategy) {
    return std::make_shared<TransitionTask>(*this, std::move(strategy));
}

void Scene::enter_after_transition_in() {
    if (m_state == SceneState::Initial) {
        m_state = SceneState::AfterTransitionIn;
    } else {
        log(LogLevel::Warn, ("Scene " + m_name + " transitioned in an unexpected state: " +
                             to_string(m_state)).c_str());
    }
}

void Scene::can_finish() {
    if (m_state == SceneState::AfterTransitionIn) {
        m_state = SceneState::CanTransitionOut;
    } else {
        log(LogLevel::Warn, ("Scene " + m_name + " was marked as finished in an unexpected state: " +
                             to_string(m_state)).c_str());
    }
}

void Scene::reload(SceneRoutine routine) {
    if (routine) {
        m_routine = std::move(routine);
    }
    m_cached = false;
    m_time_events.reload();
}

int64_t Scene::get_frame_event(const std::string& name) {
    double initial_time = m_project.frames_to_seconds(m_project.get_frame() - first_frame);
    double seconds = m_time_events.resolve(name, initial_time);
    return first_frame + m_project.seconds_to_frames(seconds);
}

void Scene::set_frame_event(const std::string& name, double offset, bool preserve) {
    if (!m_time_events.accepts_offset(name, offset)) {
        return;
    }
    m_cached = false;
    m_time_events.set_offset(name, offset, preserve);
}

void Scene::mark_as_cached() {
    m_cached = true;
    m_time_events.set_preserving(false);

    std::string value = serialize_time_events(m_time_events.stored());
    if (!m_project.get_timing_store().write(m_storage_key, value)) {
        log(LogLevel::Warn, ("Scene " + m_name + ": failed to persist timings").c_str());
    }
}

Node& Scene::add(std::unique_ptr<Node> node) {
    Node* added = node.get();
    m_root->add(std::move(node));
    update_layout();
    return added ? *added : *m_root;
}

std::string Scene::generate_node_id(const std::string& type) {
    uint32_t id = 0;
    auto it = m_counters.find(type);
    if (it != m_counters.end()) {
        id = ++it->second;
    } else {
        m_counters[type] = id;
    }
    return m_name + "." + type + "." + std::to_string(id);
}

bool Scene::update_layout() {
    m_root->update_layout();
    const bool result = m_root->was_dirty();

    uint32_t limit = m_layout_retry_limit;
    while (m_root->was_dirty() && limit > 0) {
        m_root->update_layout();
        limit--;
    }

    if (m_root->was_dirty()) {
        log(LogLevel::Warn, ("Scene " + m_name + ": layout iteration limit exceeded").c_str());
    }

    return result;
}

void Scene::render(render::Canvas& canvas, double sub_frame) {
    m_root->render(canvas, sub_frame);
}

thread::TaskPtr wait_until(Scene& scene, std::string event) {
    auto target = std::make_shared<std::optional<int64_t>>();
    std::string name = "WaitUntil:" + event;

    return thread::make_task(std::move(name), [&scene, event = std::move(event), target](const thread::Resume&) {
        if (!*target) {
            *target = scene.get_frame_event(event);
        }
        if (scene.get_project().get_frame() < **target) {
            return thread::Step::suspend(thread::Yield::frame());
        }
        return thread::Step::complete();
    });
}

} // namespace frameline::scene
