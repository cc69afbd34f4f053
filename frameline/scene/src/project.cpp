#include <frameline/scene/project.hpp>
#include <frameline/render/stage.hpp>
#include <frameline/core/log.hpp>
#include <algorithm>

namespace frameline::scene {

using core::log;
using core::LogLevel;

Project::Project(std::string name, double frame_rate, std::shared_ptr<ITimingStore> store)
    : m_name(std::move(name))
    , m_clock{frame_rate}
    , m_store(std::move(store)) {
    if (!m_store) {
        m_store = std::make_shared<MemoryTimingStore>();
    }
}

Project::Project(const core::PlaybackSettings& settings)
    : Project(settings.project_name, settings.frame_rate,
              std::make_shared<FileTimingStore>(settings.timing_directory)) {
    m_layout_retry_limit = settings.layout_retry_limit;
}

Scene& Project::add_scene(std::string name, SceneRoutine routine) {
    if (find_scene(name)) {
        log(LogLevel::Warn, ("Project " + m_name + " already has a scene named " + name).c_str());
    }
    m_scenes.push_back(std::make_unique<Scene>(*this, std::move(name), std::move(routine)));
    return *m_scenes.back();
}

Scene* Project::find_scene(const std::string& name) const {
    for (const auto& scene : m_scenes) {
        if (scene->get_name() == name) {
            return scene.get();
        }
    }
    return nullptr;
}

Scene* Project::get_next_scene(const Scene* scene) const {
    if (!scene) {
        return m_scenes.empty() ? nullptr : m_scenes.front().get();
    }

    auto it = std::find_if(m_scenes.begin(), m_scenes.end(),
        [scene](const std::unique_ptr<Scene>& s) { return s.get() == scene; });
    if (it == m_scenes.end() || ++it == m_scenes.end()) {
        return nullptr;
    }
    return it->get();
}

Project::ActiveSceneScope::ActiveSceneScope(Project& project, Scene& scene)
    : m_project(project)
    , m_outer(project.m_active) {
    m_project.m_active = &scene;
}

Project::ActiveSceneScope::~ActiveSceneScope() {
    m_project.m_active = m_outer;
}

void Project::reset() {
    m_frame = 0;
    m_previous = nullptr;
    m_current = get_next_scene(nullptr);

    if (m_current) {
        m_current->first_frame = 0;
        m_current->reset(nullptr);
    }
}

bool Project::next() {
    if (m_previous) {
        m_previous->advance();
        if (!m_current || m_current->is_after_transition_in()) {
            m_previous = nullptr;
        }
    }

    m_frame++;

    if (m_current) {
        m_current->advance();

        if (m_current->can_transition_out()) {
            Scene* next_scene = get_next_scene(m_current);
            if (next_scene) {
                m_previous = m_current;
                m_current = next_scene;
                m_current->first_frame = m_frame;
                m_current->reset(m_previous);
                if (m_current->is_after_transition_in()) {
                    m_previous = nullptr;
                }
            }
        }
    }

    return is_finished();
}

void Project::recalculate() {
    m_previous = nullptr;
    m_frame = 0;

    for (const auto& scene : m_scenes) {
        m_current = scene.get();
        scene->first_frame = m_frame;
        scene->transition_duration = -1;
        scene->reset(nullptr);

        while (!scene->can_transition_out()) {
            if (scene->transition_duration < 0 && scene->is_after_transition_in()) {
                scene->transition_duration = m_frame - scene->first_frame;
            }
            m_frame++;
            scene->advance();
        }

        if (scene->transition_duration < 0) {
            scene->transition_duration = 0;
        }
        scene->set_last_frame(m_frame);
        scene->mark_as_cached();
    }

    log(LogLevel::Info, ("Project " + m_name + ": " + std::to_string(m_scenes.size()) +
                         " scenes, " + std::to_string(m_frame) + " frames").c_str());

    reset();
}

void Project::render(render::Stage& stage) {
    if (!m_current) {
        return;
    }
    stage.render(*m_current, m_previous);
}

void Project::set_layout_retry_limit(uint32_t limit) {
    m_layout_retry_limit = limit;
    for (const auto& scene : m_scenes) {
        scene->set_layout_retry_limit(limit);
    }
}

} // namespace frameline::scene
