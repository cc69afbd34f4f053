#include <frameline/scene/transition.hpp>
#include <frameline/scene/scene.hpp>
#include <frameline/core/log.hpp>

namespace frameline::scene {

using core::log;
using core::LogLevel;

TransitionTask::TransitionTask(Scene& scene, SceneTransition strategy)
    : thread::Task("Transition")
    , m_scene(scene)
    , m_strategy(std::move(strategy)) {}

thread::Step TransitionTask::resume(const thread::Resume& input) {
    if (!m_started) {
        m_started = true;
        Scene* previous = m_scene.get_previous_scene();

        if (m_strategy) {
            m_runner = m_strategy(m_scene, previous);
            if (!m_runner) {
                log(LogLevel::Warn, ("Scene " + m_scene.get_name() + ": transition produced no task").c_str());
            }
        }

        if (!m_runner) {
            if (previous) {
                previous->hide();
            }
            m_scene.enter_after_transition_in();
            return thread::Step::complete();
        }
    }

    thread::Step result = m_runner->step(input);
    if (!result.done) {
        return result;
    }

    m_scene.enter_after_transition_in();
    return thread::Step::complete();
}

} // namespace frameline::scene
