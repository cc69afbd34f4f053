#pragma once

#include <frameline/thread/task.hpp>
#include <functional>

namespace frameline::scene {

class Scene;

// Builds the task that animates `next` in over `previous` (which may be null)
using SceneTransition = std::function<thread::TaskPtr(Scene& next, Scene* previous)>;

// Runs a transition for a scene and then marks it as transitioned in.
// Without a strategy the previous scene is hidden immediately.
class TransitionTask : public thread::Task {
public:
    TransitionTask(Scene& scene, SceneTransition strategy);

protected:
    thread::Step resume(const thread::Resume& input) override;

private:
    Scene& m_scene;
    SceneTransition m_strategy;
    thread::TaskPtr m_runner;
    bool m_started = false;
};

} // namespace frameline::scene
