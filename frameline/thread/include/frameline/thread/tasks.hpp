#pragma once

#include <frameline/thread/task.hpp>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace frameline::thread {

// ============================================================================
// FunctionTask - Task whose body is a callable polled on every resume
// ============================================================================

class FunctionTask : public Task {
public:
    using ResumeFn = std::function<Step(const Resume&)>;

    FunctionTask(std::string name, ResumeFn fn)
        : Task(std::move(name)), m_fn(std::move(fn)) {}

protected:
    Step resume(const Resume& input) override;

private:
    ResumeFn m_fn;
};

// ============================================================================
// SequenceTask - Runs tasks one after another, forwarding their yields
// ============================================================================
//
// Children are delegated to rather than spawned: a child that completes hands
// control to the next one within the same resume.

class SequenceTask : public Task {
public:
    explicit SequenceTask(std::vector<TaskPtr> children, std::string name = "Sequence")
        : Task(std::move(name)), m_children(std::move(children)) {}

    size_t current_index() const { return m_current; }

protected:
    Step resume(const Resume& input) override;
    void on_cancel() override;

private:
    std::vector<TaskPtr> m_children;
    size_t m_current = 0;
};

// ============================================================================
// AllTask - Spawns its children as threads and waits for all of them
// ============================================================================

class AllTask : public Task {
public:
    explicit AllTask(std::vector<TaskPtr> children, std::string name = "All")
        : Task(std::move(name)), m_children(std::move(children)) {}

protected:
    Step resume(const Resume& input) override;
    void on_cancel() override;

private:
    enum class Phase : uint8_t { Spawn, Join, Done };

    std::vector<TaskPtr> m_children;
    Phase m_phase = Phase::Spawn;
};

// ============================================================================
// Factories
// ============================================================================

TaskPtr make_task(std::string name, FunctionTask::ResumeFn fn);

// Calls fn once and completes without consuming a frame
TaskPtr run(std::function<void()> fn, std::string name = "Run");

// Ends `frames` consecutive frames, then completes
TaskPtr wait_for(int64_t frames);

// Ends frames until the predicate holds; checked on every resume
TaskPtr wait_while(std::function<bool()> predicate, std::string name = "WaitWhile");

// Calls fn(progress) once per frame with progress i / frames, then fn(1)
TaskPtr tween(int64_t frames, std::function<void(double)> fn);

// Suspends once on the future and completes with its outcome passed to fn
TaskPtr await(AsyncResult future, std::function<void(const Resume&)> fn = nullptr);

TaskPtr sequence(std::vector<TaskPtr> children);
TaskPtr all(std::vector<TaskPtr> children);

} // namespace frameline::thread
