#pragma once

#include <frameline/thread/task.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace frameline::thread {

class Scheduler;

// Observes changes to the set of running threads
using ThreadsCallback = std::function<void(const Scheduler&)>;

// ============================================================================
// Scheduler - Runs a root task and the threads it spawns as one cursor
// ============================================================================
//
// Each call to next() runs every live thread, in spawn order, until it ends
// its frame, finishes or blocks on a join. Awaited futures are handed back to
// the caller, which settles them and passes the outcome into the following
// next() call. Completion of the root task completes the scheduler.

class Scheduler {
public:
    explicit Scheduler(TaskPtr root, ThreadsCallback callback = nullptr);
    ~Scheduler() = default;

    // Non-copyable
    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Returns Frame at the end of a frame, Await when the current thread needs
    // an external result, or done once the root task has finished
    Step next(const Resume& input = Resume::none());

    bool is_done() const { return m_done; }

    // Live (unfinished) threads, root included
    size_t thread_count() const;
    std::vector<std::string> thread_names() const;

    // Number of completed frame boundaries
    uint64_t frame_count() const { return m_frames; }

private:
    struct Thread {
        TaskPtr task;
        std::vector<TaskPtr> children;
        bool joining = false;
        std::vector<TaskPtr> join_targets;  // Empty = all children
    };

    Thread* find_thread(const Task* task);
    void spawn(Thread& parent, const std::vector<TaskPtr>& tasks);
    void cancel_children(Thread& thread);
    bool join_satisfied(const Thread& thread) const;
    void prune_finished();
    void notify();

    std::vector<std::unique_ptr<Thread>> m_threads;
    TaskPtr m_root;
    ThreadsCallback m_callback;
    size_t m_cursor = 0;
    bool m_awaiting = false;
    bool m_done = false;
    uint64_t m_frames = 0;
};

} // namespace frameline::thread
