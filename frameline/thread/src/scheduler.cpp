#include <frameline/thread/scheduler.hpp>
#include <frameline/core/log.hpp>
#include <algorithm>

namespace frameline::thread {

using core::log;
using core::LogLevel;

Scheduler::Scheduler(TaskPtr root, ThreadsCallback callback)
    : m_root(std::move(root))
    , m_callback(std::move(callback)) {
    if (!m_root) {
        log(LogLevel::Error, "Scheduler: created without a root task");
        m_done = true;
        return;
    }

    auto thread = std::make_unique<Thread>();
    thread->task = m_root;
    m_threads.push_back(std::move(thread));
    notify();
}

Step Scheduler::next(const Resume& input) {
    if (m_done) {
        return Step::complete();
    }

    // Input only belongs to the thread that asked for it
    Resume pending = m_awaiting ? input : Resume::none();
    m_awaiting = false;

    for (;;) {
        if (m_cursor >= m_threads.size()) {
            m_cursor = 0;
            m_frames++;
            prune_finished();
            return Step::suspend(Yield::frame());
        }

        Thread& thread = *m_threads[m_cursor];
        if (thread.task->is_finished()) {
            m_cursor++;
            continue;
        }

        if (thread.joining) {
            if (!join_satisfied(thread)) {
                m_cursor++;
                continue;
            }
            thread.joining = false;
            thread.join_targets.clear();
        }

        Step step;
        try {
            step = thread.task->step(pending);
        } catch (const std::exception& e) {
            log(LogLevel::Error, ("Thread '" + thread.task->get_name() + "' failed: " + e.what()).c_str());
            m_done = true;
            throw;
        } catch (...) {
            log(LogLevel::Error, ("Thread '" + thread.task->get_name() + "' failed with an unknown error").c_str());
            m_done = true;
            throw;
        }
        pending = Resume::none();

        if (step.done) {
            cancel_children(thread);
            if (thread.task == m_root) {
                m_done = true;
                m_frames++;
                notify();
                return Step::complete();
            }
            notify();
            m_cursor++;
            continue;
        }

        switch (step.yield.kind) {
            case YieldKind::Frame:
                m_cursor++;
                break;

            case YieldKind::Await:
                m_awaiting = true;
                return step;

            case YieldKind::Spawn:
                spawn(thread, step.yield.tasks);
                break;

            case YieldKind::Join:
                thread.joining = true;
                thread.join_targets = std::move(step.yield.tasks);
                for (const auto& target : thread.join_targets) {
                    if (target && !target->is_finished() && !find_thread(target.get())) {
                        log(LogLevel::Warn, ("Thread '" + thread.task->get_name() + "' joins task '" +
                                             target->get_name() + "' which was never spawned").c_str());
                    }
                }
                if (join_satisfied(thread)) {
                    thread.joining = false;
                    thread.join_targets.clear();
                } else {
                    m_cursor++;
                }
                break;

            case YieldKind::Value:
            default:
                log(LogLevel::Warn, ("Invalid value yielded by thread '" + thread.task->get_name() +
                                     "', resuming without a value").c_str());
                break;
        }
    }
}

size_t Scheduler::thread_count() const {
    return static_cast<size_t>(std::count_if(m_threads.begin(), m_threads.end(),
        [](const std::unique_ptr<Thread>& t) { return !t->task->is_finished(); }));
}

std::vector<std::string> Scheduler::thread_names() const {
    std::vector<std::string> names;
    for (const auto& thread : m_threads) {
        if (!thread->task->is_finished()) {
            names.push_back(thread->task->get_name());
        }
    }
    return names;
}

Scheduler::Thread* Scheduler::find_thread(const Task* task) {
    for (auto& thread : m_threads) {
        if (thread->task.get() == task) {
            return thread.get();
        }
    }
    return nullptr;
}

void Scheduler::spawn(Thread& parent, const std::vector<TaskPtr>& tasks) {
    bool changed = false;
    for (const auto& task : tasks) {
        if (!task) {
            log(LogLevel::Warn, ("Thread '" + parent.task->get_name() + "' spawned a null task").c_str());
            continue;
        }
        if (task->is_finished() || find_thread(task.get())) {
            log(LogLevel::Warn, ("Task '" + task->get_name() + "' is already running or finished").c_str());
            continue;
        }

        // Appended threads still run before this frame ends
        auto thread = std::make_unique<Thread>();
        thread->task = task;
        m_threads.push_back(std::move(thread));
        parent.children.push_back(task);
        changed = true;
    }

    if (changed) {
        notify();
    }
}

void Scheduler::cancel_children(Thread& thread) {
    for (const auto& child : thread.children) {
        if (child->is_finished()) continue;

        if (Thread* child_thread = find_thread(child.get())) {
            cancel_children(*child_thread);
        }
        child->cancel();
        log(LogLevel::Debug, ("Thread '" + child->get_name() + "' cancelled with its parent").c_str());
    }
    thread.children.clear();
}

bool Scheduler::join_satisfied(const Thread& thread) const {
    const auto& targets = thread.join_targets.empty() ? thread.children : thread.join_targets;
    return std::all_of(targets.begin(), targets.end(),
        [](const TaskPtr& task) { return !task || task->is_finished(); });
}

void Scheduler::prune_finished() {
    m_threads.erase(
        std::remove_if(m_threads.begin(), m_threads.end(),
            [](const std::unique_ptr<Thread>& t) { return t->task->is_finished(); }),
        m_threads.end()
    );
}

void Scheduler::notify() {
    if (m_callback) {
        m_callback(*this);
    }
}

} // namespace frameline::thread
