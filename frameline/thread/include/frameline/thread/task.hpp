#pragma once

#include <any>
#include <cstdint>
#include <exception>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace frameline::thread {

class Task;
using TaskPtr = std::shared_ptr<Task>;

// Result of an external asynchronous operation a routine can wait on
using AsyncResult = std::shared_future<std::any>;

// ============================================================================
// Yield - Control token produced at a suspension point
// ============================================================================

enum class YieldKind : uint8_t {
    Frame,      // This thread is done for the current frame
    Await,      // Suspend until the future settles
    Spawn,      // Start child threads in the same pool
    Join,       // Wait until the given threads (or all children) finish
    Value       // Arbitrary value; not understood by the scheduler
};

const char* to_string(YieldKind kind);

struct Yield {
    YieldKind kind = YieldKind::Frame;
    AsyncResult future;              // Await
    std::vector<TaskPtr> tasks;      // Spawn / Join (empty Join = all children)
    std::any value;                  // Value

    static Yield frame();
    static Yield await(AsyncResult future);
    static Yield spawn(TaskPtr task);
    static Yield spawn(std::vector<TaskPtr> tasks);
    static Yield join(std::vector<TaskPtr> tasks = {});
    static Yield value(std::any value);
};

// ============================================================================
// Resume - Input handed to a task when it continues
// ============================================================================

struct Resume {
    std::any value;
    std::exception_ptr error;

    bool has_value() const { return value.has_value(); }
    bool failed() const { return error != nullptr; }

    // Rethrows the failure of an awaited operation, if any
    void rethrow_if_failed() const;

    static Resume none() { return {}; }
    static Resume with(std::any value);
    static Resume failure(std::exception_ptr error);
};

// Blocks until the future settles and packages its outcome for the routine
Resume settle(const AsyncResult& future);

// ============================================================================
// Step - Outcome of one resume
// ============================================================================

struct Step {
    bool done = false;
    Yield yield;    // Meaningful only when !done

    static Step complete() { return Step{true, {}}; }
    static Step suspend(Yield yield) { return Step{false, std::move(yield)}; }
};

// ============================================================================
// Task - Resumable unit of work polled by the scheduler
// ============================================================================

class Task {
public:
    explicit Task(std::string name = "Task") : m_name(std::move(name)) {}
    virtual ~Task() = default;

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    // Runs the task until its next suspension point. Calling step() on a
    // finished task is a no-op that reports completion again.
    Step step(const Resume& input = Resume::none());

    // Stops the task without running it further
    void cancel();

    bool is_finished() const { return m_finished; }
    bool is_cancelled() const { return m_cancelled; }

    const std::string& get_name() const { return m_name; }

protected:
    virtual Step resume(const Resume& input) = 0;
    virtual void on_cancel() {}

    std::string m_name;

private:
    bool m_finished = false;
    bool m_cancelled = false;
};

} // namespace frameline::thread
