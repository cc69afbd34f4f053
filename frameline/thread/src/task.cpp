#include <frameline/thread/task.hpp>

namespace frameline::thread {

const char* to_string(YieldKind kind) {
    switch (kind) {
        case YieldKind::Frame: return "Frame";
        case YieldKind::Await: return "Await";
        case YieldKind::Spawn: return "Spawn";
        case YieldKind::Join: return "Join";
        case YieldKind::Value: return "Value";
        default: return "Unknown";
    }
}

Yield Yield::frame() {
    return Yield{};
}

Yield Yield::await(AsyncResult future) {
    Yield y;
    y.kind = YieldKind::Await;
    y.future = std::move(future);
    return y;
}

Yield Yield::spawn(TaskPtr task) {
    std::vector<TaskPtr> tasks;
    tasks.push_back(std::move(task));
    return spawn(std::move(tasks));
}

Yield Yield::spawn(std::vector<TaskPtr> tasks) {
    Yield y;
    y.kind = YieldKind::Spawn;
    y.tasks = std::move(tasks);
    return y;
}

Yield Yield::join(std::vector<TaskPtr> tasks) {
    Yield y;
    y.kind = YieldKind::Join;
    y.tasks = std::move(tasks);
    return y;
}

Yield Yield::value(std::any value) {
    Yield y;
    y.kind = YieldKind::Value;
    y.value = std::move(value);
    return y;
}

void Resume::rethrow_if_failed() const {
    if (error) {
        std::rethrow_exception(error);
    }
}

Resume Resume::with(std::any value) {
    Resume r;
    r.value = std::move(value);
    return r;
}

Resume Resume::failure(std::exception_ptr error) {
    Resume r;
    r.error = std::move(error);
    return r;
}

Resume settle(const AsyncResult& future) {
    if (!future.valid()) {
        return Resume::none();
    }

    try {
        return Resume::with(future.get());
    } catch (...) {
        // Delivered to the routine at its suspension point
        return Resume::failure(std::current_exception());
    }
}

Step Task::step(const Resume& input) {
    if (m_finished) {
        return Step::complete();
    }

    Step result = resume(input);
    if (result.done) {
        m_finished = true;
    }
    return result;
}

void Task::cancel() {
    if (m_finished) return;
    m_finished = true;
    m_cancelled = true;
    on_cancel();
}

} // namespace frameline::thread
