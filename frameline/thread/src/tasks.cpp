#include <frameline/thread/tasks.hpp>
#include <memory>

namespace frameline::thread {

Step FunctionTask::resume(const Resume& input) {
    if (!m_fn) {
        return Step::complete();
    }
    return m_fn(input);
}

Step SequenceTask::resume(const Resume& input) {
    Resume forwarded = input;

    // Continue from where we left off
    while (m_current < m_children.size()) {
        auto& child = m_children[m_current];
        if (!child) {
            m_current++;
            continue;
        }

        Step result = child->step(forwarded);
        forwarded = Resume::none();

        if (!result.done) {
            return result;
        }
        m_current++;
    }

    return Step::complete();
}

void SequenceTask::on_cancel() {
    for (size_t i = m_current; i < m_children.size(); ++i) {
        if (m_children[i]) {
            m_children[i]->cancel();
        }
    }
}

Step AllTask::resume(const Resume& input) {
    switch (m_phase) {
        case Phase::Spawn:
            if (m_children.empty()) {
                m_phase = Phase::Done;
                return Step::complete();
            }
            m_phase = Phase::Join;
            return Step::suspend(Yield::spawn(m_children));

        case Phase::Join:
            m_phase = Phase::Done;
            return Step::suspend(Yield::join(m_children));

        case Phase::Done:
        default:
            input.rethrow_if_failed();
            return Step::complete();
    }
}

void AllTask::on_cancel() {
    for (auto& child : m_children) {
        if (child) {
            child->cancel();
        }
    }
}

TaskPtr make_task(std::string name, FunctionTask::ResumeFn fn) {
    return std::make_shared<FunctionTask>(std::move(name), std::move(fn));
}

TaskPtr run(std::function<void()> fn, std::string name) {
    return make_task(std::move(name), [fn = std::move(fn)](const Resume&) {
        if (fn) fn();
        return Step::complete();
    });
}

TaskPtr wait_for(int64_t frames) {
    auto remaining = std::make_shared<int64_t>(frames);
    return make_task("WaitFor", [remaining](const Resume&) {
        if (*remaining > 0) {
            (*remaining)--;
            return Step::suspend(Yield::frame());
        }
        return Step::complete();
    });
}

TaskPtr wait_while(std::function<bool()> predicate, std::string name) {
    return make_task(std::move(name), [predicate = std::move(predicate)](const Resume&) {
        if (predicate && predicate()) {
            return Step::suspend(Yield::frame());
        }
        return Step::complete();
    });
}

TaskPtr tween(int64_t frames, std::function<void(double)> fn) {
    auto frame = std::make_shared<int64_t>(0);
    return make_task("Tween", [frames, frame, fn = std::move(fn)](const Resume&) {
        if (*frame < frames) {
            if (fn) fn(static_cast<double>(*frame) / static_cast<double>(frames));
            (*frame)++;
            return Step::suspend(Yield::frame());
        }
        if (fn) fn(1.0);
        return Step::complete();
    });
}

TaskPtr await(AsyncResult future, std::function<void(const Resume&)> fn) {
    auto waiting = std::make_shared<bool>(false);
    return make_task("Await", [future = std::move(future), fn = std::move(fn), waiting](const Resume& input) {
        if (!*waiting) {
            *waiting = true;
            return Step::suspend(Yield::await(future));
        }

        if (fn) {
            fn(input);
        } else {
            input.rethrow_if_failed();
        }
        return Step::complete();
    });
}

TaskPtr sequence(std::vector<TaskPtr> children) {
    return std::make_shared<SequenceTask>(std::move(children));
}

TaskPtr all(std::vector<TaskPtr> children) {
    return std::make_shared<AllTask>(std::move(children));
}

} // namespace frameline::thread
