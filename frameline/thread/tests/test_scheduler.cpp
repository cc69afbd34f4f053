#include <catch2/catch_test_macros.hpp>
#include <frameline/thread/scheduler.hpp>
#include <frameline/thread/tasks.hpp>
#include <frameline/core/log.hpp>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace frameline::thread;
using namespace frameline::core;

namespace {

struct WarningCounter : ILogSink {
    int warnings = 0;

    WarningCounter() { add_log_sink(this); }
    ~WarningCounter() override { remove_log_sink(this); }

    void log(LogLevel level, const std::string&, const std::string&) override {
        if (level == LogLevel::Warn) warnings++;
    }
};

// Records its name once per frame for `frames` frames
TaskPtr recorder(std::vector<std::string>& trace, std::string name, int frames) {
    auto left = std::make_shared<int>(frames);
    return make_task(name, [&trace, name, left](const Resume&) {
        if (*left == 0) {
            return Step::complete();
        }
        (*left)--;
        trace.push_back(name);
        return Step::suspend(Yield::frame());
    });
}

} // anonymous namespace

TEST_CASE("Scheduler runs the root task frame by frame", "[thread][scheduler]") {
    std::vector<std::string> trace;
    Scheduler scheduler(recorder(trace, "root", 2));

    Step step = scheduler.next();
    REQUIRE_FALSE(step.done);
    REQUIRE(step.yield.kind == YieldKind::Frame);
    REQUIRE(trace.size() == 1);

    step = scheduler.next();
    REQUIRE_FALSE(step.done);
    REQUIRE(trace.size() == 2);

    step = scheduler.next();
    REQUIRE(step.done);
    REQUIRE(scheduler.is_done());
    REQUIRE(scheduler.frame_count() == 3);
}

TEST_CASE("Scheduler reports done once", "[thread][scheduler]") {
    int runs = 0;
    Scheduler scheduler(run([&]() { runs++; }));

    REQUIRE(scheduler.next().done);
    uint64_t frames = scheduler.frame_count();

    REQUIRE(scheduler.next().done);
    REQUIRE(scheduler.next().done);
    REQUIRE(runs == 1);
    REQUIRE(scheduler.frame_count() == frames);
}

TEST_CASE("Scheduler without a root is done immediately", "[thread][scheduler]") {
    Scheduler scheduler(nullptr);
    REQUIRE(scheduler.is_done());
    REQUIRE(scheduler.next().done);
}

TEST_CASE("Spawned threads run in the same frame", "[thread][scheduler]") {
    std::vector<std::string> trace;
    auto spawned = std::make_shared<bool>(false);
    TaskPtr child = recorder(trace, "child", 1);

    TaskPtr root = make_task("root", [&trace, spawned, child](const Resume&) {
        if (!*spawned) {
            *spawned = true;
            return Step::suspend(Yield::spawn(child));
        }
        trace.push_back("root");
        return Step::suspend(Yield::frame());
    });

    Scheduler scheduler(root);
    scheduler.next();

    REQUIRE(trace == std::vector<std::string>{"root", "child"});
    REQUIRE(scheduler.thread_count() == 2);
    REQUIRE(scheduler.thread_names() == std::vector<std::string>{"root", "child"});

    scheduler.next();
    REQUIRE(child->is_finished());
    REQUIRE(scheduler.thread_count() == 1);
}

TEST_CASE("Join waits for spawned threads", "[thread][scheduler]") {
    std::vector<std::string> trace;
    TaskPtr child = recorder(trace, "child", 2);
    auto phase = std::make_shared<int>(0);

    TaskPtr root = make_task("root", [&trace, child, phase](const Resume&) {
        switch ((*phase)++) {
            case 0: return Step::suspend(Yield::spawn(child));
            case 1: return Step::suspend(Yield::join());
            default:
                trace.push_back("joined");
                return Step::complete();
        }
    });

    Scheduler scheduler(root);
    REQUIRE_FALSE(scheduler.next().done);   // child frame 1
    REQUIRE_FALSE(scheduler.next().done);   // child frame 2
    REQUIRE_FALSE(scheduler.next().done);   // child completes after root was checked
    REQUIRE(scheduler.next().done);

    REQUIRE(trace == std::vector<std::string>{"child", "child", "joined"});
}

TEST_CASE("Joining a task that was never spawned is reported", "[thread][scheduler]") {
    WarningCounter counter;
    TaskPtr stray = make_task("stray", [](const Resume&) { return Step::complete(); });
    auto phase = std::make_shared<int>(0);

    TaskPtr root = make_task("root", [stray, phase](const Resume&) {
        if ((*phase)++ == 0) {
            return Step::suspend(Yield::join({stray}));
        }
        return Step::complete();
    });

    Scheduler scheduler(root);
    REQUIRE_FALSE(scheduler.next().done);
    REQUIRE(counter.warnings == 1);

    // The join stays pending without repeating the warning
    REQUIRE_FALSE(scheduler.next().done);
    REQUIRE(counter.warnings == 1);
    REQUIRE_FALSE(stray->is_finished());
}

TEST_CASE("Finishing a thread cancels its children", "[thread][scheduler]") {
    TaskPtr child = wait_for(100);
    auto phase = std::make_shared<int>(0);

    TaskPtr root = make_task("root", [child, phase](const Resume&) {
        switch ((*phase)++) {
            case 0: return Step::suspend(Yield::spawn(child));
            case 1: return Step::suspend(Yield::frame());
            default: return Step::complete();
        }
    });

    Scheduler scheduler(root);
    scheduler.next();
    REQUIRE_FALSE(child->is_finished());

    REQUIRE(scheduler.next().done);
    REQUIRE(child->is_cancelled());
}

TEST_CASE("Invalid yields are reported and skipped", "[thread][scheduler]") {
    WarningCounter counter;
    auto phase = std::make_shared<int>(0);
    auto resumed_empty = std::make_shared<bool>(false);

    TaskPtr root = make_task("root", [phase, resumed_empty](const Resume& input) {
        switch ((*phase)++) {
            case 0: return Step::suspend(Yield::value(std::string("stray")));
            case 1:
                *resumed_empty = !input.has_value();
                return Step::suspend(Yield::frame());
            default: return Step::complete();
        }
    });

    Scheduler scheduler(root);
    Step step = scheduler.next();

    REQUIRE(step.yield.kind == YieldKind::Frame);
    REQUIRE(counter.warnings == 1);
    REQUIRE(*resumed_empty);
}

TEST_CASE("Threads callback observes the running set", "[thread][scheduler]") {
    std::vector<size_t> counts;
    auto spawned = std::make_shared<bool>(false);

    TaskPtr root = make_task("root", [spawned](const Resume&) {
        if (!*spawned) {
            *spawned = true;
            return Step::suspend(Yield::spawn(wait_for(1)));
        }
        return Step::complete();
    });

    Scheduler scheduler(root, [&](const Scheduler& s) { counts.push_back(s.thread_count()); });
    REQUIRE(counts == std::vector<size_t>{1});

    REQUIRE(scheduler.next().done);
    REQUIRE(counts.size() == 3);
    REQUIRE(counts[1] == 2);
}

TEST_CASE("Awaits are handed back to the caller", "[thread][scheduler]") {
    std::promise<std::any> promise;
    AsyncResult future = promise.get_future().share();

    SECTION("Value reaches the routine") {
        int received = 0;
        Scheduler scheduler(await(future, [&](const Resume& input) {
            received = std::any_cast<int>(input.value);
        }));

        Step step = scheduler.next();
        REQUIRE(step.yield.kind == YieldKind::Await);

        promise.set_value(std::any(7));
        REQUIRE(scheduler.next(settle(step.yield.future)).done);
        REQUIRE(received == 7);
    }

    SECTION("Unhandled failure propagates out of next") {
        Scheduler scheduler(await(future));

        Step step = scheduler.next();
        promise.set_exception(std::make_exception_ptr(std::runtime_error("load failed")));

        Resume outcome = settle(step.yield.future);
        REQUIRE(outcome.failed());
        REQUIRE_THROWS_AS(scheduler.next(outcome), std::runtime_error);
        REQUIRE(scheduler.is_done());
        REQUIRE(scheduler.next().done);
    }
}

TEST_CASE("Task exceptions stop the scheduler", "[thread][scheduler]") {
    Scheduler scheduler(make_task("broken", [](const Resume&) -> Step {
        throw std::logic_error("bad routine");
    }));

    REQUIRE_THROWS_AS(scheduler.next(), std::logic_error);
    REQUIRE(scheduler.is_done());
}
