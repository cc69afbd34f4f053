#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <frameline/thread/scheduler.hpp>
#include <frameline/thread/tasks.hpp>
#include <vector>

using namespace frameline::thread;
using Catch::Matchers::WithinAbs;

namespace {

// Number of next() calls until the scheduler completes
int frames_until_done(Scheduler& scheduler, int limit = 1000) {
    for (int i = 1; i <= limit; ++i) {
        if (scheduler.next().done) return i;
    }
    return -1;
}

} // anonymous namespace

TEST_CASE("wait_for ends the given number of frames", "[thread][tasks]") {
    SECTION("Zero frames completes immediately") {
        Scheduler scheduler(wait_for(0));
        REQUIRE(frames_until_done(scheduler) == 1);
    }

    SECTION("Several frames") {
        Scheduler scheduler(wait_for(5));
        REQUIRE(frames_until_done(scheduler) == 6);
    }
}

TEST_CASE("wait_while polls its predicate", "[thread][tasks]") {
    int polls = 0;
    Scheduler scheduler(wait_while([&]() { return ++polls < 3; }));

    REQUIRE(frames_until_done(scheduler) == 3);
    REQUIRE(polls == 3);
}

TEST_CASE("tween reports progress once per frame", "[thread][tasks]") {
    std::vector<double> progress;
    Scheduler scheduler(tween(4, [&](double t) { progress.push_back(t); }));

    REQUIRE(frames_until_done(scheduler) == 5);
    REQUIRE(progress.size() == 5);
    REQUIRE_THAT(progress[0], WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(progress[2], WithinAbs(0.5, 1e-12));
    REQUIRE_THAT(progress[4], WithinAbs(1.0, 1e-12));
}

TEST_CASE("sequence hands over without losing a frame", "[thread][tasks]") {
    std::vector<int> order;
    Scheduler scheduler(sequence({
        run([&]() { order.push_back(1); }),
        wait_for(2),
        run([&]() { order.push_back(2); }),
    }));

    REQUIRE_FALSE(scheduler.next().done);
    REQUIRE(order == std::vector<int>{1});

    REQUIRE(frames_until_done(scheduler) == 2);
    REQUIRE(order == std::vector<int>{1, 2});
}

TEST_CASE("sequence cancels remaining children", "[thread][tasks]") {
    TaskPtr first = wait_for(3);
    TaskPtr second = wait_for(3);
    TaskPtr seq = sequence({first, second});

    seq->step();
    seq->cancel();

    REQUIRE(seq->is_cancelled());
    REQUIRE(first->is_cancelled());
    REQUIRE(second->is_cancelled());
}

TEST_CASE("all waits for every child", "[thread][tasks]") {
    TaskPtr short_task = wait_for(1);
    TaskPtr long_task = wait_for(3);
    Scheduler scheduler(all({short_task, long_task}));

    for (int i = 0; i < 4; ++i) {
        REQUIRE_FALSE(scheduler.next().done);
    }
    REQUIRE(short_task->is_finished());
    REQUIRE(long_task->is_finished());
    REQUIRE(scheduler.next().done);
}

TEST_CASE("all with no children completes immediately", "[thread][tasks]") {
    Scheduler scheduler(all({}));
    REQUIRE(scheduler.next().done);
}

TEST_CASE("Finished tasks report completion again", "[thread][tasks]") {
    int runs = 0;
    TaskPtr task = run([&]() { runs++; });

    REQUIRE(task->step().done);
    REQUIRE(task->step().done);
    REQUIRE(runs == 1);
    REQUIRE_FALSE(task->is_cancelled());
}
