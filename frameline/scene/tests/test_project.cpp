#include <catch2/catch_test_macros.hpp>
#include <frameline/scene/project.hpp>
#include <frameline/render/stage.hpp>
#include <frameline/thread/tasks.hpp>
#include <frameline/core/settings.hpp>
#include <filesystem>
#include <memory>

using namespace frameline;
using namespace frameline::scene;
using namespace frameline::thread;

namespace {

SceneRoutine timed_routine(int64_t frames, SceneTransition transition = nullptr) {
    return [frames, transition](Scene& scene, Project&) {
        return sequence({
            scene.transition(transition),
            wait_for(frames),
            run([&scene]() { scene.can_finish(); }),
        });
    };
}

// Plays until the "in" event, then finishes
SceneRoutine event_routine() {
    return [](Scene& scene, Project&) {
        return sequence({
            scene.transition(),
            wait_until(scene, "in"),
            run([&scene]() { scene.can_finish(); }),
        });
    };
}

// Fills the stage with one color
SceneRoutine filled_routine(render::Color color) {
    return [color](Scene& scene, Project&) {
        return sequence({
            run([&scene, color]() {
                scene.add(Node::rect(scene.generate_node_id("rect"), Vec2(4.0f), color));
            }),
            scene.transition(),
            wait_for(1),
            run([&scene]() { scene.can_finish(); }),
        });
    };
}

} // anonymous namespace

TEST_CASE("Project scene lookup", "[scene][project]") {
    Project project("demo");
    Scene& first = project.add_scene("first", timed_routine(1));
    Scene& second = project.add_scene("second", timed_routine(1));

    REQUIRE(project.find_scene("second") == &second);
    REQUIRE(project.find_scene("third") == nullptr);
    REQUIRE(project.get_next_scene(nullptr) == &first);
    REQUIRE(project.get_next_scene(&first) == &second);
    REQUIRE(project.get_next_scene(&second) == nullptr);
    REQUIRE(first.get_storage_key() == "scene-demo-first");
}

TEST_CASE("Project hands over between scenes", "[scene][project]") {
    Project project("demo");
    Scene& first = project.add_scene("first", timed_routine(2));
    Scene& second = project.add_scene("second", timed_routine(3));

    project.reset();
    REQUIRE(project.get_current_scene() == &first);
    REQUIRE(project.get_frame() == 0);

    REQUIRE_FALSE(project.next());
    REQUIRE(project.get_current_scene() == &first);

    REQUIRE_FALSE(project.next());
    REQUIRE(project.get_current_scene() == &second);
    REQUIRE(second.first_frame == 2);
    REQUIRE_FALSE(first.is_visible());
    REQUIRE(project.get_previous_scene() == nullptr);

    REQUIRE_FALSE(project.next());
    REQUIRE_FALSE(project.next());
    REQUIRE(project.next());
    REQUIRE(project.get_frame() == 5);
    REQUIRE(project.is_finished());
}

TEST_CASE("Project keeps the previous scene during a transition", "[scene][project]") {
    Project project("demo");
    Scene& first = project.add_scene("first", timed_routine(1));
    Scene& second = project.add_scene("second", timed_routine(3, [](Scene&, Scene*) {
        return tween(2, nullptr);
    }));

    project.reset();
    project.next();
    REQUIRE(project.get_current_scene() == &second);
    REQUIRE(project.get_previous_scene() == &first);

    project.next();
    REQUIRE(project.get_previous_scene() == &first);

    project.next();
    REQUIRE(second.is_after_transition_in());
    REQUIRE(project.get_previous_scene() == &first);

    project.next();
    REQUIRE(project.get_previous_scene() == nullptr);
}

TEST_CASE("Project recalculation measures every scene", "[scene][project]") {
    Project project("demo");
    Scene& first = project.add_scene("first", timed_routine(2));
    Scene& second = project.add_scene("second", timed_routine(3, [](Scene&, Scene*) {
        return tween(2, nullptr);
    }));

    project.recalculate();

    REQUIRE(first.first_frame == 0);
    REQUIRE(first.duration == 2);
    REQUIRE(first.transition_duration == 0);
    REQUIRE(first.is_marked_as_cached());

    REQUIRE(second.first_frame == 2);
    REQUIRE(second.duration == 5);
    REQUIRE(second.last_frame() == 7);
    REQUIRE(second.transition_duration == 2);
    REQUIRE(second.is_marked_as_cached());

    // Rewound for playback
    REQUIRE(project.get_frame() == 0);
    REQUIRE(project.get_current_scene() == &first);
}

TEST_CASE("Project recalculation follows time events", "[scene][project]") {
    Project project("demo", 30.0);
    Scene& intro = project.add_scene("intro", event_routine());
    Scene& outro = project.add_scene("outro", timed_routine(1));

    project.recalculate();
    REQUIRE(intro.duration == 0);
    REQUIRE(outro.first_frame == 0);

    intro.set_frame_event("in", 1.0);
    REQUIRE_FALSE(intro.is_marked_as_cached());

    project.recalculate();
    REQUIRE(intro.duration == 30);
    REQUIRE(outro.first_frame == 30);

    int frames = 0;
    while (!project.next()) {
        frames++;
        REQUIRE(frames < 100);
    }
    REQUIRE(project.get_frame() == outro.last_frame());
}

TEST_CASE("Project layout retry limit reaches scenes", "[scene][project]") {
    Project project("demo");
    Scene& scene = project.add_scene("intro", timed_routine(1));

    project.set_layout_retry_limit(4);
    REQUIRE(scene.get_layout_retry_limit() == 4);
    REQUIRE(project.add_scene("later", timed_routine(1)).get_layout_retry_limit() == 4);
}

TEST_CASE("Project built from playback settings", "[scene][project]") {
    auto dir = std::filesystem::temp_directory_path() / "frameline_project_test";
    std::filesystem::remove_all(dir);

    core::PlaybackSettings settings;
    settings.project_name = "configured";
    settings.frame_rate = 60.0;
    settings.layout_retry_limit = 2;
    settings.timing_directory = dir.string();

    {
        Project project(settings);
        REQUIRE(project.get_name() == "configured");
        REQUIRE(project.get_clock().frame_rate == 60.0);
        REQUIRE(project.get_layout_retry_limit() == 2);

        Scene& scene = project.add_scene("intro", event_routine());
        project.recalculate();
        scene.set_frame_event("in", 0.5);
        project.recalculate();
        REQUIRE(scene.duration == 30);
    }

    // Timings written by the first project seed the next one
    Project reopened(settings);
    Scene& scene = reopened.add_scene("intro", event_routine());
    reopened.recalculate();
    REQUIRE(scene.duration == 30);

    std::filesystem::remove_all(dir);
}

TEST_CASE("Project renders into a stage", "[scene][project]") {
    const render::Color red(1.0f, 0.0f, 0.0f, 1.0f);
    const render::Color green(0.0f, 1.0f, 0.0f, 1.0f);

    render::Stage stage([] { return false; });
    render::StageSettings settings;
    settings.size = Vec2(4.0f, 4.0f);
    stage.configure(settings);

    Project project("demo");
    project.add_scene("first", filled_routine(red));
    project.add_scene("second", filled_routine(green));

    project.reset();
    project.render(stage);
    REQUIRE(stage.final_buffer().color_at(0, 0) == red);

    project.next();
    project.render(stage);
    REQUIRE(stage.final_buffer().color_at(0, 0) == green);
}

TEST_CASE("Project renders motion blur from node velocity", "[scene][project]") {
    render::Stage stage([] { return true; });
    render::StageSettings settings;
    settings.size = Vec2(4.0f, 1.0f);
    settings.motion_blur = 2;
    stage.configure(settings);

    Project project("demo");
    project.add_scene("moving", [](Scene& scene, Project&) {
        return sequence({
            run([&scene]() {
                Node& box = scene.add(Node::rect("box", Vec2(1.0f), render::Color(1.0f, 1.0f, 1.0f, 1.0f)));
                box.set_velocity(Vec2(2.0f, 0.0f));
            }),
            scene.transition(),
            wait_for(1),
        });
    });

    project.reset();
    project.render(stage);

    const render::Surface& frame = stage.final_buffer();
    REQUIRE(nearly_equal(frame.pixel(0, 0), Vec4(0.5f)));
    REQUIRE(nearly_equal(frame.pixel(1, 0), Vec4(0.5f)));
    REQUIRE(nearly_equal(frame.pixel(2, 0), Vec4(0.0f)));
}
