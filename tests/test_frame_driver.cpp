#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <vector>

#include "grid_fixtures.hpp"
#include "simulation/frame_driver.hpp"

using Catch::Approx;

TEST_CASE("Empty board still produces a well-formed run", "[driver]") {
    const auto grid = make_grid({{0, 0}, {0, 0}});
    auto cfg = gridbreak::utility::create_default_config(2, 2);
    cfg.timing.end_pause_frames = 3;
    cfg.timing.min_frames = 10;

    Simulation sim(grid, cfg);
    FrameDriver driver(sim, make_policy(PolicyKind::Follow, sim));

    std::vector<long long> indices;
    const RunReport report = driver.run(
        [&](const mailbox::FrameSnapshot &f) { indices.push_back(f.frame_index); });

    REQUIRE(report.frames == 10);
    REQUIRE(indices.size() == 10);
    REQUIRE(report.steps == 0);
    REQUIRE(report.targets == 0);
    REQUIRE(report.complete);
    REQUIRE(report.stop_reason == StopReason::Completed);
    REQUIRE(driver.finished());
    REQUIRE_FALSE(driver.next_frame().has_value());
}

TEST_CASE("Frame sequence shape", "[driver]") {
    const auto grid = make_grid({{0, 0}, {0, 0}});
    auto cfg = gridbreak::utility::create_default_config(2, 2);
    cfg.timing.end_pause_frames = 2;
    cfg.timing.min_frames = 1;

    Simulation sim(grid, cfg);
    FrameDriver driver(sim, make_policy(PolicyKind::Follow, sim));

    // initial frame, then the end pause
    auto first = driver.next_frame();
    REQUIRE(first.has_value());
    REQUIRE(first->frame_index == 0);
    REQUIRE_FALSE(driver.finished());

    REQUIRE(driver.next_frame().has_value());
    REQUIRE(driver.next_frame().has_value());
    REQUIRE_FALSE(driver.next_frame().has_value());
    REQUIRE(driver.report().frames == 3);
}

TEST_CASE("Single brick with the follow policy", "[driver][scenario]") {
    const auto grid = make_grid({{1}});
    auto cfg = single_brick_config();
    cfg.timing.end_pause_frames = 5;

    Simulation sim(grid, cfg);
    FrameDriver driver(sim, make_policy(PolicyKind::Follow, sim));

    std::vector<mailbox::FrameSnapshot> frames;
    const RunReport report = driver.run(
        [&](const mailbox::FrameSnapshot &f) { frames.push_back(f); });

    REQUIRE(report.complete);
    REQUIRE(report.stop_reason == StopReason::Completed);
    REQUIRE(report.steps == 14);
    REQUIRE(report.destroyed_bricks == 1);
    REQUIRE(report.total_bricks == 1);
    REQUIRE(report.frames == 1 + 14 + 5);
    REQUIRE(frames.size() == 20);
    REQUIRE(sim.brick(0).is_destroyed());

    REQUIRE(frames.front().bricks.size() == 1);
    REQUIRE(frames[14].events.brick_destroyed);
    REQUIRE(frames[14].bricks.empty());
    REQUIRE(frames[14].explosions.size() == 1);
    REQUIRE(frames.back().complete);
    // pause frames repeat the final board without stepping
    REQUIRE(frames.back().frame_index == 14);
}

TEST_CASE("Every target advances the simulation", "[driver]") {
    // ball and paddle start at the same x, so the first target is already
    // reached
    const auto grid = make_grid({{1}});
    auto cfg = gridbreak::utility::create_default_config(1, 1);
    cfg.watchdogs.max_frames = 50;
    cfg.timing.end_pause_frames = 0;

    Simulation sim(grid, cfg);
    REQUIRE(sim.ball().x == Approx(sim.paddle().x()));

    FrameDriver driver(sim, make_policy(PolicyKind::Follow, sim));
    const RunReport report = driver.run(nullptr);

    REQUIRE(report.steps > 0);
    REQUIRE(report.steps <= 50);
    REQUIRE(report.targets == report.steps);
    REQUIRE(report.frames == report.steps + 1);
}

TEST_CASE("Frame limit watchdog", "[driver][watchdog]") {
    const auto grid = make_grid({{1}});
    auto cfg = single_brick_config();
    cfg.watchdogs.max_frames = 5;
    cfg.timing.end_pause_frames = 2;

    Simulation sim(grid, cfg);
    FrameDriver driver(sim, make_policy(PolicyKind::Follow, sim));
    const RunReport report = driver.run(nullptr);

    REQUIRE(report.stop_reason == StopReason::FrameLimit);
    REQUIRE(report.steps == 5);
    REQUIRE(sim.frame_count() == 5);
    REQUIRE(report.frames == 1 + 5 + 2);
    REQUIRE_FALSE(report.complete);
    REQUIRE(report.destroyed_bricks == 0);
}

TEST_CASE("Stuck target watchdog", "[driver][watchdog]") {
    // a slow paddle never reaches the ball's x within the limit
    const auto grid = make_grid({{1}});
    auto cfg = single_brick_config();
    cfg.paddle_speed = 0.5f;
    cfg.watchdogs.stuck_frame_limit = 2;
    cfg.timing.end_pause_frames = 0;

    Simulation sim(grid, cfg);
    FrameDriver driver(sim, make_policy(PolicyKind::Follow, sim));
    const RunReport report = driver.run(nullptr);

    REQUIRE(report.complete);
    REQUIRE(report.stop_reason == StopReason::Completed);
    REQUIRE(report.steps == 14);
    REQUIRE(report.targets == 7);
    REQUIRE(report.abandoned_targets == 7);
    REQUIRE_FALSE(sim.paddle_ready());
}

TEST_CASE("Force completion after the policy runs out", "[driver][watchdog]") {
    // the row policy aims once at the only brick, long before the ball
    // gets there
    const auto grid = make_grid({{1}});
    auto cfg = single_brick_config();
    cfg.timing.end_pause_frames = 0;

    SECTION("Board finished within the allowance") {
        cfg.watchdogs.force_completion_frames = 100;
        Simulation sim(grid, cfg);
        FrameDriver driver(sim, make_policy(PolicyKind::RowZigZag, sim));
        const RunReport report = driver.run(nullptr);

        REQUIRE(report.targets == 1);
        REQUIRE(report.steps == 14);
        REQUIRE(report.complete);
        REQUIRE(report.stop_reason == StopReason::Completed);
    }

    SECTION("Allowance exhausted") {
        cfg.watchdogs.force_completion_frames = 5;
        Simulation sim(grid, cfg);
        FrameDriver driver(sim, make_policy(PolicyKind::RowZigZag, sim));
        const RunReport report = driver.run(nullptr);

        // two steps to settle on the target, then five forced
        REQUIRE(report.targets == 1);
        REQUIRE(report.steps == 7);
        REQUIRE_FALSE(report.complete);
        REQUIRE(report.stop_reason == StopReason::PolicyExhausted);
        REQUIRE(report.frames == 8);
    }
}

TEST_CASE("Column sweep clears a column through the driver",
          "[driver][scenario]") {
    const auto grid = make_grid({{1, 1, 1}});
    auto cfg = gridbreak::utility::create_default_config(1, 3);
    cfg.timing.end_pause_frames = 0;

    Simulation sim(grid, cfg);
    FrameDriver driver(sim, make_policy(PolicyKind::ColumnSweep, sim));

    int destroyed_events = 0;
    const RunReport report = driver.run([&](const mailbox::FrameSnapshot &f) {
        if (f.events.brick_destroyed) {
            ++destroyed_events;
        }
    });

    REQUIRE(report.complete);
    REQUIRE(report.stop_reason == StopReason::Completed);
    REQUIRE(report.destroyed_bricks == 3);
    REQUIRE(destroyed_events == 3);
    REQUIRE(report.abandoned_targets == 0);
    REQUIRE(report.duration_seconds() ==
            Approx(report.frames * cfg.timing.frame_duration_ms / 1000.0));
}

TEST_CASE("Stop reason names", "[driver]") {
    REQUIRE(std::string(stop_reason_name(StopReason::Completed)) == "completed");
    REQUIRE(std::string(stop_reason_name(StopReason::PolicyExhausted)) ==
            "policy exhausted");
    REQUIRE(std::string(stop_reason_name(StopReason::FrameLimit)) ==
            "frame limit");
}
