#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <numbers>
#include <random>

#include "simulation/entities.hpp"
#include "utility/exceptions.hpp"

using Catch::Approx;

namespace {
Paddle make_paddle(float x = 100.f, float speed = 5.f) {
    return Paddle(x, 200.f, 60.f, 10.f, speed, 60.f, 3.f, 0.1f);
}
} // namespace

TEST_CASE("Ball moves by its velocity", "[entities]") {
    Ball ball{10.f, 20.f, 1.5f, -2.f, 4.f};
    ball.step();
    REQUIRE(ball.x == Approx(11.5f));
    REQUIRE(ball.y == Approx(18.f));
    REQUIRE(ball.speed() == Approx(2.5f));

    const Rectangle b = ball.bounds();
    REQUIRE(b.x == Approx(7.5f));
    REQUIRE(b.y == Approx(14.f));
    REQUIRE(b.width == Approx(8.f));
    REQUIRE(b.height == Approx(8.f));
}

TEST_CASE("Paddle movement", "[entities][paddle]") {
    SECTION("Snaps onto a target within reach") {
        Paddle paddle = make_paddle(100.f, 5.f);
        paddle.set_target(103.f);
        REQUIRE(paddle.x() == 100.f); // setting a target does not move
        paddle.step();
        REQUIRE(paddle.x() == 103.f);
        REQUIRE(paddle.is_stationary());
    }

    SECTION("Moves at most speed per step and never overshoots") {
        Paddle paddle = make_paddle(100.f, 5.f);
        paddle.set_target(112.f);

        paddle.step();
        REQUIRE(paddle.x() == Approx(105.f));
        REQUIRE_FALSE(paddle.is_stationary());
        paddle.step();
        REQUIRE(paddle.x() == Approx(110.f));
        paddle.step();
        REQUIRE(paddle.x() == 112.f);
        paddle.step();
        REQUIRE(paddle.x() == 112.f);
    }

    SECTION("Moves left too") {
        Paddle paddle = make_paddle(100.f, 5.f);
        paddle.set_target(91.f);
        paddle.step();
        REQUIRE(paddle.x() == Approx(95.f));
        paddle.step();
        REQUIRE(paddle.x() == 91.f);
    }

    SECTION("Starts settled on its own position") {
        Paddle paddle = make_paddle();
        REQUIRE(paddle.is_stationary());
        REQUIRE(paddle.target() == paddle.x());
    }

    SECTION("Bounds are centred on x with y as the top edge") {
        Paddle paddle = make_paddle(100.f);
        const Rectangle b = paddle.bounds();
        REQUIRE(b.x == Approx(70.f));
        REQUIRE(b.y == Approx(200.f));
        REQUIRE(b.width == Approx(60.f));
        REQUIRE(b.height == Approx(10.f));
    }
}

TEST_CASE("Paddle rejects invalid parameters", "[entities][paddle]") {
    REQUIRE_THROWS_AS(Paddle(0.f, 0.f, 0.f, 10.f, 5.f, 60.f, 3.f, 0.1f),
                      gridbreak::ConfigError);
    REQUIRE_THROWS_AS(Paddle(0.f, 0.f, 60.f, -1.f, 5.f, 60.f, 3.f, 0.1f),
                      gridbreak::ConfigError);
    REQUIRE_THROWS_AS(Paddle(0.f, 0.f, 60.f, 10.f, 0.f, 60.f, 3.f, 0.1f),
                      gridbreak::ConfigError);
    REQUIRE_THROWS_AS(Paddle(0.f, 0.f, 60.f, 10.f, 5.f, 60.f, -3.f, 0.1f),
                      gridbreak::ConfigError);
}

TEST_CASE("Paddle bounce velocity", "[entities][paddle]") {
    const Paddle paddle = make_paddle(100.f);

    SECTION("Centre hit goes straight up") {
        const Vector2 v = paddle.bounce_velocity(100.f);
        REQUIRE(v.x == Approx(0.f).margin(1e-5));
        REQUIRE(v.y == Approx(-3.f));
    }

    SECTION("Edge hit uses the maximum angle") {
        const float rad = 60.f * std::numbers::pi_v<float> / 180.f;
        const Vector2 right = paddle.bounce_velocity(130.f);
        REQUIRE(right.x == Approx(3.f * std::sin(rad)));
        REQUIRE(right.y == Approx(-3.f * std::cos(rad)));

        const Vector2 left = paddle.bounce_velocity(70.f);
        REQUIRE(left.x == Approx(-3.f * std::sin(rad)));
    }

    SECTION("Hits beyond the edge are clamped") {
        const Vector2 edge = paddle.bounce_velocity(130.f);
        const Vector2 beyond = paddle.bounce_velocity(400.f);
        REQUIRE(beyond.x == Approx(edge.x));
        REQUIRE(beyond.y == Approx(edge.y));
    }

    SECTION("Always upward at the configured speed") {
        for (float x = 50.f; x <= 150.f; x += 7.f) {
            const Vector2 v = paddle.bounce_velocity(x);
            REQUIRE(v.y < 0.f);
            REQUIRE(std::hypot(v.x, v.y) == Approx(3.f));
        }
    }
}

TEST_CASE("Brick damage", "[entities][brick]") {
    Brick brick(2, 3, 3, Color{0, 109, 50, 255}, 3, 12);
    REQUIRE(brick.col() == 2);
    REQUIRE(brick.row() == 3);
    REQUIRE(brick.max_strength() == 3);
    REQUIRE(brick.strength_ratio() == Approx(1.f));

    REQUIRE_FALSE(brick.take_damage());
    REQUIRE(brick.strength() == 2);
    REQUIRE(brick.strength_ratio() == Approx(2.f / 3.f));

    SECTION("Non-positive damage is ignored") {
        REQUIRE_FALSE(brick.take_damage(0));
        REQUIRE_FALSE(brick.take_damage(-2));
        REQUIRE(brick.strength() == 2);
    }

    SECTION("Only the destroying hit reports true") {
        REQUIRE_FALSE(brick.take_damage());
        REQUIRE(brick.take_damage());
        REQUIRE(brick.is_destroyed());
        REQUIRE(brick.strength_ratio() == Approx(0.f));

        REQUIRE_FALSE(brick.take_damage());
        REQUIRE(brick.is_destroyed());
        REQUIRE(brick.strength() == 0);
    }

    SECTION("Overkill destroys in one hit") {
        REQUIRE(brick.take_damage(10));
        REQUIRE(brick.is_destroyed());
        REQUIRE(brick.strength_ratio() == Approx(0.f));
    }
}

TEST_CASE("Explosion lifetime and particles", "[entities][explosion]") {
    std::mt19937 rng(42);
    Explosion e = Explosion::spawn({10.f, 20.f}, 4, 15.f, 8, rng);

    REQUIRE(e.particles().size() == 8);
    REQUIRE(e.center().x == 10.f);
    REQUIRE(e.center().y == 20.f);
    for (size_t i = 0; i < e.particles().size(); ++i) {
        const auto &p = e.particles()[i];
        REQUIRE(p.angle == Approx(i / 8.f * 2.f * std::numbers::pi_v<float>));
        REQUIRE(p.speed >= 0.5f);
        REQUIRE(p.speed <= 1.5f);
        REQUIRE(p.brightness >= 0.7f);
        REQUIRE(p.brightness <= 1.0f);
    }

    REQUIRE(e.elapsed() == 0);
    REQUIRE_FALSE(e.is_finished());
    for (int i = 1; i < 4; ++i) {
        e.step();
        REQUIRE(e.elapsed() == i);
        REQUIRE(e.progress() == Approx(i / 4.f));
        REQUIRE_FALSE(e.is_finished());
    }
    e.step();
    REQUIRE(e.is_finished());
    REQUIRE(e.progress() == Approx(1.f));
}

TEST_CASE("Explosion spawn is reproducible for a seed", "[entities][explosion]") {
    std::mt19937 a(7);
    std::mt19937 b(7);
    const Explosion ea = Explosion::spawn({0.f, 0.f}, 10, 15.f, 12, a);
    const Explosion eb = Explosion::spawn({0.f, 0.f}, 10, 15.f, 12, b);

    for (size_t i = 0; i < ea.particles().size(); ++i) {
        REQUIRE(ea.particles()[i].speed == eb.particles()[i].speed);
        REQUIRE(ea.particles()[i].brightness == eb.particles()[i].brightness);
    }
}
