#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <vector>

#include "simulation/collision.hpp"
#include "simulation/geometry.hpp"
#include "utility/default_config.hpp"

using Catch::Approx;

namespace {
const Rectangle FIELD{50.f, 50.f, 400.f, 300.f};

Paddle make_paddle() {
    // centre 200, top 300, spans 170..230
    return Paddle(200.f, 300.f, 60.f, 10.f, 5.f, 60.f, 3.f, 0.1f);
}
} // namespace

TEST_CASE("Wall collisions", "[collision][walls]") {
    SECTION("Left wall penetration is pushed out and reflected") {
        Ball ball{49.f, 200.f, -2.f, 0.f, 4.f};
        const auto hit = collision::resolve_walls(ball, FIELD);
        REQUIRE(hit.horizontal);
        REQUIRE_FALSE(hit.vertical);
        REQUIRE(ball.x == Approx(54.f));
        REQUIRE(ball.vx == Approx(2.f));
    }

    SECTION("Right wall") {
        Ball ball{449.f, 200.f, 1.5f, -1.f, 4.f};
        const auto hit = collision::resolve_walls(ball, FIELD);
        REQUIRE(hit.horizontal);
        REQUIRE(ball.x == Approx(446.f));
        REQUIRE(ball.vx == Approx(-1.5f));
        REQUIRE(ball.vy == Approx(-1.f));
    }

    SECTION("Top wall") {
        Ball ball{200.f, 52.f, 1.f, -3.f, 4.f};
        const auto hit = collision::resolve_walls(ball, FIELD);
        REQUIRE(hit.vertical);
        REQUIRE(ball.y == Approx(54.f));
        REQUIRE(ball.vy == Approx(3.f));
    }

    SECTION("Bottom backstop reflects upward") {
        Ball ball{200.f, 349.f, 0.5f, 3.f, 4.f};
        const auto hit = collision::resolve_walls(ball, FIELD);
        REQUIRE(hit.vertical);
        REQUIRE(ball.y == Approx(346.f));
        REQUIRE(ball.vy == Approx(-3.f));
    }

    SECTION("Corner hit reflects both axes") {
        Ball ball{51.f, 51.f, -2.f, -2.f, 4.f};
        const auto hit = collision::resolve_walls(ball, FIELD);
        REQUIRE(hit.horizontal);
        REQUIRE(hit.vertical);
        REQUIRE(ball.vx == Approx(2.f));
        REQUIRE(ball.vy == Approx(2.f));
    }

    SECTION("Ball already moving away keeps its direction") {
        Ball ball{52.f, 200.f, 2.f, 0.f, 4.f};
        collision::resolve_walls(ball, FIELD);
        REQUIRE(ball.vx == Approx(2.f));
        REQUIRE(ball.x == Approx(54.f));
    }

    SECTION("Interior ball is untouched") {
        Ball ball{200.f, 200.f, 1.f, 1.f, 4.f};
        const auto hit = collision::resolve_walls(ball, FIELD);
        REQUIRE_FALSE(hit.any());
        REQUIRE(ball.x == 200.f);
        REQUIRE(ball.y == 200.f);
    }

    SECTION("Speed is preserved") {
        Ball ball{49.f, 51.f, -1.2f, -2.7f, 4.f};
        const float before = ball.speed();
        collision::resolve_walls(ball, FIELD);
        REQUIRE(ball.speed() == Approx(before));
    }
}

TEST_CASE("Paddle collisions", "[collision][paddle]") {
    const Paddle paddle = make_paddle();

    SECTION("Falling ball touching the top bounces upward") {
        Ball ball{210.f, 297.f, 1.f, 2.8f, 4.f};
        REQUIRE(collision::resolve_paddle(ball, paddle));
        REQUIRE(ball.vy < 0.f);
        REQUIRE(ball.vx > 0.f);
        REQUIRE(ball.y == Approx(296.f));
        REQUIRE(ball.speed() == Approx(3.f));
    }

    SECTION("Rising ball passes through") {
        Ball ball{200.f, 302.f, 0.f, -3.f, 4.f};
        REQUIRE_FALSE(collision::resolve_paddle(ball, paddle));
        REQUIRE(ball.vy == Approx(-3.f));
    }

    SECTION("Ball beside the paddle is ignored") {
        Ball ball{240.f, 300.f, 0.f, 3.f, 4.f};
        REQUIRE_FALSE(collision::resolve_paddle(ball, paddle));
    }

    SECTION("Ball above the paddle is ignored") {
        Ball ball{200.f, 290.f, 0.f, 3.f, 4.f};
        REQUIRE_FALSE(collision::resolve_paddle(ball, paddle));
    }

    SECTION("Ball below the paddle is ignored") {
        Ball ball{200.f, 320.f, 0.f, 3.f, 4.f};
        REQUIRE_FALSE(collision::resolve_paddle(ball, paddle));
    }

    SECTION("Edge overlap still counts") {
        Ball ball{233.f, 299.f, 0.f, 3.f, 4.f};
        REQUIRE(collision::resolve_paddle(ball, paddle));
        REQUIRE(ball.vx > 0.f);
    }
}

TEST_CASE("Brick collisions", "[collision][bricks]") {
    const auto cfg = gridbreak::utility::create_default_config(3, 2);
    const GridGeometry geometry(cfg);
    const Color c{14, 68, 41, 255};
    std::vector<Brick> bricks{{0, 0, 1, c, 1, 1},
                              {1, 0, 1, c, 1, 1},
                              {2, 1, 1, c, 1, 1}};

    // cell (1, 0) spans x 67..81, y 50..64, centre (74, 57)
    SECTION("Hit from below flips vy only") {
        Ball ball{74.f, 67.f, 0.8f, -2.9f, 4.f};
        const float speed = ball.speed();
        const auto hit = collision::resolve_bricks(ball, bricks, geometry);
        REQUIRE(hit == 1);
        REQUIRE(ball.vx == Approx(0.8f));
        REQUIRE(ball.vy == Approx(2.9f));
        REQUIRE(ball.speed() == Approx(speed));
    }

    SECTION("Hit from the side flips vx only") {
        // cell (2, 1) spans x 84..98, y 67..81, centre (91, 74)
        Ball ball{101.f, 74.f, -2.f, 0.5f, 4.f};
        const auto hit = collision::resolve_bricks(ball, bricks, geometry);
        REQUIRE(hit == 2);
        REQUIRE(ball.vx == Approx(2.f));
        REQUIRE(ball.vy == Approx(0.5f));
    }

    SECTION("First brick in collection order wins") {
        // straddles cells (0, 0) and (1, 0)
        Ball ball{65.5f, 60.f, 0.f, -3.f, 4.f};
        const auto hit = collision::resolve_bricks(ball, bricks, geometry);
        REQUIRE(hit == 0);
    }

    SECTION("Destroyed bricks are skipped") {
        bricks[0].take_damage();
        Ball ball{65.5f, 60.f, 0.f, -3.f, 4.f};
        const auto hit = collision::resolve_bricks(ball, bricks, geometry);
        REQUIRE(hit == 1);
    }

    SECTION("No overlap, no change") {
        Ball ball{150.f, 150.f, 1.f, -1.f, 4.f};
        REQUIRE_FALSE(collision::resolve_bricks(ball, bricks, geometry));
        REQUIRE(ball.vx == 1.f);
        REQUIRE(ball.vy == -1.f);
    }

    SECTION("The resolver never damages") {
        Ball ball{74.f, 67.f, 0.f, -3.f, 4.f};
        collision::resolve_bricks(ball, bricks, geometry);
        REQUIRE(bricks[1].strength() == 1);
        REQUIRE_FALSE(bricks[1].is_destroyed());
    }
}

TEST_CASE("Hit axis", "[collision][bricks]") {
    const Rectangle brick{0.f, 0.f, 20.f, 10.f};

    REQUIRE(collision::hit_axis({25.f, 5.f, 0.f, 0.f, 1.f}, brick) ==
            collision::HitAxis::Horizontal);
    REQUIRE(collision::hit_axis({10.f, 13.f, 0.f, 0.f, 1.f}, brick) ==
            collision::HitAxis::Vertical);
    // |dx/hw| == |dy/hh| counts as vertical
    REQUIRE(collision::hit_axis({20.f, 10.f, 0.f, 0.f, 1.f}, brick) ==
            collision::HitAxis::Vertical);
}
