#include "collision.hpp"

#include <cmath>

namespace collision {

WallHit resolve_walls(Ball &ball, const Rectangle &playfield) noexcept {
    WallHit hit;
    const float left = playfield.x;
    const float top = playfield.y;
    const float right = playfield.x + playfield.width;
    const float bottom = playfield.y + playfield.height;

    if (ball.x - ball.radius <= left) {
        ball.x = left + ball.radius;
        ball.vx = std::abs(ball.vx);
        hit.horizontal = true;
    }
    if (ball.x + ball.radius >= right) {
        ball.x = right - ball.radius;
        ball.vx = -std::abs(ball.vx);
        hit.horizontal = true;
    }
    if (ball.y - ball.radius <= top) {
        ball.y = top + ball.radius;
        ball.vy = std::abs(ball.vy);
        hit.vertical = true;
    }
    // backstop
    if (ball.y + ball.radius >= bottom) {
        ball.y = bottom - ball.radius;
        ball.vy = -std::abs(ball.vy);
        hit.vertical = true;
    }

    return hit;
}

bool resolve_paddle(Ball &ball, const Paddle &paddle) noexcept {
    if (ball.vy <= 0.f) {
        return false;
    }

    const Rectangle pb = paddle.bounds();
    const float paddle_left = pb.x;
    const float paddle_right = pb.x + pb.width;
    const float paddle_top = pb.y;
    const float paddle_bottom = pb.y + pb.height;

    const float ball_left = ball.x - ball.radius;
    const float ball_right = ball.x + ball.radius;
    const float ball_top = ball.y - ball.radius;
    const float ball_bottom = ball.y + ball.radius;

    if (ball_right < paddle_left || ball_left > paddle_right) {
        return false;
    }
    if (ball_bottom < paddle_top || ball_top >= paddle_bottom) {
        return false;
    }

    const Vector2 v = paddle.bounce_velocity(ball.x);
    ball.vx = v.x;
    ball.vy = v.y;
    ball.y = paddle_top - ball.radius;
    return true;
}

HitAxis hit_axis(const Ball &ball, const Rectangle &brick) noexcept {
    const float half_width = brick.width * 0.5f;
    const float half_height = brick.height * 0.5f;
    const float dx = ball.x - (brick.x + half_width);
    const float dy = ball.y - (brick.y + half_height);

    if (std::abs(dx / half_width) > std::abs(dy / half_height)) {
        return HitAxis::Horizontal;
    }
    return HitAxis::Vertical;
}

std::optional<int> resolve_bricks(Ball &ball, const std::vector<Brick> &bricks,
                                  const GridGeometry &geometry) noexcept {
    const float ball_left = ball.x - ball.radius;
    const float ball_right = ball.x + ball.radius;
    const float ball_top = ball.y - ball.radius;
    const float ball_bottom = ball.y + ball.radius;

    for (int i = 0; i < (int)bricks.size(); ++i) {
        const Brick &brick = bricks[i];
        if (brick.is_destroyed()) {
            continue;
        }

        const Rectangle r = geometry.cell_rect(brick.col(), brick.row());
        if (ball_right < r.x || ball_left > r.x + r.width ||
            ball_bottom < r.y || ball_top > r.y + r.height) {
            continue;
        }

        if (hit_axis(ball, r) == HitAxis::Horizontal) {
            ball.vx = -ball.vx;
        } else {
            ball.vy = -ball.vy;
        }
        return i;
    }

    return std::nullopt;
}

} // namespace collision
