#pragma once

#include <optional>
#include <vector>

#include <raylib.h>

#include "entities.hpp"
#include "geometry.hpp"

/**
 * Collision resolution between the ball and the rest of the board.
 *
 * Every function mutates the ball in place and reports what it hit. The
 * simulation calls them once per frame in a fixed order: walls, paddle,
 * bricks; later stages see the ball as earlier ones left it.
 */
namespace collision {

struct WallHit {
    bool horizontal = false; // left or right wall
    bool vertical = false;   // top wall or bottom backstop

    inline bool any() const noexcept { return horizontal || vertical; }
};

/** @brief Dominant penetration axis of a ball/brick overlap */
enum class HitAxis { Horizontal, Vertical };

/**
 * @brief Keeps the ball inside the playfield
 *
 * For each edge the ball's box touches or crosses, clamps the ball flush
 * against it and points the matching velocity component back inside. The
 * bottom edge is a backstop that should be unreachable with the paddle in
 * place, but still reflects so the ball can never escape.
 *
 * @param ball Ball to resolve
 * @param playfield Allowed area for the ball's bounding box
 */
WallHit resolve_walls(Ball &ball, const Rectangle &playfield) noexcept;

/**
 * @brief Bounces the ball off the paddle
 *
 * Only a downward-moving ball whose box overlaps the paddle horizontally and
 * whose bottom edge has reached into the paddle's vertical span counts. On a
 * hit the velocity comes from Paddle::bounce_velocity and the ball is moved
 * to sit flush on the paddle top.
 *
 * @return True if the ball bounced
 */
bool resolve_paddle(Ball &ball, const Paddle &paddle) noexcept;

/**
 * @brief Axis along which the ball penetrates a brick
 *
 * Compares |dx / half_width| against |dy / half_height|, with (dx, dy) the
 * ball centre minus the brick centre. Ties count as vertical.
 */
HitAxis hit_axis(const Ball &ball, const Rectangle &brick) noexcept;

/**
 * @brief Bounces the ball off the first overlapping live brick
 *
 * Bricks are scanned in collection order and the first axis-aligned overlap
 * wins, which is not necessarily the brick nearest along the ball's path.
 * At most one brick is resolved per call. Does not damage the brick.
 *
 * @return Index of the brick hit, if any
 */
std::optional<int> resolve_bricks(Ball &ball, const std::vector<Brick> &bricks,
                                  const GridGeometry &geometry) noexcept;

} // namespace collision
