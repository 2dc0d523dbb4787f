#pragma once

#include <optional>
#include <vector>

#include <raylib.h>

namespace mailbox {

/**
 * @brief What happened during one simulation step
 */
struct StepEvents {
    bool wall_hit = false;
    bool paddle_hit = false;
    std::optional<int> brick_hit; // index into the simulation's brick list
    bool brick_destroyed = false;
};

/**
 * @brief Grid placement the renderer needs to draw empty cells
 */
struct GridLayout {
    int columns = 0;
    int rows = 0;
    float cell_size = 0.f;
    float cell_spacing = 0.f;
    float origin_x = 0.f; // left edge of column 0
    float origin_y = 0.f; // top edge of row 0
    float image_width = 0.f;
    float image_height = 0.f;

    /** @brief Pixel rectangle of cell (col, row) */
    Rectangle cell_rect(int col, int row) const noexcept;
};

struct BallView {
    Vector2 center;
    float radius;
};

struct PaddleView {
    Rectangle bounds;
};

struct BrickView {
    int col;
    int row;
    Rectangle rect;
    Color color;
    int strength;
    int max_strength;
    float strength_ratio; // strength / max_strength, in [0, 1]
};

struct ParticleView {
    float angle; // radians
    float speed; // multiplier on the explosion radius
    float brightness;
};

struct ExplosionView {
    Vector2 center;
    int elapsed;
    int lifetime;
    float progress; // elapsed / lifetime
    float max_radius;
    std::vector<ParticleView> particles;
};

/**
 * @brief Immutable picture of every visible entity after one frame
 *
 * Fully self-contained copy, so it can be handed to a renderer (or another
 * thread) after the simulation has moved on.
 */
struct FrameSnapshot {
    long long frame_index = 0; // simulation steps taken so far
    GridLayout layout;
    BallView ball{};
    PaddleView paddle{};
    std::vector<BrickView> bricks; // non-destroyed bricks only
    std::vector<ExplosionView> explosions;
    StepEvents events;
    int total_bricks = 0;
    int destroyed_bricks = 0;
    bool complete = false;

    /**
     * @brief Finds the visible brick at a grid coordinate
     * @return Pointer into bricks, or nullptr if that cell has no live brick
     */
    const BrickView *brick_at(int col, int row) const noexcept;

    /** @brief Sum of remaining strength over visible bricks */
    int remaining_strength() const noexcept;
};

} // namespace mailbox
