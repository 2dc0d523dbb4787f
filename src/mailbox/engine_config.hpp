#pragma once

#include <vector>

#include <raylib.h>

namespace mailbox {

/**
 * @brief Initial strength and colour given to bricks of one intensity level
 */
struct LevelStyle {
    int strength;
    Color color;
};

/**
 * @brief Complete set of tuning values consumed by the engine
 *
 * Plain value type: copied into the simulation at construction and never
 * mutated afterwards. Distances are pixels, speeds are pixels per frame,
 * angles are degrees.
 */
struct EngineConfigSnapshot {
    // grid geometry
    int columns = 52;
    int rows = 7;
    float cell_size = 14.f;
    float cell_spacing = 3.f;
    float margin_top = 50.f;
    float margin_bottom = 120.f;
    float margin_left = 50.f;
    float margin_right = 50.f;

    // ball
    float ball_radius = 4.f;
    float ball_speed = 3.f;
    float ball_start_column = 26.f;
    float ball_start_row = 9.f;
    float launch_angle_deg = 15.f; // from vertical, positive leans right

    // paddle
    float paddle_width = 60.f;
    float paddle_height = 10.f;
    float paddle_speed = 5.f;
    float paddle_row = 10.f;
    float max_bounce_angle_deg = 60.f;
    float settle_epsilon = 0.1f;

    // bottom backstop sits this far above the image bottom
    float bottom_wall_inset = 10.f;

    // indexed by level; entry 0 is "no brick"
    std::vector<LevelStyle> levels;

    struct Explosion {
        int lifetime = 10;
        int particles = 12;
        float max_radius = 15.f;
        unsigned int seed = 0x5eed;
    } explosion;

    struct Timing {
        int frame_duration_ms = 25;
        int end_pause_frames = 60;
        int min_frames = 1;
    } timing;

    struct Watchdogs {
        int stuck_frame_limit = 500;
        int max_frames = 5000;
        int force_completion_frames = 100;
    } watchdogs;
};

/**
 * @brief Rejects out-of-range configuration
 * @param cfg Configuration to check
 * @throws gridbreak::ConfigError naming the first offending value
 */
void validate(const EngineConfigSnapshot &cfg);

/**
 * @brief Image size implied by the grid geometry and margins
 */
float image_width(const EngineConfigSnapshot &cfg) noexcept;
float image_height(const EngineConfigSnapshot &cfg) noexcept;

} // namespace mailbox
