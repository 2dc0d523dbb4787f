#pragma once

#include <vector>

#include <raylib.h>

#include "../mailbox/engine_config.hpp"

namespace gridbreak::utility {

/**
 * @brief Contribution-calendar colour ramp: level 0 is empty, 1..4 get
 * stronger and brighter
 */
inline std::vector<mailbox::LevelStyle> default_levels() {
    return {
        {0, Color{0, 0, 0, 0}},
        {1, Color{14, 68, 41, 255}},
        {2, Color{0, 109, 50, 255}},
        {3, Color{38, 166, 65, 255}},
        {4, Color{57, 211, 83, 255}},
    };
}

/**
 * @brief Creates the default engine configuration for a grid of the given
 * size
 *
 * Paddle sits three rows below the grid, the ball one row above the paddle,
 * both horizontally centred.
 */
inline mailbox::EngineConfigSnapshot create_default_config(int columns = 52,
                                                           int rows = 7) {
    mailbox::EngineConfigSnapshot cfg;
    cfg.columns = columns;
    cfg.rows = rows;
    cfg.paddle_row = static_cast<float>(rows + 3);
    cfg.ball_start_row = cfg.paddle_row - 1.f;
    cfg.ball_start_column = columns / 2.f;
    cfg.levels = default_levels();
    return cfg;
}

} // namespace gridbreak::utility
