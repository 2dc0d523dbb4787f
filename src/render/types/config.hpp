#pragma once

#include <string>

#include <raylib.h>

/**
 * @brief Palette and decoration settings for frame rendering
 */
struct RenderConfig {
    // palette
    Color background_color = {13, 17, 23, 255};
    Color grid_color = {22, 27, 34, 255}; // empty cell squares
    Color paddle_color = {201, 209, 217, 255};
    Color ball_color = {255, 223, 0, 255};
    Color explosion_color = {255, 100, 100, 255};
    Color flash_color = {255, 255, 255, 255};

    // shapes
    float paddle_corner_radius = 3.f;
    float particle_size = 3.f;
    float flash_size = 5.f;

    // damaged bricks keep at least this share of their colour
    float damaged_floor = 0.7f;

    // watermark, bottom-right; empty text disables it
    std::string watermark;
    int watermark_font_size = 10;
    int watermark_margin = 10;
    Color watermark_color = {150, 150, 150, 255};
    Color watermark_shadow = {0, 0, 0, 255};
};
