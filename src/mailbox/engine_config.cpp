#include "engine_config.hpp"

#include <fmt/format.h>

#include "../utility/exceptions.hpp"

namespace mailbox {

namespace {

void require(bool ok, const std::string &message) {
    if (!ok) {
        throw gridbreak::ConfigError(message);
    }
}

} // namespace

void validate(const EngineConfigSnapshot &cfg) {
    require(cfg.columns > 0 && cfg.rows > 0,
            fmt::format("Invalid grid dimensions: {}x{}", cfg.columns,
                        cfg.rows));
    require(cfg.cell_size > 0.f,
            fmt::format("Invalid cell size: {}", cfg.cell_size));
    require(cfg.cell_spacing >= 0.f,
            fmt::format("Invalid cell spacing: {}", cfg.cell_spacing));
    require(cfg.margin_top >= 0.f && cfg.margin_bottom >= 0.f &&
                cfg.margin_left >= 0.f && cfg.margin_right >= 0.f,
            fmt::format("Invalid margins: top={} bottom={} left={} right={}",
                        cfg.margin_top, cfg.margin_bottom, cfg.margin_left,
                        cfg.margin_right));

    require(cfg.ball_radius > 0.f,
            fmt::format("Invalid ball radius: {}", cfg.ball_radius));
    require(cfg.ball_speed > 0.f,
            fmt::format("Invalid ball speed: {}", cfg.ball_speed));

    require(cfg.paddle_width > 0.f && cfg.paddle_height > 0.f,
            fmt::format("Invalid paddle size: {}x{}", cfg.paddle_width,
                        cfg.paddle_height));
    require(cfg.paddle_speed > 0.f,
            fmt::format("Invalid paddle speed: {}", cfg.paddle_speed));
    require(cfg.max_bounce_angle_deg > 0.f && cfg.max_bounce_angle_deg < 90.f,
            fmt::format("Invalid max bounce angle: {}",
                        cfg.max_bounce_angle_deg));
    require(cfg.settle_epsilon > 0.f,
            fmt::format("Invalid settle epsilon: {}", cfg.settle_epsilon));
    require(cfg.bottom_wall_inset >= 0.f,
            fmt::format("Invalid bottom wall inset: {}",
                        cfg.bottom_wall_inset));

    require(!cfg.levels.empty(), "Level table is empty");
    require(cfg.levels[0].strength == 0,
            fmt::format("Level 0 must have strength 0, got {}",
                        cfg.levels[0].strength));
    for (size_t level = 1; level < cfg.levels.size(); ++level) {
        require(cfg.levels[level].strength >= 1,
                fmt::format("Invalid strength {} for level {}",
                            cfg.levels[level].strength, level));
    }

    require(cfg.explosion.lifetime > 0,
            fmt::format("Invalid explosion lifetime: {}",
                        cfg.explosion.lifetime));
    require(cfg.explosion.particles >= 0,
            fmt::format("Invalid explosion particle count: {}",
                        cfg.explosion.particles));

    require(cfg.timing.frame_duration_ms > 0,
            fmt::format("Invalid frame duration: {} ms",
                        cfg.timing.frame_duration_ms));
    require(cfg.timing.end_pause_frames >= 0 && cfg.timing.min_frames >= 0,
            fmt::format("Invalid pause/minimum frames: {}/{}",
                        cfg.timing.end_pause_frames, cfg.timing.min_frames));

    require(cfg.watchdogs.stuck_frame_limit > 0,
            fmt::format("Invalid stuck frame limit: {}",
                        cfg.watchdogs.stuck_frame_limit));
    require(cfg.watchdogs.max_frames > 0,
            fmt::format("Invalid max frames: {}", cfg.watchdogs.max_frames));
    require(cfg.watchdogs.force_completion_frames >= 0,
            fmt::format("Invalid force completion frames: {}",
                        cfg.watchdogs.force_completion_frames));
}

float image_width(const EngineConfigSnapshot &cfg) noexcept {
    return cfg.margin_left + cfg.columns * (cfg.cell_size + cfg.cell_spacing) +
           cfg.margin_right;
}

float image_height(const EngineConfigSnapshot &cfg) noexcept {
    return cfg.margin_top + cfg.rows * (cfg.cell_size + cfg.cell_spacing) +
           cfg.margin_bottom;
}

} // namespace mailbox
