#include "simulation.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <utility>

#include <fmt/format.h>

namespace {

mailbox::EngineConfigSnapshot validated(mailbox::EngineConfigSnapshot cfg) {
    mailbox::validate(cfg);
    return cfg;
}

Ball make_ball(const mailbox::EngineConfigSnapshot &cfg,
               const GridGeometry &geometry) {
    const Vector2 start =
        geometry.grid_to_pixel(cfg.ball_start_column, cfg.ball_start_row);
    const float angle =
        cfg.launch_angle_deg * std::numbers::pi_v<float> / 180.f;

    Ball ball;
    ball.x = start.x;
    ball.y = start.y;
    ball.vx = cfg.ball_speed * std::sin(angle);
    ball.vy = -std::abs(cfg.ball_speed * std::cos(angle));
    ball.radius = cfg.ball_radius;
    return ball;
}

Paddle make_paddle(const mailbox::EngineConfigSnapshot &cfg,
                   const GridGeometry &geometry) {
    const Vector2 start =
        geometry.grid_to_pixel(cfg.columns / 2.f, cfg.paddle_row);
    return Paddle(start.x, start.y, cfg.paddle_width, cfg.paddle_height,
                  cfg.paddle_speed, cfg.max_bounce_angle_deg, cfg.ball_speed,
                  cfg.settle_epsilon);
}

} // namespace

Simulation::Simulation(const mailbox::IntensityGrid &grid,
                       mailbox::EngineConfigSnapshot cfg)
    : m_cfg(validated(std::move(cfg))), m_geometry(m_cfg),
      m_playfield(m_geometry.playfield(m_cfg.bottom_wall_inset)),
      m_ball(make_ball(m_cfg, m_geometry)),
      m_paddle(make_paddle(m_cfg, m_geometry)), m_rng(m_cfg.explosion.seed) {
    if (grid.columns() != m_cfg.columns || grid.rows() != m_cfg.rows) {
        throw gridbreak::ConfigError(fmt::format(
            "Grid is {}x{} but the configuration expects {}x{}",
            grid.columns(), grid.rows(), m_cfg.columns, m_cfg.rows));
    }

    build_bricks(grid);

    LOG_INFO("Simulation ready: {} bricks on a {}x{} grid ({}x{} px)",
             m_bricks.size(), m_cfg.columns, m_cfg.rows,
             m_geometry.image_width(), m_geometry.image_height());
}

void Simulation::build_bricks(const mailbox::IntensityGrid &grid) {
    m_bricks.clear();
    m_bricks.reserve(grid.occupied_cells());

    for (int col = 0; col < grid.columns(); ++col) {
        for (int row = 0; row < grid.rows(); ++row) {
            const auto &cell = grid.cell(col, row);
            if (cell.level == 0) {
                continue;
            }
            if (cell.level >= (int)m_cfg.levels.size()) {
                throw gridbreak::ConfigError(fmt::format(
                    "Cell ({}, {}) has level {} but the level table stops at {}",
                    col, row, cell.level, m_cfg.levels.size() - 1));
            }

            const auto &style = m_cfg.levels[cell.level];
            m_bricks.emplace_back(col, row, style.strength, style.color,
                                  cell.level, cell.count);
        }
    }
}

mailbox::StepEvents Simulation::step() {
    mailbox::StepEvents events;

    m_paddle.step();
    m_ball.step();

    events.wall_hit = collision::resolve_walls(m_ball, m_playfield).any();
    events.paddle_hit = collision::resolve_paddle(m_ball, m_paddle);
    events.brick_hit = collision::resolve_bricks(m_ball, m_bricks, m_geometry);

    if (events.brick_hit) {
        Brick &brick = m_bricks[*events.brick_hit];
        if (brick.take_damage()) {
            events.brick_destroyed = true;
            ++m_destroyed_count;
            m_explosions.push_back(Explosion::spawn(
                m_geometry.grid_to_pixel((float)brick.col(), (float)brick.row()),
                m_cfg.explosion.lifetime, m_cfg.explosion.max_radius,
                m_cfg.explosion.particles, m_rng));

            LOG_DEBUG("Frame {}: brick ({}, {}) destroyed, {}/{} cleared",
                      m_frame_count, brick.col(), brick.row(),
                      m_destroyed_count, m_bricks.size());
        }
    }

    step_explosions();
    ++m_frame_count;

    return events;
}

void Simulation::step_explosions() {
    for (auto &explosion : m_explosions) {
        explosion.step();
    }
    std::erase_if(m_explosions,
                  [](const Explosion &e) { return e.is_finished(); });
}

bool Simulation::is_complete() const noexcept {
    return std::all_of(m_bricks.begin(), m_bricks.end(),
                       [](const Brick &b) { return b.is_destroyed(); });
}

int Simulation::active_bricks_in_column(int col) const noexcept {
    return (int)std::ranges::count_if(
        active_bricks(), [col](const Brick &b) { return b.col() == col; });
}

const Brick &Simulation::brick(int index) const {
    if (index < 0 || index >= (int)m_bricks.size()) {
        throw gridbreak::SimulationError(fmt::format(
            "Brick index {} out of range [0, {})", index, m_bricks.size()));
    }
    return m_bricks[index];
}

mailbox::FrameSnapshot
Simulation::snapshot(const mailbox::StepEvents &events) const {
    mailbox::FrameSnapshot snap;
    snap.frame_index = m_frame_count;
    snap.layout = m_geometry.layout();
    snap.ball = {{m_ball.x, m_ball.y}, m_ball.radius};
    snap.paddle = {m_paddle.bounds()};
    snap.events = events;
    snap.total_bricks = (int)m_bricks.size();
    snap.destroyed_bricks = m_destroyed_count;
    snap.complete = is_complete();

    snap.bricks.reserve(m_bricks.size() - m_destroyed_count);
    for (const Brick &brick : active_bricks()) {
        snap.bricks.push_back({brick.col(), brick.row(),
                               m_geometry.cell_rect(brick.col(), brick.row()),
                               brick.color(), brick.strength(),
                               brick.max_strength(), brick.strength_ratio()});
    }

    snap.explosions.reserve(m_explosions.size());
    for (const Explosion &explosion : m_explosions) {
        mailbox::ExplosionView view;
        view.center = explosion.center();
        view.elapsed = explosion.elapsed();
        view.lifetime = explosion.lifetime();
        view.progress = explosion.progress();
        view.max_radius = explosion.max_radius();
        view.particles.reserve(explosion.particles().size());
        for (const auto &p : explosion.particles()) {
            view.particles.push_back({p.angle, p.speed, p.brightness});
        }
        snap.explosions.push_back(std::move(view));
    }

    return snap;
}
