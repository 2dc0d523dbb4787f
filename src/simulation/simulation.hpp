#pragma once

#include <random>
#include <ranges>
#include <vector>

#include "../mailbox/engine_config.hpp"
#include "../mailbox/frame_snapshot.hpp"
#include "../mailbox/intensity_grid.hpp"
#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"
#include "collision.hpp"
#include "entities.hpp"
#include "geometry.hpp"

/**
 * @brief Breakout board built from an intensity grid
 *
 * Owns the ball, the paddle, one brick per non-empty grid cell and the live
 * explosions. The only state transition is step(); everything else is a
 * query or a paddle target update. Completion is derived from brick state on
 * every call, never stored.
 */
class Simulation {
  public:
    /**
     * @brief Builds the board
     * @param grid Source grid; its size must match cfg.columns x cfg.rows
     * @param cfg Engine configuration
     * @throws gridbreak::ConfigError on invalid configuration, a grid of the
     * wrong size, or a cell level missing from the level table
     */
    Simulation(const mailbox::IntensityGrid &grid,
               mailbox::EngineConfigSnapshot cfg);
    ~Simulation() = default;
    Simulation(const Simulation &) = delete;
    Simulation &operator=(const Simulation &) = delete;
    Simulation(Simulation &&) = delete;
    Simulation &operator=(Simulation &&) = delete;

    /**
     * @brief Advances the board by one frame
     *
     * Paddle, then ball, then wall/paddle/brick collisions, then one unit of
     * damage to the brick hit (spawning an explosion if it breaks), then
     * explosion ageing, then the frame counter.
     *
     * @return Events that happened during this frame
     */
    mailbox::StepEvents step();

    /**
     * @brief Sets where the paddle should go; it moves on later steps
     * @param x Target centre x in pixels
     */
    inline void set_paddle_target(float x) noexcept { m_paddle.set_target(x); }

    /**
     * @brief True when the paddle has settled on its target
     */
    inline bool paddle_ready() const noexcept {
        return m_paddle.is_stationary();
    }

    /**
     * @brief True when every brick is destroyed (vacuously true without
     * bricks)
     */
    bool is_complete() const noexcept;

    /**
     * @brief Live view over the bricks not yet destroyed
     *
     * Filters on every iteration, so it always reflects the current board.
     * Must not outlive the simulation.
     */
    inline auto active_bricks() const {
        return m_bricks | std::views::filter([](const Brick &brick) {
                   return !brick.is_destroyed();
               });
    }

    /**
     * @brief Number of active bricks in one grid column
     */
    int active_bricks_in_column(int col) const noexcept;

    /**
     * @brief Copies every visible entity into a renderer-facing snapshot
     * @param events Events to attach (usually the result of the last step)
     */
    mailbox::FrameSnapshot snapshot(const mailbox::StepEvents &events = {}) const;

  public:
    inline const Ball &ball() const noexcept { return m_ball; }
    inline const Paddle &paddle() const noexcept { return m_paddle; }
    inline const std::vector<Brick> &bricks() const noexcept {
        return m_bricks;
    }
    inline const std::vector<Explosion> &explosions() const noexcept {
        return m_explosions;
    }
    inline const GridGeometry &geometry() const noexcept { return m_geometry; }
    inline const mailbox::EngineConfigSnapshot &config() const noexcept {
        return m_cfg;
    }
    inline long long frame_count() const noexcept { return m_frame_count; }
    inline int destroyed_count() const noexcept { return m_destroyed_count; }
    inline int total_bricks() const noexcept { return (int)m_bricks.size(); }

    /**
     * @brief Brick by index
     * @throws gridbreak::SimulationError if the index is out of range
     */
    const Brick &brick(int index) const;

  private:
    /**
     * @brief Creates one brick per non-empty cell, column by column
     */
    void build_bricks(const mailbox::IntensityGrid &grid);

    /**
     * @brief Removes finished explosions after ageing the survivors
     */
    void step_explosions();

  private:
    /** @brief Configuration the board was built with */
    mailbox::EngineConfigSnapshot m_cfg;
    /** @brief Grid/pixel mapping */
    GridGeometry m_geometry;
    /** @brief Area the ball is confined to */
    Rectangle m_playfield;
    Ball m_ball;
    Paddle m_paddle;
    /** @brief Fixed after construction; destroyed bricks stay in place */
    std::vector<Brick> m_bricks;
    std::vector<Explosion> m_explosions;
    /** @brief Drives explosion particle generation, seeded from config */
    std::mt19937 m_rng;
    long long m_frame_count = 0;
    int m_destroyed_count = 0;
};
