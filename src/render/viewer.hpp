#pragma once

#include <memory>
#include <optional>

#include <raylib.h>

#include "../mailbox/engine_config.hpp"
#include "../mailbox/frame_snapshot.hpp"
#include "../mailbox/intensity_grid.hpp"
#include "../simulation/frame_driver.hpp"
#include "../simulation/policy.hpp"
#include "../simulation/simulation.hpp"
#include "frame_renderer.hpp"
#include "types/config.hpp"

/**
 * @brief Interactive playback window
 *
 * Pulls frames from a FrameDriver at the configured frame duration, draws
 * them through FrameRenderer and shows a small ImGui control panel. Restart
 * rebuilds the simulation from the original grid.
 */
class Viewer {
  public:
    Viewer(const mailbox::IntensityGrid &grid,
           const mailbox::EngineConfigSnapshot &cfg, PolicyKind policy,
           const RenderConfig &rcfg);
    ~Viewer();
    Viewer(const Viewer &) = delete;
    Viewer(Viewer &&) = delete;
    Viewer &operator=(const Viewer &) = delete;
    Viewer &operator=(Viewer &&) = delete;

    /**
     * @brief Opens the window and plays until it is closed
     * @throws gridbreak::RenderError if the window cannot be created
     */
    void run();

  private:
    void restart();
    bool advance();
    void upload();
    void draw_panel();

  private:
    const mailbox::IntensityGrid &m_grid;
    mailbox::EngineConfigSnapshot m_cfg;
    PolicyKind m_policy;

    std::unique_ptr<Simulation> m_sim;
    std::unique_ptr<FrameDriver> m_driver;
    FrameRenderer m_renderer;
    std::optional<mailbox::FrameSnapshot> m_frame;

    Texture2D m_texture = {};
    bool m_paused = false;
    bool m_step_once = false;
    float m_accumulator = 0.f;

    static constexpr int PANEL_WIDTH = 260;
};
