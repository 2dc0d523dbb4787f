#pragma once

#include <filesystem>

#include <raylib.h>

#include "../mailbox/frame_snapshot.hpp"
#include "types/config.hpp"

/**
 * @brief Draws frame snapshots into a CPU-side raylib image
 *
 * Works without a window; only the watermark needs one, because raylib's
 * default font lives in GPU memory.
 */
class FrameRenderer {
  public:
    explicit FrameRenderer(const RenderConfig &cfg = {});
    ~FrameRenderer();
    FrameRenderer(const FrameRenderer &) = delete;
    FrameRenderer(FrameRenderer &&) = delete;
    FrameRenderer &operator=(const FrameRenderer &) = delete;
    FrameRenderer &operator=(FrameRenderer &&) = delete;

    /**
     * @brief Draws one frame, replacing the previous picture
     *
     * Back to front: background, empty cells, bricks, explosions, paddle,
     * ball, watermark.
     *
     * @param frame Snapshot to draw
     * @return The image, valid until the next render() call
     * @throws gridbreak::RenderError if a watermark is configured but no
     * window is open
     */
    const Image &render(const mailbox::FrameSnapshot &frame);

    /**
     * @brief Writes the current picture as dir/frame_NNNNN.png
     * @throws gridbreak::RenderError if nothing was rendered yet or the file
     * cannot be written
     */
    void export_png(const std::filesystem::path &dir, long long index) const;

    /** @brief Colour of one pixel of the current picture */
    Color pixel(int x, int y) const;

    inline const Image &image() const noexcept { return m_image; }
    inline RenderConfig &config() noexcept { return m_cfg; }
    inline const RenderConfig &config() const noexcept { return m_cfg; }

    /**
     * @brief Colour of a brick with the given remaining strength ratio
     *
     * Intact bricks keep their colour; damaged ones are scaled by
     * floor + (1 - floor) * ratio.
     */
    static Color brick_color(Color base, float ratio, float floor) noexcept;

    /** @brief Scales the RGB channels of c, keeping alpha */
    static Color scale(Color c, float factor) noexcept;

  private:
    void ensure_image(int width, int height);

    void draw_grid(const mailbox::GridLayout &layout);
    void draw_bricks(const mailbox::FrameSnapshot &frame);
    void draw_explosions(const mailbox::FrameSnapshot &frame);
    void draw_paddle(const mailbox::PaddleView &paddle);
    void draw_ball(const mailbox::BallView &ball);
    void draw_watermark();

  private:
    RenderConfig m_cfg;
    Image m_image = {};
};

/**
 * @brief Hidden 1x1 window that keeps raylib's default font available for
 * watermarks during headless export
 *
 * Opens only when asked to and no window exists yet; closes what it opened
 * when it goes out of scope, including during stack unwinding.
 */
class WatermarkWindow {
  public:
    /**
     * @param needed Whether a window is required at all
     * @throws gridbreak::RenderError if the window cannot be created
     */
    explicit WatermarkWindow(bool needed);
    ~WatermarkWindow();
    WatermarkWindow(const WatermarkWindow &) = delete;
    WatermarkWindow(WatermarkWindow &&) = delete;
    WatermarkWindow &operator=(const WatermarkWindow &) = delete;
    WatermarkWindow &operator=(WatermarkWindow &&) = delete;

    /** @brief Whether this guard opened the window and will close it */
    inline bool owns_window() const noexcept { return m_owned; }

  private:
    bool m_owned = false;
};
