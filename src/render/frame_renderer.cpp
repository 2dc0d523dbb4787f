#include "frame_renderer.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include "../save_manager.hpp"
#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"

FrameRenderer::FrameRenderer(const RenderConfig &cfg) : m_cfg(cfg) {}

FrameRenderer::~FrameRenderer() {
    if (m_image.data != nullptr) {
        UnloadImage(m_image);
    }
}

const Image &FrameRenderer::render(const mailbox::FrameSnapshot &frame) {
    ensure_image((int)frame.layout.image_width,
                 (int)frame.layout.image_height);
    ImageClearBackground(&m_image, m_cfg.background_color);

    draw_grid(frame.layout);
    draw_bricks(frame);
    draw_explosions(frame);
    draw_paddle(frame.paddle);
    draw_ball(frame.ball);
    if (!m_cfg.watermark.empty()) {
        draw_watermark();
    }

    return m_image;
}

void FrameRenderer::export_png(const std::filesystem::path &dir,
                               long long index) const {
    if (m_image.data == nullptr) {
        throw gridbreak::RenderError("Nothing rendered yet");
    }

    const std::string path =
        (dir / SaveManager::frame_file_name(index)).string();
    if (!ExportImage(m_image, path.c_str())) {
        throw gridbreak::RenderError("Failed to write frame: " + path);
    }
}

Color FrameRenderer::pixel(int x, int y) const {
    if (m_image.data == nullptr || x < 0 || y < 0 || x >= m_image.width ||
        y >= m_image.height) {
        throw gridbreak::RenderError(
            fmt::format("Pixel ({}, {}) outside the rendered image", x, y));
    }
    return GetImageColor(m_image, x, y);
}

Color FrameRenderer::scale(Color c, float factor) noexcept {
    auto channel = [factor](unsigned char v) {
        return (unsigned char)std::clamp((int)(v * factor), 0, 255);
    };
    return Color{channel(c.r), channel(c.g), channel(c.b), c.a};
}

Color FrameRenderer::brick_color(Color base, float ratio,
                                 float floor) noexcept {
    if (ratio >= 1.f) {
        return base;
    }
    return scale(base, floor + (1.f - floor) * std::max(0.f, ratio));
}

void FrameRenderer::ensure_image(int width, int height) {
    if (width <= 0 || height <= 0) {
        throw gridbreak::RenderError(
            fmt::format("Invalid frame size: {}x{}", width, height));
    }
    if (m_image.data != nullptr && m_image.width == width &&
        m_image.height == height) {
        return;
    }

    if (m_image.data != nullptr) {
        UnloadImage(m_image);
    }
    m_image = GenImageColor(width, height, m_cfg.background_color);
    LOG_DEBUG("Frame image allocated: {}x{}", width, height);
}

void FrameRenderer::draw_grid(const mailbox::GridLayout &layout) {
    for (int col = 0; col < layout.columns; ++col) {
        for (int row = 0; row < layout.rows; ++row) {
            ImageDrawRectangleRec(&m_image, layout.cell_rect(col, row),
                                  m_cfg.grid_color);
        }
    }
}

void FrameRenderer::draw_bricks(const mailbox::FrameSnapshot &frame) {
    for (const auto &brick : frame.bricks) {
        ImageDrawRectangleRec(
            &m_image, brick.rect,
            brick_color(brick.color, brick.strength_ratio, m_cfg.damaged_floor));
    }
}

void FrameRenderer::draw_explosions(const mailbox::FrameSnapshot &frame) {
    const int particle_size = (int)m_cfg.particle_size;

    for (const auto &explosion : frame.explosions) {
        const float radius = explosion.max_radius * explosion.progress;
        const float fade = 1.f - explosion.progress;

        for (const auto &p : explosion.particles) {
            const float r = radius * p.speed;
            const Vector2 pos{explosion.center.x + r * std::cos(p.angle),
                              explosion.center.y + r * std::sin(p.angle)};
            ImageDrawCircleV(&m_image, pos, particle_size,
                             scale(m_cfg.explosion_color, p.brightness * fade));
        }

        // centre flash over the first half
        if (explosion.elapsed * 2 < explosion.lifetime) {
            const int flash =
                (int)std::lround(m_cfg.flash_size * (1.f - explosion.progress * 2.f));
            if (flash > 0) {
                ImageDrawCircleV(&m_image, explosion.center, flash,
                                 m_cfg.flash_color);
            }
        }
    }
}

void FrameRenderer::draw_paddle(const mailbox::PaddleView &paddle) {
    const Rectangle b = paddle.bounds;
    const float r =
        std::min(m_cfg.paddle_corner_radius, std::min(b.width, b.height) / 2.f);
    const Color c = m_cfg.paddle_color;

    if (r < 1.f) {
        ImageDrawRectangleRec(&m_image, b, c);
        return;
    }

    ImageDrawRectangleRec(&m_image, {b.x + r, b.y, b.width - 2 * r, b.height}, c);
    ImageDrawRectangleRec(&m_image, {b.x, b.y + r, b.width, b.height - 2 * r}, c);

    const int ir = (int)r;
    ImageDrawCircleV(&m_image, {b.x + r, b.y + r}, ir, c);
    ImageDrawCircleV(&m_image, {b.x + b.width - r, b.y + r}, ir, c);
    ImageDrawCircleV(&m_image, {b.x + r, b.y + b.height - r}, ir, c);
    ImageDrawCircleV(&m_image, {b.x + b.width - r, b.y + b.height - r}, ir, c);
}

void FrameRenderer::draw_ball(const mailbox::BallView &ball) {
    ImageDrawCircleV(&m_image, ball.center, (int)std::lround(ball.radius),
                     m_cfg.ball_color);
}

void FrameRenderer::draw_watermark() {
    if (!IsWindowReady()) {
        throw gridbreak::RenderError(
            "Watermark requires an initialised window for the default font");
    }

    const char *text = m_cfg.watermark.c_str();
    const int size = m_cfg.watermark_font_size;
    const int width = MeasureText(text, size);
    const int x = m_image.width - width - m_cfg.watermark_margin;
    const int y = m_image.height - size - m_cfg.watermark_margin;

    ImageDrawText(&m_image, text, x + 1, y + 1, size, m_cfg.watermark_shadow);
    ImageDrawText(&m_image, text, x, y, size, m_cfg.watermark_color);
}

WatermarkWindow::WatermarkWindow(bool needed) {
    if (!needed || IsWindowReady()) {
        return;
    }

    SetConfigFlags(FLAG_WINDOW_HIDDEN);
    InitWindow(1, 1, "gridbreak");
    if (!IsWindowReady()) {
        throw gridbreak::RenderError(
            "Failed to create a hidden window for the watermark font");
    }
    m_owned = true;
    LOG_DEBUG("Hidden window opened for the watermark font");
}

WatermarkWindow::~WatermarkWindow() {
    if (m_owned) {
        CloseWindow();
    }
}
