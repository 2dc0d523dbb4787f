#include "geometry.hpp"

#include <fmt/format.h>

#include "../utility/exceptions.hpp"

GridGeometry::GridGeometry(const mailbox::EngineConfigSnapshot &cfg)
    : m_columns(cfg.columns), m_rows(cfg.rows), m_cell_size(cfg.cell_size),
      m_cell_spacing(cfg.cell_spacing), m_margin_top(cfg.margin_top),
      m_margin_left(cfg.margin_left), m_margin_right(cfg.margin_right),
      m_image_width(mailbox::image_width(cfg)),
      m_image_height(mailbox::image_height(cfg)) {
    if (m_columns <= 0 || m_rows <= 0) {
        throw gridbreak::ConfigError(fmt::format(
            "Invalid grid dimensions: {}x{}", m_columns, m_rows));
    }
    if (m_cell_size <= 0.f || m_cell_spacing < 0.f) {
        throw gridbreak::ConfigError(
            fmt::format("Invalid cell size/spacing: {}/{}", m_cell_size,
                        m_cell_spacing));
    }
    if (m_margin_top < 0.f || m_margin_left < 0.f || m_margin_right < 0.f ||
        cfg.margin_bottom < 0.f) {
        throw gridbreak::ConfigError("Invalid margins: negative value");
    }
}

Vector2 GridGeometry::grid_to_pixel(float col, float row) const noexcept {
    const float block = cell_block();
    return Vector2{m_margin_left + col * block + m_cell_size * 0.5f,
                   m_margin_top + row * block + m_cell_size * 0.5f};
}

Rectangle GridGeometry::cell_rect(int col, int row) const noexcept {
    const float block = cell_block();
    return Rectangle{m_margin_left + col * block, m_margin_top + row * block,
                     m_cell_size, m_cell_size};
}

Rectangle GridGeometry::playfield(float bottom_inset) const noexcept {
    const float right = m_image_width - m_margin_right;
    const float bottom = m_image_height - bottom_inset;
    return Rectangle{m_margin_left, m_margin_top, right - m_margin_left,
                     bottom - m_margin_top};
}

mailbox::GridLayout GridGeometry::layout() const noexcept {
    mailbox::GridLayout layout;
    layout.columns = m_columns;
    layout.rows = m_rows;
    layout.cell_size = m_cell_size;
    layout.cell_spacing = m_cell_spacing;
    layout.origin_x = m_margin_left;
    layout.origin_y = m_margin_top;
    layout.image_width = m_image_width;
    layout.image_height = m_image_height;
    return layout;
}
