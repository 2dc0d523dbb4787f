#pragma once

#include <raylib.h>

#include "../mailbox/engine_config.hpp"
#include "../mailbox/frame_snapshot.hpp"

/**
 * @brief Immutable mapping between grid coordinates and pixels
 *
 * Column c, row r occupies the square starting at
 * (margin_left + c * block, margin_top + r * block), block = cell + spacing.
 * Fractional coordinates are allowed for entities placed between cells.
 */
class GridGeometry {
  public:
    /**
     * @brief Geometry described by a configuration
     * @throws gridbreak::ConfigError on non-positive dimensions or cell size,
     * or negative spacing/margins
     */
    explicit GridGeometry(const mailbox::EngineConfigSnapshot &cfg);

    /**
     * @brief Pixel centre of a (possibly fractional) grid coordinate
     */
    Vector2 grid_to_pixel(float col, float row) const noexcept;

    /**
     * @brief Pixel bounding rectangle of grid cell (col, row)
     */
    Rectangle cell_rect(int col, int row) const noexcept;

    /**
     * @brief Area the ball may move in: margins on three sides, the bottom
     * backstop inset from the image bottom
     */
    Rectangle playfield(float bottom_inset) const noexcept;

    /** @brief Layout description handed to the renderer */
    mailbox::GridLayout layout() const noexcept;

    inline int columns() const noexcept { return m_columns; }
    inline int rows() const noexcept { return m_rows; }
    inline float cell_size() const noexcept { return m_cell_size; }
    inline float cell_block() const noexcept {
        return m_cell_size + m_cell_spacing;
    }
    inline float image_width() const noexcept { return m_image_width; }
    inline float image_height() const noexcept { return m_image_height; }

  private:
    int m_columns;
    int m_rows;
    float m_cell_size;
    float m_cell_spacing;
    float m_margin_top;
    float m_margin_left;
    float m_margin_right;
    float m_image_width;
    float m_image_height;
};
