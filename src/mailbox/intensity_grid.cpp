#include "intensity_grid.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

#include "../utility/exceptions.hpp"

namespace mailbox {

namespace {

void check_cell(const IntensityCell &cell, int col, int row) {
    if (cell.level < 0 || cell.count < 0) {
        throw gridbreak::ConfigError(
            fmt::format("Invalid cell at ({}, {}): level={} count={}", col, row,
                        cell.level, cell.count));
    }
}

} // namespace

IntensityGrid::IntensityGrid(int columns, int rows)
    : m_columns(columns), m_rows(rows) {
    if (columns < 0 || rows < 0) {
        throw gridbreak::ConfigError(
            fmt::format("Invalid grid dimensions: {}x{}", columns, rows));
    }
    m_cells.resize(size_t(columns) * size_t(rows));
}

IntensityGrid::IntensityGrid(
    const std::vector<std::vector<IntensityCell>> &columns) {
    m_columns = (int)columns.size();
    m_rows = columns.empty() ? 0 : (int)columns.front().size();
    m_cells.reserve(size_t(m_columns) * size_t(m_rows));

    for (int col = 0; col < m_columns; ++col) {
        const auto &cells = columns[col];
        if ((int)cells.size() != m_rows) {
            throw gridbreak::ConfigError(fmt::format(
                "Grid is not rectangular: column {} has {} cells, expected {}",
                col, cells.size(), m_rows));
        }
        for (int row = 0; row < m_rows; ++row) {
            check_cell(cells[row], col, row);
            m_cells.push_back(cells[row]);
        }
    }
}

void IntensityGrid::check_coordinate(int col, int row) const {
    if (col < 0 || col >= m_columns || row < 0 || row >= m_rows) {
        throw gridbreak::ConfigError(
            fmt::format("Cell ({}, {}) outside {}x{} grid", col, row,
                        m_columns, m_rows));
    }
}

const IntensityCell &IntensityGrid::cell(int col, int row) const {
    check_coordinate(col, row);
    return m_cells[size_t(col) * size_t(m_rows) + size_t(row)];
}

void IntensityGrid::set_cell(int col, int row, IntensityCell cell) {
    check_coordinate(col, row);
    check_cell(cell, col, row);
    m_cells[size_t(col) * size_t(m_rows) + size_t(row)] = std::move(cell);
}

int IntensityGrid::occupied_cells() const noexcept {
    return (int)std::count_if(
        m_cells.begin(), m_cells.end(),
        [](const IntensityCell &c) { return c.level > 0; });
}

int IntensityGrid::max_level() const noexcept {
    int level = 0;
    for (const auto &c : m_cells) {
        level = std::max(level, c.level);
    }
    return level;
}

} // namespace mailbox
