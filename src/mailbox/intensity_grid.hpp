#pragma once

#include <string>
#include <vector>

namespace mailbox {

/**
 * @brief One source cell: ordinal intensity level plus the raw magnitude it
 * was bucketed from
 */
struct IntensityCell {
    int level = 0;     // 0 means "no brick"
    int count = 0;     // raw magnitude, display/metadata only
    std::string date;  // ISO date from the provider, may be empty
};

/**
 * @brief Rectangular grid of intensity cells, indexed by (column, row)
 *
 * Stored column-major: a column is one calendar week, a row one weekday.
 */
class IntensityGrid {
  public:
    IntensityGrid() = default;

    /**
     * @brief Creates an empty grid of the given size
     * @throws gridbreak::ConfigError if either dimension is negative
     */
    IntensityGrid(int columns, int rows);

    /**
     * @brief Builds a grid from per-column cell lists
     * @param columns One vector of cells per column, all the same length
     * @throws gridbreak::ConfigError if the columns are ragged or a cell
     * carries a negative level or count
     */
    explicit IntensityGrid(const std::vector<std::vector<IntensityCell>> &columns);

    inline int columns() const noexcept { return m_columns; }
    inline int rows() const noexcept { return m_rows; }

    /**
     * @brief Cell at (col, row)
     * @throws gridbreak::ConfigError if the coordinate is outside the grid
     */
    const IntensityCell &cell(int col, int row) const;

    /**
     * @brief Replaces the cell at (col, row)
     * @throws gridbreak::ConfigError if the coordinate is outside the grid or
     * the cell carries a negative level or count
     */
    void set_cell(int col, int row, IntensityCell cell);

    /** @brief Number of cells with a non-zero level */
    int occupied_cells() const noexcept;

    /** @brief Highest level present, 0 for an empty grid */
    int max_level() const noexcept;

  public:
    std::string label;       // provider-side owner, e.g. a user name
    long long total = 0;     // provider-reported sum of counts
    std::string start_date;
    std::string end_date;

  private:
    void check_coordinate(int col, int row) const;

    int m_columns = 0;
    int m_rows = 0;
    std::vector<IntensityCell> m_cells; // column-major, m_columns * m_rows
};

} // namespace mailbox
