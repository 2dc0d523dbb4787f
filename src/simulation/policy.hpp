#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

#include "simulation.hpp"

/**
 * @brief Paddle x of a grid column, the target every column-based policy
 * aims for
 */
float column_target(const Simulation &sim, int col) noexcept;

/**
 * @brief Chases the ball
 *
 * Each pull samples the ball's x once; the paddle then travels there while
 * the ball keeps moving. Ends once the board is complete.
 */
class FollowPolicy {
  public:
    std::optional<float> next(const Simulation &sim);
};

/**
 * @brief Clears the board column by column, left to right
 *
 * The set of columns is taken when the policy is created. Within a column
 * the active brick count is re-checked on every pull, so the policy only
 * moves on once that column is empty.
 */
class ColumnSweepPolicy {
  public:
    explicit ColumnSweepPolicy(const Simulation &sim);

    std::optional<float> next(const Simulation &sim);

    /** @brief Columns to visit, ascending */
    inline const std::vector<int> &columns() const noexcept {
        return m_columns;
    }

    /** @brief Column currently targeted, or -1 once the sweep is over */
    int current_column() const noexcept;

  private:
    std::vector<int> m_columns;
    std::size_t m_cursor = 0;
};

/**
 * @brief Clears the board row by row from the bottom, alternating direction
 *
 * On entering a row the active bricks of that row are listed once and each
 * one is targeted strength times. The plan is not revised afterwards, so
 * stray hits on neighbouring bricks can leave it longer or shorter than the
 * work actually remaining.
 */
class RowZigZagPolicy {
  public:
    explicit RowZigZagPolicy(const Simulation &sim);

    std::optional<float> next(const Simulation &sim);

    /**
     * @brief Targets for one row as they would be planned right now
     *
     * Even rows run right to left, odd rows left to right.
     */
    static std::vector<float> plan_row(const Simulation &sim, int row);

    /** @brief Row being worked on, or -1 before the first pull / after the
     * last row */
    inline int current_row() const noexcept { return m_row; }

    /** @brief Targets planned for the current row */
    inline const std::vector<float> &row_plan() const noexcept {
        return m_plan;
    }

  private:
    int m_next_row;
    int m_row = -1;
    std::vector<float> m_plan;
    std::size_t m_cursor = 0;
};

using ControlPolicy =
    std::variant<FollowPolicy, ColumnSweepPolicy, RowZigZagPolicy>;

/** @brief Policy selector, in ControlPolicy alternative order */
enum class PolicyKind { Follow, ColumnSweep, RowZigZag };

/**
 * @brief Creates a policy bound to the board it will drive
 */
ControlPolicy make_policy(PolicyKind kind, const Simulation &sim);

/**
 * @brief Pulls the next paddle target
 * @return The target, or nothing once the policy has no more work
 */
std::optional<float> next_target(ControlPolicy &policy, const Simulation &sim);

PolicyKind policy_kind(const ControlPolicy &policy) noexcept;

std::string_view policy_name(PolicyKind kind) noexcept;

/**
 * @brief Parses a command line policy name ("follow", "column", "row")
 * @throws gridbreak::ConfigError on an unknown name
 */
PolicyKind parse_policy_kind(std::string_view name);
