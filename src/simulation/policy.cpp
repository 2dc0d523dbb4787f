#include "policy.hpp"

#include <algorithm>
#include <string>
#include <type_traits>

#include <fmt/format.h>

float column_target(const Simulation &sim, int col) noexcept {
    return sim.geometry().grid_to_pixel((float)col, 0.f).x;
}

std::optional<float> FollowPolicy::next(const Simulation &sim) {
    if (sim.is_complete()) {
        return std::nullopt;
    }
    return sim.ball().x;
}

ColumnSweepPolicy::ColumnSweepPolicy(const Simulation &sim) {
    for (const Brick &brick : sim.active_bricks()) {
        m_columns.push_back(brick.col());
    }
    std::sort(m_columns.begin(), m_columns.end());
    m_columns.erase(std::unique(m_columns.begin(), m_columns.end()),
                    m_columns.end());
}

std::optional<float> ColumnSweepPolicy::next(const Simulation &sim) {
    while (m_cursor < m_columns.size()) {
        const int col = m_columns[m_cursor];
        if (sim.active_bricks_in_column(col) > 0) {
            return column_target(sim, col);
        }
        LOG_DEBUG("Column {} cleared", col);
        ++m_cursor;
    }
    return std::nullopt;
}

int ColumnSweepPolicy::current_column() const noexcept {
    return m_cursor < m_columns.size() ? m_columns[m_cursor] : -1;
}

RowZigZagPolicy::RowZigZagPolicy(const Simulation &sim)
    : m_next_row(sim.geometry().rows() - 1) {}

std::vector<float> RowZigZagPolicy::plan_row(const Simulation &sim, int row) {
    std::vector<const Brick *> bricks;
    for (const Brick &brick : sim.active_bricks()) {
        if (brick.row() == row) {
            bricks.push_back(&brick);
        }
    }

    const bool right_to_left = (row % 2 == 0);
    std::stable_sort(bricks.begin(), bricks.end(),
                     [right_to_left](const Brick *a, const Brick *b) {
                         return right_to_left ? a->col() > b->col()
                                              : a->col() < b->col();
                     });

    std::vector<float> plan;
    for (const Brick *brick : bricks) {
        const float x = column_target(sim, brick->col());
        plan.insert(plan.end(), std::max(0, brick->strength()), x);
    }
    return plan;
}

std::optional<float> RowZigZagPolicy::next(const Simulation &sim) {
    while (m_cursor >= m_plan.size()) {
        if (m_next_row < 0) {
            m_row = -1;
            m_plan.clear();
            m_cursor = 0;
            return std::nullopt;
        }
        m_row = m_next_row--;
        m_plan = plan_row(sim, m_row);
        m_cursor = 0;
        LOG_DEBUG("Row {}: {} targets planned", m_row, m_plan.size());
    }
    return m_plan[m_cursor++];
}

ControlPolicy make_policy(PolicyKind kind, const Simulation &sim) {
    switch (kind) {
    case PolicyKind::ColumnSweep:
        return ColumnSweepPolicy(sim);
    case PolicyKind::RowZigZag:
        return RowZigZagPolicy(sim);
    case PolicyKind::Follow:
    default:
        return FollowPolicy{};
    }
}

std::optional<float> next_target(ControlPolicy &policy, const Simulation &sim) {
    return std::visit([&](auto &&p) { return p.next(sim); }, policy);
}

PolicyKind policy_kind(const ControlPolicy &policy) noexcept {
    return std::visit(
        [](auto &&p) {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, ColumnSweepPolicy>) {
                return PolicyKind::ColumnSweep;
            } else if constexpr (std::is_same_v<T, RowZigZagPolicy>) {
                return PolicyKind::RowZigZag;
            } else {
                return PolicyKind::Follow;
            }
        },
        policy);
}

std::string_view policy_name(PolicyKind kind) noexcept {
    switch (kind) {
    case PolicyKind::ColumnSweep:
        return "column";
    case PolicyKind::RowZigZag:
        return "row";
    case PolicyKind::Follow:
    default:
        return "follow";
    }
}

PolicyKind parse_policy_kind(std::string_view name) {
    for (PolicyKind kind : {PolicyKind::Follow, PolicyKind::ColumnSweep,
                            PolicyKind::RowZigZag}) {
        if (policy_name(kind) == name) {
            return kind;
        }
    }
    throw gridbreak::ConfigError(fmt::format(
        "Unknown policy '{}' (expected follow, column or row)", name));
}
