#include <algorithm>

#include <fmt/format.h>

#include "save_manager.hpp"

namespace {

template <typename T> void read_if(const json &j, const char *key, T &out) {
    if (j.contains(key)) {
        out = j.at(key).get<T>();
    }
}

} // namespace

mailbox::IntensityGrid SaveManager::load_grid(const std::string &filepath) {
    LOG_INFO("Loading grid from: {}", filepath);

    mailbox::IntensityGrid grid;
    try {
        grid = json_to_grid(read_file(filepath));
    } catch (const gridbreak::GridbreakException &) {
        throw;
    } catch (const std::exception &e) {
        LOG_ERROR("JSON parsing error: {}", e.what());
        throw gridbreak::IOError(
            fmt::format("Grid parsing failed ({}): {}", filepath, e.what()));
    }

    LOG_INFO("Grid loaded: {}x{}, {} occupied cells", grid.columns(),
             grid.rows(), grid.occupied_cells());
    return grid;
}

void SaveManager::save_grid(const std::string &filepath,
                            const mailbox::IntensityGrid &grid) {
    LOG_INFO("Saving grid to: {}", filepath);

    try {
        write_file(filepath, grid_to_json(grid));
    } catch (const gridbreak::GridbreakException &) {
        throw;
    } catch (const std::exception &e) {
        LOG_ERROR("JSON serialization error: {}", e.what());
        throw gridbreak::IOError(
            fmt::format("Grid serialization failed: {}", e.what()));
    }
}

mailbox::EngineConfigSnapshot
SaveManager::load_config(const std::string &filepath,
                         const mailbox::EngineConfigSnapshot &base) {
    LOG_INFO("Loading configuration from: {}", filepath);

    mailbox::EngineConfigSnapshot config = base;
    try {
        json_to_config(read_file(filepath), config);
    } catch (const gridbreak::GridbreakException &) {
        throw;
    } catch (const std::exception &e) {
        LOG_ERROR("JSON parsing error: {}", e.what());
        throw gridbreak::IOError(fmt::format(
            "Configuration parsing failed ({}): {}", filepath, e.what()));
    }

    mailbox::validate(config);
    return config;
}

void SaveManager::save_config(const std::string &filepath,
                              const mailbox::EngineConfigSnapshot &config) {
    LOG_INFO("Saving configuration to: {}", filepath);

    try {
        write_file(filepath, config_to_json(config));
    } catch (const gridbreak::GridbreakException &) {
        throw;
    } catch (const std::exception &e) {
        LOG_ERROR("JSON serialization error: {}", e.what());
        throw gridbreak::IOError(
            fmt::format("Configuration serialization failed: {}", e.what()));
    }
}

void SaveManager::save_frame_manifest(const std::filesystem::path &directory,
                                      const RunReport &report) {
    json files = json::array();
    for (long long i = 0; i < report.frames; ++i) {
        files.push_back(frame_file_name(i));
    }

    json j{{"frames", report.frames},
           {"frame_duration_ms", report.frame_duration_ms},
           {"duration_seconds", report.duration_seconds()},
           {"total_bricks", report.total_bricks},
           {"destroyed_bricks", report.destroyed_bricks},
           {"complete", report.complete},
           {"stop_reason", stop_reason_name(report.stop_reason)},
           {"files", files}};

    write_file((directory / MANIFEST_FILE).string(), j);
}

std::string SaveManager::frame_file_name(long long index) {
    return fmt::format("frame_{:05}.png", index);
}

json SaveManager::color_to_json(const Color &color) {
    return json{{"r", color.r}, {"g", color.g}, {"b", color.b}, {"a", color.a}};
}

Color SaveManager::json_to_color(const json &j) {
    return Color{static_cast<unsigned char>(j.at("r").get<int>()),
                 static_cast<unsigned char>(j.at("g").get<int>()),
                 static_cast<unsigned char>(j.at("b").get<int>()),
                 static_cast<unsigned char>(j.value("a", 255))};
}

json SaveManager::config_to_json(const mailbox::EngineConfigSnapshot &config) {
    json levels = json::array();
    for (const auto &level : config.levels) {
        levels.push_back(json{{"strength", level.strength},
                              {"color", color_to_json(level.color)}});
    }

    return json{{"columns", config.columns},
                {"rows", config.rows},
                {"cell_size", config.cell_size},
                {"cell_spacing", config.cell_spacing},
                {"margin_top", config.margin_top},
                {"margin_bottom", config.margin_bottom},
                {"margin_left", config.margin_left},
                {"margin_right", config.margin_right},
                {"ball_radius", config.ball_radius},
                {"ball_speed", config.ball_speed},
                {"ball_start_column", config.ball_start_column},
                {"ball_start_row", config.ball_start_row},
                {"launch_angle_deg", config.launch_angle_deg},
                {"paddle_width", config.paddle_width},
                {"paddle_height", config.paddle_height},
                {"paddle_speed", config.paddle_speed},
                {"paddle_row", config.paddle_row},
                {"max_bounce_angle_deg", config.max_bounce_angle_deg},
                {"settle_epsilon", config.settle_epsilon},
                {"bottom_wall_inset", config.bottom_wall_inset},
                {"levels", levels},
                {"explosion",
                 {{"lifetime", config.explosion.lifetime},
                  {"particles", config.explosion.particles},
                  {"max_radius", config.explosion.max_radius},
                  {"seed", config.explosion.seed}}},
                {"timing",
                 {{"frame_duration_ms", config.timing.frame_duration_ms},
                  {"end_pause_frames", config.timing.end_pause_frames},
                  {"min_frames", config.timing.min_frames}}},
                {"watchdogs",
                 {{"stuck_frame_limit", config.watchdogs.stuck_frame_limit},
                  {"max_frames", config.watchdogs.max_frames},
                  {"force_completion_frames",
                   config.watchdogs.force_completion_frames}}}};
}

void SaveManager::json_to_config(const json &j,
                                 mailbox::EngineConfigSnapshot &config) {
    read_if(j, "columns", config.columns);
    read_if(j, "rows", config.rows);
    read_if(j, "cell_size", config.cell_size);
    read_if(j, "cell_spacing", config.cell_spacing);
    read_if(j, "margin_top", config.margin_top);
    read_if(j, "margin_bottom", config.margin_bottom);
    read_if(j, "margin_left", config.margin_left);
    read_if(j, "margin_right", config.margin_right);
    read_if(j, "ball_radius", config.ball_radius);
    read_if(j, "ball_speed", config.ball_speed);
    read_if(j, "ball_start_column", config.ball_start_column);
    read_if(j, "ball_start_row", config.ball_start_row);
    read_if(j, "launch_angle_deg", config.launch_angle_deg);
    read_if(j, "paddle_width", config.paddle_width);
    read_if(j, "paddle_height", config.paddle_height);
    read_if(j, "paddle_speed", config.paddle_speed);
    read_if(j, "paddle_row", config.paddle_row);
    read_if(j, "max_bounce_angle_deg", config.max_bounce_angle_deg);
    read_if(j, "settle_epsilon", config.settle_epsilon);
    read_if(j, "bottom_wall_inset", config.bottom_wall_inset);

    if (j.contains("levels")) {
        config.levels.clear();
        for (const auto &level : j.at("levels")) {
            config.levels.push_back(
                {level.at("strength").get<int>(), json_to_color(level.at("color"))});
        }
    }

    if (j.contains("explosion")) {
        const auto &e = j.at("explosion");
        read_if(e, "lifetime", config.explosion.lifetime);
        read_if(e, "particles", config.explosion.particles);
        read_if(e, "max_radius", config.explosion.max_radius);
        read_if(e, "seed", config.explosion.seed);
    }
    if (j.contains("timing")) {
        const auto &t = j.at("timing");
        read_if(t, "frame_duration_ms", config.timing.frame_duration_ms);
        read_if(t, "end_pause_frames", config.timing.end_pause_frames);
        read_if(t, "min_frames", config.timing.min_frames);
    }
    if (j.contains("watchdogs")) {
        const auto &w = j.at("watchdogs");
        read_if(w, "stuck_frame_limit", config.watchdogs.stuck_frame_limit);
        read_if(w, "max_frames", config.watchdogs.max_frames);
        read_if(w, "force_completion_frames",
                config.watchdogs.force_completion_frames);
    }
}

json SaveManager::grid_to_json(const mailbox::IntensityGrid &grid) {
    json weeks = json::array();
    for (int col = 0; col < grid.columns(); ++col) {
        json days = json::array();
        for (int row = 0; row < grid.rows(); ++row) {
            const auto &cell = grid.cell(col, row);
            days.push_back(json{
                {"date", cell.date}, {"count", cell.count}, {"level", cell.level}});
        }
        weeks.push_back(json{{"days", days}});
    }

    return json{{"username", grid.label},
                {"total_contributions", grid.total},
                {"start_date", grid.start_date},
                {"end_date", grid.end_date},
                {"weeks", weeks}};
}

mailbox::IntensityGrid SaveManager::json_to_grid(const json &j) {
    const auto &weeks = j.at("weeks");

    std::size_t rows = 0;
    for (const auto &week : weeks) {
        rows = std::max(rows, week.at("days").size());
    }

    std::vector<std::vector<mailbox::IntensityCell>> columns;
    columns.reserve(weeks.size());
    for (const auto &week : weeks) {
        std::vector<mailbox::IntensityCell> column;
        column.reserve(rows);
        for (const auto &day : week.at("days")) {
            mailbox::IntensityCell cell;
            cell.level = day.value("level", 0);
            cell.count = day.value("count", 0);
            cell.date = day.value("date", std::string{});
            column.push_back(std::move(cell));
        }
        column.resize(rows);
        columns.push_back(std::move(column));
    }

    mailbox::IntensityGrid grid(columns);
    grid.label = j.value("username", std::string{});
    grid.total = j.value("total_contributions", 0LL);
    grid.start_date = j.value("start_date", std::string{});
    grid.end_date = j.value("end_date", std::string{});
    return grid;
}

json SaveManager::read_file(const std::string &filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw gridbreak::IOError("Failed to open file for reading: " +
                                 filepath);
    }

    json j;
    file >> j;
    return j;
}

void SaveManager::write_file(const std::string &filepath, const json &j) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw gridbreak::IOError("Failed to open file for writing: " +
                                 filepath);
    }

    file << j.dump(2);
    if (!file) {
        throw gridbreak::IOError("Failed to write file: " + filepath);
    }
}
