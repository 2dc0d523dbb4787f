#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <raylib.h>

#include "mailbox/engine_config.hpp"
#include "mailbox/intensity_grid.hpp"
#include "render/frame_renderer.hpp"
#include "render/types/config.hpp"
#include "render/viewer.hpp"
#include "save_manager.hpp"
#include "simulation/frame_driver.hpp"
#include "simulation/policy.hpp"
#include "simulation/simulation.hpp"
#include "utility/default_config.hpp"
#include "utility/exceptions.hpp"
#include "utility/logger.hpp"

namespace {

struct Options {
    std::string grid_path;
    PolicyKind policy = PolicyKind::Follow;
    std::optional<std::string> config_path;
    std::optional<std::filesystem::path> out_dir;
    std::string watermark;
    std::optional<int> fps;
    bool view = false;
};

constexpr const char *USAGE =
    "usage: gridbreak <grid.json> [--policy follow|column|row] "
    "[--config cfg.json] [--out dir] [--watermark text] [--fps n] [--view]";

Options parse_args(int argc, char **argv) {
    Options opts;
    std::vector<std::string_view> args(argv + 1, argv + argc);

    auto value_of = [&](size_t &i) -> std::string {
        if (i + 1 >= args.size()) {
            throw gridbreak::ConfigError(
                fmt::format("Missing value for {}\n{}", args[i], USAGE));
        }
        return std::string(args[++i]);
    };

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string_view arg = args[i];
        if (arg == "--policy") {
            opts.policy = parse_policy_kind(value_of(i));
        } else if (arg == "--config") {
            opts.config_path = value_of(i);
        } else if (arg == "--out") {
            opts.out_dir = value_of(i);
        } else if (arg == "--watermark") {
            opts.watermark = value_of(i);
        } else if (arg == "--fps") {
            const std::string v = value_of(i);
            int fps = 0;
            try {
                fps = std::stoi(v);
            } catch (const std::exception &) {
                throw gridbreak::ConfigError("Invalid --fps value: " + v);
            }
            if (fps <= 0 || fps > 1000) {
                throw gridbreak::ConfigError("Invalid --fps value: " + v);
            }
            opts.fps = fps;
        } else if (arg == "--view") {
            opts.view = true;
        } else if (arg == "-h" || arg == "--help") {
            std::cout << USAGE << std::endl;
            std::exit(0);
        } else if (arg.starts_with("--")) {
            throw gridbreak::ConfigError(
                fmt::format("Unknown option {}\n{}", arg, USAGE));
        } else if (opts.grid_path.empty()) {
            opts.grid_path = std::string(arg);
        } else {
            throw gridbreak::ConfigError(
                fmt::format("Unexpected argument {}\n{}", arg, USAGE));
        }
    }

    if (opts.grid_path.empty()) {
        throw gridbreak::ConfigError(USAGE);
    }
    return opts;
}

RunReport export_frames(Simulation &sim, const Options &opts,
                        const RenderConfig &rcfg, SaveManager &save_manager) {
    FrameDriver driver(sim, make_policy(opts.policy, sim));

    if (!opts.out_dir) {
        return driver.run(nullptr);
    }

    std::filesystem::create_directories(*opts.out_dir);

    // raylib's default font only exists once a GL context is up
    const WatermarkWindow window(!rcfg.watermark.empty());

    FrameRenderer renderer(rcfg);
    long long index = 0;
    const RunReport report =
        driver.run([&](const mailbox::FrameSnapshot &frame) {
            renderer.render(frame);
            renderer.export_png(*opts.out_dir, index++);
        });

    save_manager.save_frame_manifest(*opts.out_dir, report);
    return report;
}

void run(int argc, char **argv) {
    SetTraceLogLevel(LOG_WARNING);

    const Options opts = parse_args(argc, argv);
    LOG_INFO("Starting gridbreak ({} policy) on {}", policy_name(opts.policy),
             opts.grid_path);

    SaveManager save_manager;
    const mailbox::IntensityGrid grid = save_manager.load_grid(opts.grid_path);

    mailbox::EngineConfigSnapshot cfg =
        gridbreak::utility::create_default_config(grid.columns(), grid.rows());
    if (opts.config_path) {
        cfg = save_manager.load_config(*opts.config_path, cfg);
    }
    if (opts.fps) {
        cfg.timing.frame_duration_ms = 1000 / *opts.fps;
    }

    RenderConfig rcfg;
    rcfg.watermark = opts.watermark;

    if (opts.view) {
        Viewer viewer(grid, cfg, opts.policy, rcfg);
        viewer.run();
        return;
    }

    Simulation sim(grid, cfg);
    const RunReport report = export_frames(sim, opts, rcfg, save_manager);

    const std::string owner = grid.label.empty() ? "grid" : grid.label;
    fmt::print("{}: {}/{} bricks destroyed, {} frames ({:.2f}s), {}\n", owner,
               report.destroyed_bricks, report.total_bricks, report.frames,
               report.duration_seconds(), stop_reason_name(report.stop_reason));
    if (opts.out_dir) {
        fmt::print("Frames written to {}\n", opts.out_dir->string());
    }
}

} // namespace

int main(int argc, char **argv) {
    try {
        run(argc, argv);
        LOG_INFO("gridbreak shutting down normally");
        return 0;
    } catch (const gridbreak::GridbreakException &e) {
        LOG_ERROR("gridbreak error: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        LOG_ERROR("Standard error: {}", e.what());
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
