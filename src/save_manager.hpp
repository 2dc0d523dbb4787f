#pragma once

#include <filesystem>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>
#include <raylib.h>

#include "mailbox/engine_config.hpp"
#include "mailbox/intensity_grid.hpp"
#include "simulation/frame_driver.hpp"
#include "utility/exceptions.hpp"
#include "utility/logger.hpp"

using json = nlohmann::json;

/**
 * @brief Reads and writes the engine's JSON files.
 *
 * Three kinds of document: the intensity grid cache (weeks of days, the same
 * layout the contribution fetcher produces), the engine configuration, and
 * the frame manifest written next to exported PNG frames.
 */
class SaveManager {
  public:
    SaveManager() = default;
    ~SaveManager() = default;

    // Delete copy and move semantics
    SaveManager(const SaveManager &) = delete;
    SaveManager &operator=(const SaveManager &) = delete;
    SaveManager(SaveManager &&) = delete;
    SaveManager &operator=(SaveManager &&) = delete;

    /**
     * @brief Load an intensity grid cache file.
     *
     * Each week becomes a column and each day a row. Weeks shorter than the
     * longest one are padded with empty cells at the end.
     *
     * @param filepath Path to the cache file
     * @return The grid, with its metadata filled in
     * @throws gridbreak::IOError if the file cannot be read or parsed
     * @throws gridbreak::ConfigError if a cell carries a negative level or
     * count
     */
    mailbox::IntensityGrid load_grid(const std::string &filepath);

    /**
     * @brief Save an intensity grid in the cache format.
     * @throws gridbreak::IOError if file operations fail
     */
    void save_grid(const std::string &filepath,
                   const mailbox::IntensityGrid &grid);

    /**
     * @brief Load an engine configuration.
     *
     * Keys missing from the file keep the values of base; unknown keys are
     * ignored. The result is validated.
     *
     * @param filepath Path to the configuration file
     * @param base Values used for keys the file does not set
     * @throws gridbreak::IOError if the file cannot be read or parsed
     * @throws gridbreak::ConfigError if the merged configuration is invalid
     */
    mailbox::EngineConfigSnapshot
    load_config(const std::string &filepath,
                const mailbox::EngineConfigSnapshot &base);

    /**
     * @brief Save an engine configuration.
     * @throws gridbreak::IOError if file operations fail
     */
    void save_config(const std::string &filepath,
                     const mailbox::EngineConfigSnapshot &config);

    /**
     * @brief Write frames.json describing a directory of exported frames.
     * @param directory Directory holding the frame_NNNNN.png files
     * @param report Report of the run that produced them
     * @throws gridbreak::IOError if file operations fail
     */
    void save_frame_manifest(const std::filesystem::path &directory,
                             const RunReport &report);

    /**
     * @brief Convert Color to JSON representation.
     */
    json color_to_json(const Color &color);

    /**
     * @brief Convert JSON to Color object; a missing alpha means opaque.
     */
    Color json_to_color(const json &j);

    json config_to_json(const mailbox::EngineConfigSnapshot &config);

    /**
     * @brief Overlay the keys present in j onto config.
     */
    void json_to_config(const json &j, mailbox::EngineConfigSnapshot &config);

    json grid_to_json(const mailbox::IntensityGrid &grid);
    mailbox::IntensityGrid json_to_grid(const json &j);

    /** @brief File name used for frame index in the export directory */
    static std::string frame_file_name(long long index);

    /** @brief Manifest file name */
    static constexpr const char *MANIFEST_FILE = "frames.json";

  private:
    json read_file(const std::string &filepath);
    void write_file(const std::string &filepath, const json &j);
};
