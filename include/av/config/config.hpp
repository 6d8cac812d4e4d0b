#pragma once

#include "av/core/result.hpp"
#include "av/watch/types.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace av::config {

struct Config {
    std::vector<watch::WatchFolder> folders;
};

/**
 * @brief Default location of the configuration file
 */
std::filesystem::path default_config_path();

/**
 * @brief Expand a leading "~" to $HOME, make absolute and normalize
 */
std::filesystem::path resolve_path(const std::string& raw);

/**
 * @brief Configuration written when none exists:
 * ~/Downloads tracking statement.pdf, invoice.pdf and report.pdf
 */
nlohmann::json default_config_json();

/**
 * @brief Convert parsed JSON into a validated Config
 *
 * Expected shape:
 * { "folders": [ { "path": "...", "base_filenames": [ { "name": "..." } ] } ] }
 */
av::Result<Config> parse_config(const nlohmann::json& document);

/**
 * @brief Read and parse a configuration file
 */
av::Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Load a configuration file, writing the default one if the file is
 * missing or not valid JSON
 */
av::Result<Config> load_or_create_config(const std::filesystem::path& path);

/**
 * @brief Write `document` to `path` (indent 4), creating parent directories
 */
av::Result<void> write_config(const std::filesystem::path& path, const nlohmann::json& document);

} // namespace av::config
