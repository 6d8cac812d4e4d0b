#pragma once

#include "av/core/result.hpp"

#include <spdlog/common.h>

#include <filesystem>
#include <string>
#include <vector>

namespace av::config {

/**
 * @brief Options of the autoversiond command line
 */
struct CommandLine {
    std::filesystem::path config_path;
    spdlog::level::level_enum log_level = spdlog::level::info;
    bool show_help = false;
};

/**
 * @brief Parse arguments (program name excluded)
 *
 * Recognized: -c/--config <file>, -l/--log-level <level>, -h/--help.
 *
 * RETURNS: Config error naming the offending argument for unknown flags,
 * unknown levels, or a flag missing its value.
 */
av::Result<CommandLine> parse_command_line(const std::vector<std::string>& args);

std::string usage(const std::string& program);

} // namespace av::config
