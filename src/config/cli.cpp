#include "av/config/cli.hpp"
#include "av/config/config.hpp"

#include <sstream>

namespace av::config {

av::Result<CommandLine> parse_command_line(const std::vector<std::string>& args) {
    CommandLine options;
    options.config_path = default_config_path();

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            options.show_help = true;
            continue;
        }

        const bool takes_value = arg == "-c" || arg == "--config" ||
                                 arg == "-l" || arg == "--log-level";
        if (!takes_value) {
            return av::Err<CommandLine>(Error(ErrorCode::Config, "unknown argument: " + arg));
        }
        if (i + 1 >= args.size()) {
            return av::Err<CommandLine>(Error(ErrorCode::Config, "missing value for " + arg));
        }

        const std::string& value = args[++i];
        if (arg == "-c" || arg == "--config") {
            options.config_path = resolve_path(value);
        } else {
            options.log_level = spdlog::level::from_str(value);
            if (options.log_level == spdlog::level::off && value != "off") {
                return av::Err<CommandLine>(Error(ErrorCode::Config, "unknown log level: " + value));
            }
        }
    }
    return av::Ok(options);
}

std::string usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n"
        << "  -c, --config <file>      Configuration file (default: "
        << default_config_path().string() << ")\n"
        << "  -l, --log-level <level>  trace|debug|info|warn|error|off (default: info)\n"
        << "  -h, --help               Show this help\n";
    return oss.str();
}

} // namespace av::config
