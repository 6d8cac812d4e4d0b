#include "av/config/cli.hpp"
#include "av/config/config.hpp"
#include "av/events/components.hpp"
#include "av/events/event_bus.hpp"
#include "av/watch/coordinator.hpp"
#include "av/watch/notifier.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? argv[0] : "autoversiond";
    auto options = av::config::parse_command_line(std::vector<std::string>(argv + 1, argv + argc));
    if (options.is_error()) {
        std::cerr << options.error().message << "\n" << av::config::usage(program);
        return 1;
    }
    if (options.value().show_help) {
        std::cout << av::config::usage(program);
        return 0;
    }

    spdlog::set_level(options.value().log_level);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    // Installed before startup so an early Ctrl+C still ends in a clean stop
    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);

    const auto& config_path = options.value().config_path;
    auto config = av::config::load_or_create_config(config_path);
    if (config.is_error()) {
        spdlog::error("Unusable configuration: {}", config.error().describe());
        return 1;
    }
    if (config.value().folders.empty()) {
        spdlog::warn("No folders configured in {}", config_path.string());
    }

    av::events::EventBus event_bus;
    av::events::LoggerComponent logger(event_bus);
    av::events::MetricsComponent metrics(event_bus);

    av::watch::InotifyNotifier notifier;
    av::watch::WatchCoordinator coordinator(config.value().folders, notifier, event_bus);

    auto started = coordinator.start();
    if (started.is_error()) {
        spdlog::error("Failed to start watching: {}", started.error().describe());
        return 1;
    }

    coordinator.run_until_signal(signal_context, signals);

    metrics.print_stats();
    return 0;
}
