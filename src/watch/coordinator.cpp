#include "av/watch/coordinator.hpp"
#include "av/events/events.hpp"

#include <spdlog/spdlog.h>

#include <csignal>
#include <exception>
#include <system_error>

namespace av::watch {
namespace fs = std::filesystem;

WatchCoordinator::WatchCoordinator(std::vector<WatchFolder> folders,
                                   FileSystemNotifier& notifier,
                                   events::EventBus& bus,
                                   CoordinatorOptions options)
    : folders_(std::move(folders)),
      notifier_(notifier),
      event_bus_(bus),
      debouncer_(options.cooldown, options.debounce_capacity),
      resolver_(folders_),
      engine_(bus, std::move(options.today), options.max_collisions),
      queue_(options.queue_capacity) {}

WatchCoordinator::~WatchCoordinator() {
    stop("shutdown");
}

av::Result<bool> WatchCoordinator::ensure_folder(const fs::path& folder) {
    std::error_code ec;
    const auto status = fs::status(folder, ec);
    if (fs::exists(status)) {
        if (!fs::is_directory(status)) {
            return av::Err<bool>(Error(ErrorCode::FolderSetup, "Watch path is not a directory", folder));
        }
        return av::Ok(false);
    }

    fs::create_directories(folder, ec);
    if (ec) {
        return av::Err<bool>(Error::from_errc(ErrorCode::FolderSetup, "Failed to create watch folder", folder, ec));
    }
    return av::Ok(true);
}

av::Result<void> WatchCoordinator::start() {
    if (running_) {
        return av::Ok();
    }

    for (const auto& folder : folders_) {
        auto created = ensure_folder(folder.path);
        if (created.is_error()) {
            notifier_.stop();
            return av::Err<void>(created.error());
        }

        auto watched = notifier_.watch(folder.path);
        if (watched.is_error()) {
            notifier_.stop();
            return watched;
        }

        events::FolderWatchedEvent evt;
        evt.folder = folder.path;
        evt.created = created.value();
        for (const auto& spec : folder.base_filenames) {
            evt.base_filenames.push_back(spec.name);
        }
        event_bus_.emit(evt);
    }

    stopping_ = false;
    queue_.reset();
    dispatch_thread_ = std::thread([this]() { dispatch_loop(); });

    auto started = notifier_.start([this](const FsEvent& event) {
        if (!queue_.push(event)) {
            spdlog::debug("Dropping event for {}: dispatcher stopped", event.path.string());
        }
    });
    if (started.is_error()) {
        stopping_ = true;
        queue_.shutdown();
        dispatch_thread_.join();
        notifier_.stop();
        return started;
    }

    running_ = true;
    event_bus_.emit(events::WatchStartedEvent{folders_.size()});
    return av::Ok();
}

void WatchCoordinator::stop(const std::string& reason) {
    if (!running_.exchange(false)) {
        return;
    }

    stopping_ = true;
    const auto dropped = queue_.clear();
    queue_.shutdown();  // also unblocks a notifier stuck in push()
    notifier_.stop();
    if (dispatch_thread_.joinable()) {
        dispatch_thread_.join();
    }
    if (dropped > 0) {
        spdlog::debug("Discarded {} queued event(s) on stop", dropped);
    }

    event_bus_.emit(events::WatchStoppedEvent{reason});
}

void WatchCoordinator::run_until_signal(asio::io_context& io_context, asio::signal_set& signals) {
    signals.async_wait([this](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        stop(signal_number == SIGINT ? "SIGINT" : "SIGTERM");
    });
    io_context.run();
}

bool WatchCoordinator::process(const fs::path& path) {
    std::lock_guard lock(process_mutex_);

    if (!debouncer_.should_process(path.string())) {
        event_bus_.emit(events::EventDebouncedEvent{path});
        return false;
    }

    auto match = resolver_.resolve(path);
    if (!match) {
        return false;
    }

    spdlog::debug("{} matched {} ({})", match->incoming_filename, match->base_filename, to_string(match->kind));

    auto outcome = engine_.promote(*match);
    if (outcome.is_error()) {
        event_bus_.emit(events::PromotionFailedEvent{match->incoming_path, match->base_filename, outcome.error()});
        return false;
    }
    return true;
}

void WatchCoordinator::dispatch_loop() {
    while (auto event = queue_.pop()) {
        if (stopping_) {
            break;
        }
        try {
            process(event->path);
        } catch (const std::exception& e) {
            spdlog::error("Unexpected error while handling {}: {}", event->path.string(), e.what());
        }
    }
    spdlog::debug("Dispatch loop exited");
}

} // namespace av::watch
