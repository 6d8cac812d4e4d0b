#pragma once

#include "av/core/result.hpp"
#include "av/events/event_bus.hpp"
#include "av/events/event_queue.hpp"
#include "av/watch/debouncer.hpp"
#include "av/watch/match_resolver.hpp"
#include "av/watch/notifier.hpp"
#include "av/watch/types.hpp"
#include "av/watch/versioning_engine.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace av::watch {

struct CoordinatorOptions {
    std::chrono::milliseconds cooldown = Debouncer::kDefaultCooldown;
    std::size_t debounce_capacity = Debouncer::kDefaultCapacity;
    std::size_t queue_capacity = events::ThreadSafeQueue<FsEvent>::kDefaultCapacity;
    unsigned max_collisions = VersioningEngine::kDefaultMaxCollisions;
    VersioningEngine::DateSource today = &VersioningEngine::local_date;
};

/**
 * @brief Owns the watch folders and runs the event pipeline
 *
 * notifier thread ──push──▶ bounded queue ──pop──▶ dispatch thread
 *                                                  Debouncer → MatchResolver → VersioningEngine
 *
 * All promotions happen on the single dispatch thread, so archive and
 * promote for a base file are never interleaved with another event.
 *
 * THREAD SAFETY: start()/stop() from one controlling thread; process() is
 * safe from any thread (serialized internally).
 */
class WatchCoordinator {
public:
    WatchCoordinator(std::vector<WatchFolder> folders,
                     FileSystemNotifier& notifier,
                     events::EventBus& bus,
                     CoordinatorOptions options = {});
    ~WatchCoordinator();

    WatchCoordinator(const WatchCoordinator&) = delete;
    WatchCoordinator& operator=(const WatchCoordinator&) = delete;

    /**
     * @brief Create missing folders, subscribe to them and start dispatching
     *
     * RETURNS: FolderSetup / Watch error if any folder cannot be created or
     * watched. Nothing is left running on error.
     */
    av::Result<void> start();

    /**
     * @brief Stop the notifier, finish the in-flight event, drop queued ones
     *
     * Idempotent.
     */
    void stop(const std::string& reason = "stop requested");

    /**
     * @brief Block until `signals` fires (SIGINT or SIGTERM), then stop()
     *
     * The caller installs `signals` before start(); a signal that arrives in
     * between is queued by the set and handled here at once.
     */
    void run_until_signal(asio::io_context& io_context, asio::signal_set& signals);

    /**
     * @brief Run one event path through debounce, resolve and promote
     *
     * RETURNS: true if a promotion happened
     */
    bool process(const std::filesystem::path& path);

    bool running() const noexcept { return running_.load(); }

    const std::vector<WatchFolder>& folders() const noexcept { return folders_; }

    const Debouncer& debouncer() const noexcept { return debouncer_; }

    /**
     * @brief Ensure a folder exists, creating it (and parents) if missing
     *
     * RETURNS: true if the folder was created
     */
    static av::Result<bool> ensure_folder(const std::filesystem::path& folder);

private:
    void dispatch_loop();

    std::vector<WatchFolder> folders_;
    FileSystemNotifier& notifier_;
    events::EventBus& event_bus_;

    Debouncer debouncer_;
    MatchResolver resolver_;
    VersioningEngine engine_;

    events::ThreadSafeQueue<FsEvent> queue_;
    std::thread dispatch_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};

    std::mutex process_mutex_;
};

} // namespace av::watch
