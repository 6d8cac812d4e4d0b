#pragma once

#include "av/core/result.hpp"
#include "av/watch/types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include <array>
#include <filesystem>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace av::watch {

/**
 * @brief Source of create / moved-to notifications for watch folders
 *
 * Implementations watch immediate children only (never recursive) and
 * report regular-file events; directory events are not delivered.
 */
class FileSystemNotifier {
public:
    using Callback = std::function<void(const FsEvent&)>;

    virtual ~FileSystemNotifier() = default;

    /**
     * @brief Subscribe to a folder; must be called before start()
     */
    virtual av::Result<void> watch(const std::filesystem::path& folder) = 0;

    /**
     * @brief Begin delivering events to `callback` from a background thread
     */
    virtual av::Result<void> start(Callback callback) = 0;

    /**
     * @brief Stop delivering events and release every subscription
     *
     * Idempotent. Returns after the delivery thread has exited.
     */
    virtual void stop() = 0;
};

namespace asio = boost::asio;

/**
 * @brief Linux inotify notifier driven by a Boost.Asio event loop
 *
 * The inotify descriptor is wrapped in a posix::stream_descriptor and read
 * asynchronously on a private io_context running in its own thread.
 *
 * Lifecycle:
 * 1. watch() adds IN_CREATE | IN_MOVED_TO watches
 * 2. start() begins the async read chain
 * 3. stop() closes the descriptor (dropping all watches) and joins
 */
class InotifyNotifier : public FileSystemNotifier {
public:
    InotifyNotifier();
    ~InotifyNotifier() override;

    InotifyNotifier(const InotifyNotifier&) = delete;
    InotifyNotifier& operator=(const InotifyNotifier&) = delete;

    av::Result<void> watch(const std::filesystem::path& folder) override;
    av::Result<void> start(Callback callback) override;
    void stop() override;

    std::size_t watch_count() const;

private:
    void do_read();
    void dispatch(std::size_t bytes);

    asio::io_context io_context_;
    asio::posix::stream_descriptor descriptor_;
    int init_errno_ = 0;

    Callback callback_;
    std::thread thread_;
    bool started_ = false;

    mutable std::mutex mutex_;
    std::unordered_map<int, std::filesystem::path> watches_;  // watch descriptor -> folder

    alignas(8) std::array<char, 64 * 1024> buffer_{};
};

} // namespace av::watch
