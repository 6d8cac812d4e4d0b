#include "av/watch/notifier.hpp"

#include <spdlog/spdlog.h>

#include <sys/inotify.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

namespace av::watch {
namespace fs = std::filesystem;

InotifyNotifier::InotifyNotifier()
    : descriptor_(io_context_) {
    const int fd = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd < 0) {
        init_errno_ = errno;
        spdlog::error("inotify_init1 failed: {}", std::strerror(init_errno_));
        return;
    }
    // The stream_descriptor owns the fd from here on
    descriptor_.assign(fd);
}

InotifyNotifier::~InotifyNotifier() {
    stop();
}

av::Result<void> InotifyNotifier::watch(const fs::path& folder) {
    if (!descriptor_.is_open()) {
        return av::Err<void>(Error::from_errc(ErrorCode::Watch, "inotify unavailable", folder,
                                              std::error_code(init_errno_, std::generic_category())));
    }

    const int wd = ::inotify_add_watch(descriptor_.native_handle(), folder.c_str(),
                                       IN_CREATE | IN_MOVED_TO | IN_ONLYDIR);
    if (wd < 0) {
        return av::Err<void>(Error::from_errc(ErrorCode::Watch, "inotify_add_watch failed", folder,
                                              std::error_code(errno, std::generic_category())));
    }

    std::lock_guard lock(mutex_);
    watches_[wd] = folder;
    spdlog::debug("Watching {} (wd={})", folder.string(), wd);
    return av::Ok();
}

av::Result<void> InotifyNotifier::start(Callback callback) {
    if (!descriptor_.is_open()) {
        return av::Err<void>(Error(ErrorCode::Watch, "inotify descriptor is not open"));
    }
    if (started_) {
        return av::Err<void>(Error(ErrorCode::Watch, "notifier already started"));
    }

    callback_ = std::move(callback);
    started_ = true;
    do_read();
    thread_ = std::thread([this]() {
        io_context_.run();
        spdlog::debug("inotify event loop exited");
    });
    return av::Ok();
}

void InotifyNotifier::stop() {
    if (started_) {
        // Close on the loop thread so the pending read completes with operation_aborted
        asio::post(io_context_, [this]() {
            boost::system::error_code ec;
            descriptor_.cancel(ec);
            descriptor_.close(ec);
        });
        if (thread_.joinable()) {
            thread_.join();
        }
        started_ = false;
    } else if (descriptor_.is_open()) {
        boost::system::error_code ec;
        descriptor_.close(ec);
    }

    std::lock_guard lock(mutex_);
    watches_.clear();
}

std::size_t InotifyNotifier::watch_count() const {
    std::lock_guard lock(mutex_);
    return watches_.size();
}

void InotifyNotifier::do_read() {
    descriptor_.async_read_some(
        asio::buffer(buffer_),
        [this](boost::system::error_code ec, std::size_t bytes_transferred) {
            if (!ec) {
                dispatch(bytes_transferred);
                do_read();
            } else if (ec != asio::error::operation_aborted) {
                spdlog::error("inotify read error: {}", ec.message());
            }
        });
}

void InotifyNotifier::dispatch(std::size_t bytes) {
    std::size_t offset = 0;
    while (offset + sizeof(inotify_event) <= bytes) {
        const auto* event = reinterpret_cast<const inotify_event*>(buffer_.data() + offset);
        offset += sizeof(inotify_event) + event->len;

        if (event->mask & IN_Q_OVERFLOW) {
            spdlog::warn("inotify queue overflowed; some events were lost");
            continue;
        }
        if ((event->mask & IN_ISDIR) || event->len == 0) {
            continue;
        }

        fs::path folder;
        {
            std::lock_guard lock(mutex_);
            auto it = watches_.find(event->wd);
            if (it == watches_.end()) {
                continue;
            }
            folder = it->second;
        }

        FsEvent fs_event;
        fs_event.kind = (event->mask & IN_MOVED_TO) ? FsEvent::Kind::MovedTo : FsEvent::Kind::Created;
        fs_event.path = folder / std::string(event->name);
        callback_(fs_event);
    }
}

} // namespace av::watch
