#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace av::watch {

/**
 * @brief Drops repeated events for the same path inside a cooldown window
 *
 * THREAD SAFETY: all members lock an internal mutex.
 *
 * MEMORY: when the map reaches `capacity`, entries whose cooldown already
 * elapsed are evicted. Entries still cooling down are never dropped, so the
 * map may exceed `capacity` for at most one cooldown while a burst of
 * distinct paths arrives.
 */
class Debouncer {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::chrono::milliseconds kDefaultCooldown{2000};
    static constexpr std::size_t kDefaultCapacity = 4096;

    explicit Debouncer(std::chrono::milliseconds cooldown = kDefaultCooldown,
                       std::size_t capacity = kDefaultCapacity);

    /**
     * @brief Decide whether an event for `path` seen at `now` should be handled
     *
     * RETURNS: false (state untouched) if the path was accepted less than one
     * cooldown ago; otherwise records `now` for the path and returns true.
     */
    bool should_process(const std::string& path, Clock::time_point now);

    bool should_process(const std::string& path) { return should_process(path, Clock::now()); }

    std::size_t size() const;

    std::chrono::milliseconds cooldown() const noexcept { return cooldown_; }

    void clear();

private:
    void evict(Clock::time_point now);

    std::chrono::milliseconds cooldown_;
    std::size_t capacity_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Clock::time_point> last_processed_;
};

} // namespace av::watch
