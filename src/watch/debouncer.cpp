#include "av/watch/debouncer.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace av::watch {

Debouncer::Debouncer(std::chrono::milliseconds cooldown, std::size_t capacity)
    : cooldown_(cooldown), capacity_(std::max<std::size_t>(capacity, 1)) {}

bool Debouncer::should_process(const std::string& path, Clock::time_point now) {
    std::lock_guard lock(mutex_);

    auto it = last_processed_.find(path);
    if (it != last_processed_.end()) {
        if (now - it->second < cooldown_) {
            return false;
        }
        it->second = now;
        return true;
    }

    if (last_processed_.size() >= capacity_) {
        evict(now);
        if (last_processed_.size() >= capacity_) {
            spdlog::debug("Debounce table over capacity: {} paths cooling down", last_processed_.size());
        }
    }
    last_processed_.emplace(path, now);
    return true;
}

std::size_t Debouncer::size() const {
    std::lock_guard lock(mutex_);
    return last_processed_.size();
}

void Debouncer::clear() {
    std::lock_guard lock(mutex_);
    last_processed_.clear();
}

void Debouncer::evict(Clock::time_point now) {
    for (auto it = last_processed_.begin(); it != last_processed_.end();) {
        if (now - it->second >= cooldown_) {
            it = last_processed_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace av::watch
