/**
 * @file components.hpp
 * @brief Event-driven observers of the watcher
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Every promotion is now logged and counted
 */

#pragma once

#include "av/events/event_bus.hpp"
#include "av/events/events.hpp"

#include <atomic>
#include <cstdint>

namespace av::events {

/**
 * @brief Logger component - writes the operator-facing log lines
 *
 * Versioned: {old} → {new}
 * Updated: {incoming} → {base}
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus);
    ~LoggerComponent();

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    void on_file_versioned(const FileVersionedEvent& e);
    void on_file_promoted(const FilePromotedEvent& e);
    void on_promotion_failed(const PromotionFailedEvent& e);
    void on_event_debounced(const EventDebouncedEvent& e);
    void on_folder_watched(const FolderWatchedEvent& e);
    void on_watch_started(const WatchStartedEvent& e);
    void on_watch_stopped(const WatchStoppedEvent& e);

    EventBus& bus_;
    size_t versioned_id_ = 0;
    size_t promoted_id_ = 0;
    size_t failed_id_ = 0;
    size_t debounced_id_ = 0;
    size_t folder_id_ = 0;
    size_t started_id_ = 0;
    size_t stopped_id_ = 0;
};

/**
 * @brief Metrics component - counts what the watcher did
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.print_stats();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> files_versioned{0};
        std::atomic<uint64_t> files_promoted{0};
        std::atomic<uint64_t> promotions_failed{0};
        std::atomic<uint64_t> events_debounced{0};
    };

    explicit MetricsComponent(EventBus& bus);
    ~MetricsComponent();

    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const;

private:
    EventBus& bus_;
    Stats stats_;
    size_t versioned_id_ = 0;
    size_t promoted_id_ = 0;
    size_t failed_id_ = 0;
    size_t debounced_id_ = 0;
};

} // namespace av::events
