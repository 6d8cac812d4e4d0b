#include "av/events/components.hpp"

#include <spdlog/spdlog.h>

#include <string>

namespace av::events {
namespace {

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) {
            out += ", ";
        }
        out += item;
    }
    return out;
}

} // namespace

LoggerComponent::LoggerComponent(EventBus& bus) : bus_(bus) {
    versioned_id_ = bus_.subscribe<FileVersionedEvent>([this](const FileVersionedEvent& e) {
        on_file_versioned(e);
    });

    promoted_id_ = bus_.subscribe<FilePromotedEvent>([this](const FilePromotedEvent& e) {
        on_file_promoted(e);
    });

    failed_id_ = bus_.subscribe<PromotionFailedEvent>([this](const PromotionFailedEvent& e) {
        on_promotion_failed(e);
    });

    debounced_id_ = bus_.subscribe<EventDebouncedEvent>([this](const EventDebouncedEvent& e) {
        on_event_debounced(e);
    });

    folder_id_ = bus_.subscribe<FolderWatchedEvent>([this](const FolderWatchedEvent& e) {
        on_folder_watched(e);
    });

    started_id_ = bus_.subscribe<WatchStartedEvent>([this](const WatchStartedEvent& e) {
        on_watch_started(e);
    });

    stopped_id_ = bus_.subscribe<WatchStoppedEvent>([this](const WatchStoppedEvent& e) {
        on_watch_stopped(e);
    });
}

LoggerComponent::~LoggerComponent() {
    bus_.unsubscribe<FileVersionedEvent>(versioned_id_);
    bus_.unsubscribe<FilePromotedEvent>(promoted_id_);
    bus_.unsubscribe<PromotionFailedEvent>(failed_id_);
    bus_.unsubscribe<EventDebouncedEvent>(debounced_id_);
    bus_.unsubscribe<FolderWatchedEvent>(folder_id_);
    bus_.unsubscribe<WatchStartedEvent>(started_id_);
    bus_.unsubscribe<WatchStoppedEvent>(stopped_id_);
}

void LoggerComponent::on_file_versioned(const FileVersionedEvent& e) {
    spdlog::info("Versioned: {} → {}", e.base_filename, e.versioned_filename);
}

void LoggerComponent::on_file_promoted(const FilePromotedEvent& e) {
    spdlog::info("Updated: {} → {}", e.incoming_filename, e.base_filename);
}

void LoggerComponent::on_promotion_failed(const PromotionFailedEvent& e) {
    spdlog::error("Failed to update {} from {}: {}",
                  e.base_filename, e.incoming_path.string(), e.error.describe());
}

void LoggerComponent::on_event_debounced(const EventDebouncedEvent& e) {
    spdlog::debug("Debounced event for {}", e.path.string());
}

void LoggerComponent::on_folder_watched(const FolderWatchedEvent& e) {
    if (e.created) {
        spdlog::warn("Folder {} did not exist and was created", e.folder.string());
    }
    spdlog::info("Monitoring folder: {}", e.folder.string());
    spdlog::info("  Base filenames: [{}]", join(e.base_filenames));
}

void LoggerComponent::on_watch_started(const WatchStartedEvent& e) {
    spdlog::info("autoversion is running on {} folder(s). Press Ctrl+C to stop", e.folder_count);
}

void LoggerComponent::on_watch_stopped(const WatchStoppedEvent& e) {
    spdlog::info("Watcher stopped: {}", e.reason);
}

MetricsComponent::MetricsComponent(EventBus& bus) : bus_(bus) {
    versioned_id_ = bus_.subscribe<FileVersionedEvent>([this](const FileVersionedEvent&) {
        stats_.files_versioned++;
    });

    promoted_id_ = bus_.subscribe<FilePromotedEvent>([this](const FilePromotedEvent&) {
        stats_.files_promoted++;
    });

    failed_id_ = bus_.subscribe<PromotionFailedEvent>([this](const PromotionFailedEvent&) {
        stats_.promotions_failed++;
    });

    debounced_id_ = bus_.subscribe<EventDebouncedEvent>([this](const EventDebouncedEvent&) {
        stats_.events_debounced++;
    });
}

MetricsComponent::~MetricsComponent() {
    bus_.unsubscribe<FileVersionedEvent>(versioned_id_);
    bus_.unsubscribe<FilePromotedEvent>(promoted_id_);
    bus_.unsubscribe<PromotionFailedEvent>(failed_id_);
    bus_.unsubscribe<EventDebouncedEvent>(debounced_id_);
}

void MetricsComponent::print_stats() const {
    spdlog::info("═══════════════════════════════════════");
    spdlog::info("Session Statistics:");
    spdlog::info("  Files versioned:   {}", stats_.files_versioned.load());
    spdlog::info("  Files updated:     {}", stats_.files_promoted.load());
    spdlog::info("  Failed updates:    {}", stats_.promotions_failed.load());
    spdlog::info("  Debounced events:  {}", stats_.events_debounced.load());
    spdlog::info("═══════════════════════════════════════");
}

} // namespace av::events
