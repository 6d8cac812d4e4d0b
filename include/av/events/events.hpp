/**
 * @file events.hpp
 * @brief Event types emitted by the watcher and the versioning engine
 *
 * NAMING CONVENTION:
 * - Events are past-tense: FileVersionedEvent, FilePromotedEvent
 * - Paths are absolute; filenames are bare names inside the watch folder
 */

#pragma once

#include "av/core/error.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace av::events {

// ════════════════════════════════════════════════════════
// Versioning Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted after an existing base file was archived
 *
 * WHO EMITS: VersioningEngine (archive step)
 * WHO SUBSCRIBES: LoggerComponent, MetricsComponent
 */
struct FileVersionedEvent {
    std::filesystem::path folder;
    std::string base_filename;       ///< e.g. invoice.pdf
    std::string versioned_filename;  ///< e.g. invoice_v2024-05-01_1.pdf
    std::chrono::system_clock::time_point timestamp;

    FileVersionedEvent(
        std::filesystem::path f,
        std::string base,
        std::string versioned
    ) : folder(std::move(f)),
        base_filename(std::move(base)),
        versioned_filename(std::move(versioned)),
        timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief Emitted after a variant took over the base filename
 *
 * WHO EMITS: VersioningEngine (promote step)
 * WHO SUBSCRIBES: LoggerComponent, MetricsComponent
 */
struct FilePromotedEvent {
    std::filesystem::path folder;
    std::string incoming_filename;
    std::string base_filename;
    bool archived_previous = false;
    std::chrono::system_clock::time_point timestamp;

    FilePromotedEvent(
        std::filesystem::path f,
        std::string incoming,
        std::string base,
        bool archived
    ) : folder(std::move(f)),
        incoming_filename(std::move(incoming)),
        base_filename(std::move(base)),
        archived_previous(archived),
        timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief Emitted when a matched event could not be promoted
 *
 * The event is dropped; it is never retried.
 */
struct PromotionFailedEvent {
    std::filesystem::path incoming_path;
    std::string base_filename;
    Error error;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when an event is dropped because its path is cooling down
 */
struct EventDebouncedEvent {
    std::filesystem::path path;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Lifecycle Events
// ════════════════════════════════════════════════════════

struct FolderWatchedEvent {
    std::filesystem::path folder;
    std::vector<std::string> base_filenames;
    bool created = false;  ///< Folder did not exist and was created
};

struct WatchStartedEvent {
    std::size_t folder_count;
    std::chrono::system_clock::time_point timestamp;

    explicit WatchStartedEvent(std::size_t count)
        : folder_count(count),
          timestamp(std::chrono::system_clock::now())
    {}
};

struct WatchStoppedEvent {
    std::string reason;
    std::chrono::system_clock::time_point timestamp;

    explicit WatchStoppedEvent(std::string r = "normal")
        : reason(std::move(r)),
          timestamp(std::chrono::system_clock::now())
    {}
};

} // namespace av::events
