#pragma once

#include "av/core/result.hpp"
#include "av/events/event_bus.hpp"
#include "av/watch/types.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace av::watch {

/**
 * @brief What a successful promotion did on disk
 */
struct PromotionOutcome {
    std::filesystem::path base_path;
    std::optional<std::filesystem::path> versioned_path;  ///< Set when a previous base file was archived
};

/**
 * @brief Archive-then-promote file operations
 *
 * Given a variant that resolved to a base filename:
 * 1. If folder/base exists, rename it to {name}_v{date}[_{n}]{ext}, probing
 *    n = 1, 2, ... until a free name is found (capped).
 * 2. Rename the variant to folder/base.
 *
 * Archive always precedes promote, so the previous content is never
 * overwritten. Renames are not retried.
 *
 * Emits FileVersionedEvent and FilePromotedEvent on the bus.
 */
class VersioningEngine {
public:
    using DateSource = std::function<std::string()>;

    static constexpr unsigned kDefaultMaxCollisions = 10000;

    explicit VersioningEngine(events::EventBus& bus,
                              DateSource today = &VersioningEngine::local_date,
                              unsigned max_collisions = kDefaultMaxCollisions);

    av::Result<PromotionOutcome> promote(const std::filesystem::path& folder,
                                         const std::filesystem::path& incoming_path,
                                         const std::string& incoming_filename,
                                         const std::string& base_filename);

    av::Result<PromotionOutcome> promote(const Match& match) {
        return promote(match.folder, match.incoming_path, match.incoming_filename, match.base_filename);
    }

    /**
     * @brief First unused archive name for `base_filename` on `date`
     */
    av::Result<std::string> next_versioned_name(const std::filesystem::path& folder,
                                                const std::string& base_filename,
                                                const std::string& date) const;

    /**
     * @brief Today's local date as YYYY-MM-DD
     */
    static std::string local_date();

private:
    events::EventBus& event_bus_;
    DateSource today_;
    unsigned max_collisions_;
};

} // namespace av::watch
