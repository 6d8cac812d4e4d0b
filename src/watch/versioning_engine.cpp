#include "av/watch/versioning_engine.hpp"
#include "av/events/events.hpp"
#include "av/watch/pattern_compiler.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace av::watch {
namespace fs = std::filesystem;

VersioningEngine::VersioningEngine(events::EventBus& bus, DateSource today, unsigned max_collisions)
    : event_bus_(bus),
      today_(std::move(today)),
      max_collisions_(max_collisions) {}

av::Result<PromotionOutcome> VersioningEngine::promote(const fs::path& folder,
                                                       const fs::path& incoming_path,
                                                       const std::string& incoming_filename,
                                                       const std::string& base_filename) {
    PromotionOutcome outcome;
    outcome.base_path = folder / base_filename;

    std::error_code ec;
    if (!fs::is_regular_file(incoming_path, ec)) {
        // Checked before archiving so the base slot is never emptied for nothing
        return av::Err<PromotionOutcome>(
            Error(ErrorCode::Io, "Incoming file is gone or not a regular file", incoming_path));
    }

    const bool base_exists = fs::exists(outcome.base_path, ec);
    if (ec) {
        return av::Err<PromotionOutcome>(
            Error::from_errc(ErrorCode::Io, "Failed to stat base file", outcome.base_path, ec));
    }

    if (base_exists) {
        auto name = next_versioned_name(folder, base_filename, today_());
        if (name.is_error()) {
            return av::Err<PromotionOutcome>(name.error());
        }

        const fs::path versioned_path = folder / name.value();
        fs::rename(outcome.base_path, versioned_path, ec);
        if (ec) {
            return av::Err<PromotionOutcome>(
                Error::from_errc(ErrorCode::Io, "Failed to archive " + base_filename, outcome.base_path, ec));
        }
        outcome.versioned_path = versioned_path;
        event_bus_.emit(events::FileVersionedEvent{folder, base_filename, name.value()});
    }

    fs::rename(incoming_path, outcome.base_path, ec);
    if (ec) {
        // The archive (if any) stays in place; the previous content is preserved
        return av::Err<PromotionOutcome>(
            Error::from_errc(ErrorCode::Io, "Failed to promote " + incoming_filename, incoming_path, ec));
    }
    event_bus_.emit(events::FilePromotedEvent{folder, incoming_filename, base_filename, base_exists});

    return av::Ok(outcome);
}

av::Result<std::string> VersioningEngine::next_versioned_name(const fs::path& folder,
                                                              const std::string& base_filename,
                                                              const std::string& date) const {
    const auto [name, ext] = PatternCompiler::split_name(base_filename);
    const std::string stem = name + "_v" + date;

    std::string candidate = stem + ext;
    std::error_code ec;
    for (unsigned counter = 1; fs::exists(folder / candidate, ec); ++counter) {
        if (counter > max_collisions_) {
            return av::Err<std::string>(
                Error(ErrorCode::CollisionExhausted,
                      "No free versioned name after " + std::to_string(max_collisions_) + " attempts",
                      folder / base_filename));
        }
        candidate = stem + "_" + std::to_string(counter) + ext;
    }
    if (ec) {
        return av::Err<std::string>(
            Error::from_errc(ErrorCode::Io, "Failed to probe versioned name", folder / candidate, ec));
    }
    return av::Ok(candidate);
}

std::string VersioningEngine::local_date() {
    const std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d");
    return oss.str();
}

} // namespace av::watch
