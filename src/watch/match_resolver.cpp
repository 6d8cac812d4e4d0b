#include "av/watch/match_resolver.hpp"
#include "av/watch/pattern_compiler.hpp"

#include <spdlog/spdlog.h>

namespace av::watch {
namespace fs = std::filesystem;
namespace {

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

MatchResolver::MatchResolver(const std::vector<WatchFolder>& folders) {
    folders_.reserve(folders.size());
    for (const auto& folder : folders) {
        folders_.push_back({normalize(folder.path), PatternCompiler::compile(folder.base_filenames)});
    }
}

std::optional<Match> MatchResolver::resolve(const fs::path& event_path) const {
    const std::string filename = event_path.filename().string();
    if (filename.empty() || is_transient_name(filename)) {
        return std::nullopt;
    }

    const auto* patterns = patterns_for(event_path.parent_path());
    if (patterns == nullptr) {
        return std::nullopt;
    }

    if (has_version_marker(filename)) {
        spdlog::debug("Skipping versioned file {}", filename);
        return std::nullopt;
    }

    for (const auto& pattern : *patterns) {
        if (!pattern.matches(filename)) {
            continue;
        }
        if (filename == pattern.base_filename) {
            return std::nullopt;
        }

        Match match;
        match.folder = normalize(event_path.parent_path());
        match.incoming_path = event_path;
        match.incoming_filename = filename;
        match.base_filename = pattern.base_filename;
        match.kind = pattern.kind;
        return match;
    }

    return std::nullopt;
}

bool MatchResolver::is_transient_name(const std::string& filename) {
    return (!filename.empty() && filename.front() == '.') ||
           ends_with(filename, ".crdownload") ||
           ends_with(filename, ".download");
}

bool MatchResolver::has_version_marker(const std::string& filename) {
    static const std::regex marker(R"(_v\d{4}-\d{2}-\d{2})");
    return std::regex_search(filename, marker);
}

fs::path MatchResolver::normalize(const fs::path& path) {
    fs::path normal = path.lexically_normal();
    if (!normal.has_filename() && normal.has_relative_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

const std::vector<VariantPattern>* MatchResolver::patterns_for(const fs::path& folder) const {
    const auto wanted = normalize(folder);
    for (const auto& entry : folders_) {
        if (entry.folder == wanted) {
            return &entry.patterns;
        }
    }
    return nullptr;
}

} // namespace av::watch
