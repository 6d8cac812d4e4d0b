#pragma once

#include "av/watch/types.hpp"

#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace av::watch {

/**
 * @brief Maps an event path to the tracked base file it is a variant of
 *
 * Patterns are compiled once in the constructor. Folder lookup is by exact
 * (normalized) directory, never by prefix, so files in subfolders of a watch
 * folder are ignored.
 */
class MatchResolver {
public:
    explicit MatchResolver(const std::vector<WatchFolder>& folders);

    /**
     * @brief Resolve an event path
     *
     * RETURNS: the match, or nullopt when the file is hidden, still
     * downloading, outside every watch folder, a versioned archive, the base
     * file itself, or untracked.
     */
    std::optional<Match> resolve(const std::filesystem::path& event_path) const;

    /**
     * @brief True for names that denote an incomplete or hidden file
     */
    static bool is_transient_name(const std::string& filename);

    /**
     * @brief True if the name carries a `_vYYYY-MM-DD` version marker
     */
    static bool has_version_marker(const std::string& filename);

    /**
     * @brief Lexically normalize a directory path, dropping a trailing separator
     */
    static std::filesystem::path normalize(const std::filesystem::path& path);

    const std::vector<VariantPattern>* patterns_for(const std::filesystem::path& folder) const;

private:
    struct FolderPatterns {
        std::filesystem::path folder;
        std::vector<VariantPattern> patterns;
    };

    std::vector<FolderPatterns> folders_;
};

} // namespace av::watch
