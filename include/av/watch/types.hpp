#pragma once

#include <filesystem>
#include <regex>
#include <string>
#include <vector>

namespace av::watch {

/**
 * @brief Exact filename tracked inside a watch folder (e.g. "invoice.pdf")
 */
struct BaseFileSpec {
    std::string name;
};

/**
 * @brief Directory whose immediate children are monitored
 *
 * Built once from configuration; immutable afterwards.
 */
struct WatchFolder {
    std::filesystem::path path;              ///< Absolute, lexically normalized
    std::vector<BaseFileSpec> base_filenames; ///< Configuration order is significant
};

enum class VariantKind {
    NumberedPrefix,        ///< (1)invoice.pdf
    CopySuffix,            ///< invoice copy.pdf, invoice_copy2.pdf
    ParenthesizedCounter,  ///< invoice (3).pdf
    SeparatorDigits,       ///< invoice_7.pdf
    CatchAll               ///< anything containing the name and ending in the extension
};

const char* to_string(VariantKind kind);

/**
 * @brief Compiled matcher bound to one base filename
 */
struct VariantPattern {
    VariantKind kind = VariantKind::CatchAll;
    std::string base_filename;
    std::regex expression;

    bool matches(const std::string& filename) const {
        return std::regex_match(filename, expression);
    }
};

/**
 * @brief Filesystem notification as delivered by a notifier
 */
struct FsEvent {
    enum class Kind {
        Created,
        MovedTo
    };

    Kind kind = Kind::Created;
    std::filesystem::path path;  ///< Resulting path (destination for moves)
};

/**
 * @brief Successful resolution of an event path to a tracked base file
 */
struct Match {
    std::filesystem::path folder;
    std::filesystem::path incoming_path;
    std::string incoming_filename;
    std::string base_filename;
    VariantKind kind = VariantKind::CatchAll;
};

} // namespace av::watch
