#pragma once

#include <filesystem>
#include <string>
#include <system_error>

namespace av {

enum class ErrorCode {
    Io,                  ///< rename/stat failed for a single event
    CollisionExhausted,  ///< no free versioned name below the probe cap
    FolderSetup,         ///< watch folder missing and could not be created
    Config,              ///< configuration unreadable or malformed
    Watch                ///< notifier could not subscribe to a folder
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Io: return "io";
        case ErrorCode::CollisionExhausted: return "collision_exhausted";
        case ErrorCode::FolderSetup: return "folder_setup";
        case ErrorCode::Config: return "config";
        case ErrorCode::Watch: return "watch";
    }
    return "unknown";
}

/**
 * @brief Error value carried by av::Result
 *
 * `path` names the file or folder the failure is about, empty when the
 * error is not tied to a single path.
 */
struct Error {
    ErrorCode code = ErrorCode::Io;
    std::string message;
    std::filesystem::path path;

    Error() = default;
    Error(ErrorCode c, std::string msg, std::filesystem::path p = {})
        : code(c), message(std::move(msg)), path(std::move(p)) {}

    static Error from_errc(ErrorCode c, const std::string& what,
                           const std::filesystem::path& p, const std::error_code& ec) {
        return Error(c, what + ": " + ec.message(), p);
    }

    std::string describe() const {
        std::string text = std::string("[") + to_string(code) + "] " + message;
        if (!path.empty()) {
            text += " (" + path.string() + ")";
        }
        return text;
    }
};

} // namespace av
