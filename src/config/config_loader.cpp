#include "av/config/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <system_error>

namespace av::config {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

fs::path home_directory() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return {};
    }
    return fs::path(home);
}

av::Result<watch::WatchFolder> parse_folder(const json& entry, std::size_t index) {
    const std::string where = "folders[" + std::to_string(index) + "]";
    if (!entry.is_object()) {
        return av::Err<watch::WatchFolder>(Error(ErrorCode::Config, where + " must be an object"));
    }

    const auto path_it = entry.find("path");
    if (path_it == entry.end() || !path_it->is_string() || path_it->get<std::string>().empty()) {
        return av::Err<watch::WatchFolder>(Error(ErrorCode::Config, where + ".path must be a non-empty string"));
    }

    watch::WatchFolder folder;
    folder.path = resolve_path(path_it->get<std::string>());

    const auto names = entry.value("base_filenames", json::array());
    if (!names.is_array()) {
        return av::Err<watch::WatchFolder>(Error(ErrorCode::Config, where + ".base_filenames must be an array"));
    }

    for (std::size_t i = 0; i < names.size(); ++i) {
        const auto& spec = names[i];
        const std::string spec_where = where + ".base_filenames[" + std::to_string(i) + "]";
        if (!spec.is_object() || !spec.contains("name") || !spec["name"].is_string()) {
            return av::Err<watch::WatchFolder>(Error(ErrorCode::Config, spec_where + ".name must be a string"));
        }
        auto name = spec["name"].get<std::string>();
        if (name.empty() || name.find('/') != std::string::npos) {
            return av::Err<watch::WatchFolder>(
                Error(ErrorCode::Config, spec_where + ".name must be a bare filename, got '" + name + "'"));
        }
        folder.base_filenames.push_back(watch::BaseFileSpec{std::move(name)});
    }

    return av::Ok(folder);
}

} // namespace

fs::path default_config_path() {
    const auto home = home_directory();
    const fs::path base = home.empty() ? fs::current_path() : home;
    return base / ".config" / "autoversion" / "config.json";
}

fs::path resolve_path(const std::string& raw) {
    fs::path path;
    if (raw == "~" || raw.rfind("~/", 0) == 0) {
        const auto home = home_directory();
        path = home.empty() ? fs::path(raw) : home / raw.substr(raw.size() > 1 ? 2 : 1);
    } else {
        path = fs::path(raw);
    }

    if (path.is_relative()) {
        std::error_code ec;
        const auto cwd = fs::current_path(ec);
        if (!ec) {
            path = cwd / path;
        }
    }

    path = path.lexically_normal();
    if (!path.has_filename() && path.has_relative_path()) {
        path = path.parent_path();
    }
    return path;
}

json default_config_json() {
    return json{
        {"folders", json::array({
            json{
                {"path", "~/Downloads"},
                {"base_filenames", json::array({
                    json{{"name", "statement.pdf"}},
                    json{{"name", "invoice.pdf"}},
                    json{{"name", "report.pdf"}}
                })}
            }
        })}
    };
}

av::Result<Config> parse_config(const json& document) {
    if (!document.is_object()) {
        return av::Err<Config>(Error(ErrorCode::Config, "configuration root must be an object"));
    }
    const auto folders_it = document.find("folders");
    if (folders_it == document.end() || !folders_it->is_array()) {
        return av::Err<Config>(Error(ErrorCode::Config, "'folders' must be an array"));
    }

    Config config;
    for (std::size_t i = 0; i < folders_it->size(); ++i) {
        auto folder = parse_folder((*folders_it)[i], i);
        if (folder.is_error()) {
            return av::Err<Config>(folder.error());
        }
        config.folders.push_back(std::move(folder.value()));
    }
    return av::Ok(config);
}

av::Result<Config> load_config(const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        return av::Err<Config>(Error(ErrorCode::Config, "cannot open configuration file", path));
    }

    auto document = json::parse(input, nullptr, false);
    if (document.is_discarded()) {
        return av::Err<Config>(Error(ErrorCode::Config, "configuration is not valid JSON", path));
    }

    auto config = parse_config(document);
    if (config.is_error()) {
        auto error = config.error();
        error.path = path;
        return av::Err<Config>(error);
    }
    return config;
}

av::Result<Config> load_or_create_config(const fs::path& path) {
    std::error_code ec;
    const bool exists = fs::exists(path, ec);

    if (exists) {
        std::ifstream input(path);
        auto document = input ? json::parse(input, nullptr, false) : json(json::value_t::discarded);
        if (!document.is_discarded()) {
            auto config = parse_config(document);
            if (config.is_error()) {
                auto error = config.error();
                error.path = path;
                return av::Err<Config>(error);
            }
            return config;
        }
        spdlog::warn("Config error: {} is not valid JSON", path.string());
    } else {
        spdlog::warn("Config error: {} not found", path.string());
    }

    spdlog::info("Creating a new default configuration file...");
    const auto defaults = default_config_json();
    auto written = write_config(path, defaults);
    if (written.is_error()) {
        return av::Err<Config>(written.error());
    }
    spdlog::info("Created default configuration at {}", path.string());
    return parse_config(defaults);
}

av::Result<void> write_config(const fs::path& path, const json& document) {
    std::error_code ec;
    const auto parent = path.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            return av::Err<void>(Error::from_errc(ErrorCode::Config, "cannot create config directory", parent, ec));
        }
    }

    std::ofstream output(path, std::ios::trunc);
    if (!output) {
        return av::Err<void>(Error(ErrorCode::Config, "cannot write configuration file", path));
    }
    output << document.dump(4) << '\n';
    if (!output) {
        return av::Err<void>(Error(ErrorCode::Config, "failed while writing configuration file", path));
    }
    return av::Ok();
}

} // namespace av::config
