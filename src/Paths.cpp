/**
 * @file Paths.cpp
 * @brief Implementation of settings path resolution
 */

#include "jpatch/Paths.hpp"
#include "jpatch/Errors.hpp"
#include "jpatch/Util.hpp"

#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace jpatch {

namespace {
    std::optional<std::string> env_value(const char* name) {
        const char* v = std::getenv(name);
        if (v == nullptr || *v == '\0') {
            return std::nullopt;
        }
        return std::string(v);
    }

    std::string home_dir() {
#ifdef _WIN32
        auto home = env_value("USERPROFILE");
#else
        auto home = env_value("HOME");
#endif
        if (!home) {
            throw PathResolutionError("Cannot determine the user home directory");
        }
        return *home;
    }
}

std::string expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.size() == 1) {
        return home_dir();
    }
    if (path[1] == '/' || path[1] == '\\') {
        return (fs::path(home_dir()) / path.substr(2)).string();
    }
    // ~user is not expanded
    return path;
}

std::string default_settings_path() {
#if defined(_WIN32)
    auto appdata = env_value("APPDATA");
    if (!appdata) {
        throw PathResolutionError("Cannot read the APPDATA environment variable");
    }
    return (fs::path(*appdata) / "Code" / "User" / "settings.json").string();
#elif defined(__APPLE__)
    return (fs::path(home_dir()) / "Library" / "Application Support" /
            "Code" / "User" / "settings.json").string();
#else
    return (fs::path(home_dir()) / ".config" / "Code" / "User" / "settings.json").string();
#endif
}

std::string resolve_settings_path(const SettingsLocation& location) {
    if (location.override_path) {
        const std::string trimmed = trim(*location.override_path);
        if (!trimmed.empty()) {
            return expand_home(trimmed);
        }
    }
    return default_settings_path();
}

} // namespace jpatch
