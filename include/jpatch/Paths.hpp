/**
 * @file Paths.hpp
 * @brief Location of the VS Code user settings file
 *
 * Resolution order:
 * 1. A non-blank override (trimmed, leading "~" expanded)
 * 2. The per-platform default:
 *    - Windows: %APPDATA%/Code/User/settings.json
 *    - macOS:   ~/Library/Application Support/Code/User/settings.json
 *    - other:   ~/.config/Code/User/settings.json
 */

#ifndef JPATCH_PATHS_HPP
#define JPATCH_PATHS_HPP

#include <optional>
#include <string>

namespace jpatch {

/**
 * @brief Caller-supplied location settings
 */
struct SettingsLocation {
    std::optional<std::string> override_path;
};

/**
 * @brief Expand a leading "~" or "~/" using HOME (USERPROFILE on Windows)
 * @throws PathResolutionError if expansion is needed and no home is set
 */
std::string expand_home(const std::string& path);

/**
 * @brief Per-platform default settings.json path
 * @throws PathResolutionError if APPDATA / HOME is not set
 */
std::string default_settings_path();

/**
 * @brief Settings path honoring the override
 * @throws PathResolutionError if the default cannot be derived
 */
std::string resolve_settings_path(const SettingsLocation& location);

} // namespace jpatch

#endif // JPATCH_PATHS_HPP
