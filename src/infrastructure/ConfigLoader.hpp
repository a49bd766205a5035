/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving application configuration (settings.json).
 *
 * Provides a unified way to access render defaults, the renderer command and
 * the projects location without scattering JSON parsing logic throughout the
 * codebase.
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "domain/RenderTypes.hpp"

namespace sceneloom::infrastructure {

/**
 * @struct StudioSettings
 * @brief Values read from settings.json, with defaults for every missing key.
 */
struct StudioSettings {
    std::filesystem::path projectsDir;          ///< Root of the version store.
    domain::RenderConfig renderDefaults;        ///< Used when a request carries no explicit config.
    std::vector<std::string> rendererCommand{"python3", "-m", "manim", "render"};
};

class ConfigLoader {
public:
    /**
     * @brief Settings with every key at its default.
     */
    static StudioSettings Defaults();

    /**
     * @brief Reads settings.json. Missing file or keys yield defaults; a malformed
     *        file is reported on stderr and ignored.
     * @param configPath Absolute path to settings.json.
     */
    static StudioSettings Load(const std::filesystem::path& configPath);

    /**
     * @brief Writes the settings, preserving keys this class does not know about.
     * @return False if the file could not be written.
     */
    static bool Save(const std::filesystem::path& configPath, const StudioSettings& settings);
};

} // namespace sceneloom::infrastructure
