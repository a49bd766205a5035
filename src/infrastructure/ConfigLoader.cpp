/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/AtomicFile.hpp"
#include "infrastructure/PathUtils.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace sceneloom::infrastructure {

StudioSettings ConfigLoader::Defaults() {
    StudioSettings settings;
    settings.projectsDir = PathUtils::GetProjectsDir();
    return settings;
}

StudioSettings ConfigLoader::Load(const std::filesystem::path& configPath) {
    StudioSettings settings = Defaults();
    if (!std::filesystem::exists(configPath)) {
        return settings;
    }

    nlohmann::json j;
    try {
        std::ifstream f(configPath);
        f >> j;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what() << std::endl;
        return settings;
    }
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] Ignoring " << configPath << ": top level is not an object" << std::endl;
        return settings;
    }

    try {
        if (j.contains("projects_dir")) {
            settings.projectsDir = j["projects_dir"].get<std::string>();
        }

        if (j.contains("default_quality")) {
            std::string quality = j["default_quality"].get<std::string>();
            if (auto parsed = domain::QualityFromString(quality)) {
                settings.renderDefaults.quality = *parsed;
            } else {
                std::cerr << "[ConfigLoader] Unknown quality '" << quality << "', using low" << std::endl;
            }
        }

        if (j.contains("output_format")) {
            std::string format = j["output_format"].get<std::string>();
            if (auto parsed = domain::FormatFromString(format)) {
                settings.renderDefaults.format = *parsed;
            } else {
                std::cerr << "[ConfigLoader] Unknown output format '" << format << "', using mp4" << std::endl;
            }
        }

        if (j.contains("render_timeout")) {
            int seconds = j["render_timeout"].get<int>();
            if (seconds > 0) {
                settings.renderDefaults.timeout = std::chrono::seconds(seconds);
            } else {
                std::cerr << "[ConfigLoader] Ignoring non-positive render_timeout " << seconds << std::endl;
            }
        }

        settings.renderDefaults.disableCaching = j.value("disable_caching", settings.renderDefaults.disableCaching);

        if (j.contains("renderer_command")) {
            auto command = j["renderer_command"].get<std::vector<std::string>>();
            if (!command.empty()) {
                settings.rendererCommand = std::move(command);
            }
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Invalid value in " << configPath << ": " << e.what() << std::endl;
    }

    return settings;
}

bool ConfigLoader::Save(const std::filesystem::path& configPath, const StudioSettings& settings) {
    nlohmann::json j = nlohmann::json::object();

    // Try to load existing to preserve other settings
    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
            if (!j.is_object()) j = nlohmann::json::object();
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Overwriting unreadable " << configPath << ": " << e.what() << std::endl;
            j = nlohmann::json::object();
        }
    }

    j["projects_dir"] = settings.projectsDir.string();
    j["default_quality"] = domain::QualityToString(settings.renderDefaults.quality);
    j["output_format"] = domain::FormatExtension(settings.renderDefaults.format);
    j["render_timeout"] = std::chrono::duration_cast<std::chrono::seconds>(settings.renderDefaults.timeout).count();
    j["disable_caching"] = settings.renderDefaults.disableCaching;
    j["renderer_command"] = settings.rendererCommand;

    try {
        WriteTextAtomic(configPath, j.dump(4));
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error writing settings.json: " << e.what() << std::endl;
        return false;
    }
}

} // namespace sceneloom::infrastructure
