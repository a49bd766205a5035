#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace sceneloom::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetDataHome() {
    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && *xdgDataHome) {
        return fs::path(xdgDataHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".local" / "share";
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetSettingsFile() {
    return GetConfigHome() / "sceneloom" / "settings.json";
}

// Not created here: the version store creates it on first write and reports
// a StorageError if that fails.
fs::path PathUtils::GetProjectsDir() {
    return GetDataHome() / "sceneloom" / "projects";
}

} // namespace sceneloom::infrastructure
