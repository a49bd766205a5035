// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace sceneloom::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetSettingsFile();
    static std::filesystem::path GetProjectsDir();
};

} // namespace sceneloom::infrastructure
