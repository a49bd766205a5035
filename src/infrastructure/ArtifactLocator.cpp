/**
 * @file ArtifactLocator.cpp
 * @brief Implementation of the ArtifactLocator.
 */

#include "infrastructure/ArtifactLocator.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace sceneloom::infrastructure {

bool ArtifactLocator::IsVideoExtension(const std::string& extension) {
    std::string ext = extension;
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return std::tolower(c); });
    return ext == ".mp4" || ext == ".mov" || ext == ".webm" || ext == ".gif";
}

fs::path ArtifactLocator::ExpectedPath(const std::string& stem,
                                       const std::string& entryPointName,
                                       domain::QualityPreset quality,
                                       const fs::path& searchRoot,
                                       domain::OutputFormat format) {
    return searchRoot / "videos" / stem / domain::QualityDirectory(quality)
        / (entryPointName + "." + domain::FormatExtension(format));
}

std::optional<fs::path> ArtifactLocator::Locate(const std::string& stem,
                                                const std::string& entryPointName,
                                                const std::string& qualityName,
                                                const fs::path& searchRoot,
                                                domain::OutputFormat format) {
    auto quality = domain::QualityFromString(qualityName).value_or(domain::QualityPreset::Low);
    return Locate(stem, entryPointName, quality, searchRoot, format);
}

std::optional<fs::path> ArtifactLocator::Locate(const std::string& stem,
                                                const std::string& entryPointName,
                                                domain::QualityPreset quality,
                                                const fs::path& searchRoot,
                                                domain::OutputFormat format) {
    std::error_code ec;
    fs::path expected = ExpectedPath(stem, entryPointName, quality, searchRoot, format);
    if (fs::is_regular_file(expected, ec)) {
        return expected;
    }

    fs::path stemDir = searchRoot / "videos" / stem;
    if (!fs::is_directory(stemDir, ec)) {
        return std::nullopt;
    }

    std::optional<fs::path> found;
    size_t candidates = 0;
    for (fs::recursive_directory_iterator it(stemDir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        // Renderer writes partial movie files next to the final one; those are not results.
        if (it.depth() >= 1) {
            fs::path rel = it->path().lexically_relative(stemDir);
            if (std::find(rel.begin(), rel.end(), fs::path("partial_movie_files")) != rel.end()) continue;
        }
        if (!IsVideoExtension(it->path().extension().string())) continue;
        if (!found) found = it->path();
        ++candidates;
    }
    if (ec) {
        std::cerr << "[ArtifactLocator] Error scanning " << stemDir << ": " << ec.message() << std::endl;
    }

    if (found && candidates > 1) {
        std::cerr << "[ArtifactLocator] " << candidates << " candidate videos under " << stemDir
                  << ", picked " << *found << std::endl;
    }
    return found;
}

} // namespace sceneloom::infrastructure
