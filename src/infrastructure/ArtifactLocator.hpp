/**
 * @file ArtifactLocator.hpp
 * @brief Finds the video the renderer produced for a scene.
 */

#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "domain/RenderTypes.hpp"

namespace sceneloom::infrastructure {

/**
 * @class ArtifactLocator
 * @brief Maps (source stem, entry point, quality) to the renderer's output file.
 *
 * The renderer writes to `<root>/videos/<stem>/<qualityDir>/<entry>.<ext>`.
 * When that file is missing but `<root>/videos/<stem>` exists, the directory
 * is scanned recursively and the first file with a known video extension in
 * traversal order is returned. That fallback is a heuristic: with several
 * candidates the pick is arbitrary.
 */
class ArtifactLocator {
public:
    static std::optional<std::filesystem::path> Locate(const std::string& stem,
                                                       const std::string& entryPointName,
                                                       domain::QualityPreset quality,
                                                       const std::filesystem::path& searchRoot,
                                                       domain::OutputFormat format = domain::OutputFormat::Mp4);

    /**
     * @brief Same as above with the preset given by name; unknown names use the low preset.
     */
    static std::optional<std::filesystem::path> Locate(const std::string& stem,
                                                       const std::string& entryPointName,
                                                       const std::string& qualityName,
                                                       const std::filesystem::path& searchRoot,
                                                       domain::OutputFormat format = domain::OutputFormat::Mp4);

    /** @brief Path the renderer is expected to write, whether or not it exists. */
    static std::filesystem::path ExpectedPath(const std::string& stem,
                                              const std::string& entryPointName,
                                              domain::QualityPreset quality,
                                              const std::filesystem::path& searchRoot,
                                              domain::OutputFormat format);

    static bool IsVideoExtension(const std::string& extension);
};

} // namespace sceneloom::infrastructure
