/**
 * @file RenderErrorParser.hpp
 * @brief Turns the renderer's stderr into a structured, one-line diagnostic.
 */

#pragma once
#include <optional>
#include <string>

namespace sceneloom::infrastructure {

/**
 * @struct ParsedRenderError
 * @brief What could be recovered from a failed render's stderr.
 */
struct ParsedRenderError {
    std::optional<std::string> errorType;   ///< e.g. "NameError".
    std::optional<std::string> message;     ///< e.g. "name 'Circl' is not defined".
    std::optional<int> lineNumber;          ///< 1-based line in the user's scene file.
    std::string cleanedStderr;              ///< stderr with ANSI escape codes removed.
    std::string summary;                    ///< One line suitable for a status overlay.
};

class RenderErrorParser {
public:
    /**
     * @brief Parses the last Python traceback in `stderrText`.
     * @param sceneFilePath Path of the rendered file. Frames from it are preferred
     *        when picking the line number; site-packages frames are avoided.
     */
    static ParsedRenderError Parse(const std::string& stderrText, const std::string& sceneFilePath = {});

    static std::string StripAnsi(const std::string& text);

    /** @brief Last `maxLines` lines of `text`. */
    static std::string Tail(const std::string& text, size_t maxLines);
};

} // namespace sceneloom::infrastructure
