#pragma once

#include <optional>
#include <string>
#include <vector>

namespace sceneloom::domain {

/**
 * @brief Stateless helper that inspects scene source code without executing it.
 *
 * Detection is textual: a class counts as an animation scene when one of its
 * base names (last dotted component) contains "Scene". This is a heuristic
 * tie-break, not a parser; when several scenes exist the first one in source
 * order wins.
 */
class SceneCodeInspector {
public:
    /// Entry point used when the code declares no recognizable scene class.
    static constexpr const char* kDefaultSceneName = "GeneratedScene";

    /**
     * @brief Names of all scene classes, in source order.
     */
    static std::vector<std::string> FindSceneClasses(const std::string& code);

    /**
     * @brief First scene class in source order, if any.
     */
    static std::optional<std::string> FindFirstSceneClass(const std::string& code);

    /**
     * @brief First scene class, or kDefaultSceneName.
     */
    static std::string DetectEntryPoint(const std::string& code);
};

} // namespace sceneloom::domain
