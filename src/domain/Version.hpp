/**
 * @file Version.hpp
 * @brief Immutable code snapshot within a project's history.
 */

#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace sceneloom::domain {

/**
 * @enum Provenance
 * @brief How the code of a version originated.
 */
enum class Provenance {
    AiGenerated,    ///< Produced by a code generator from a prompt.
    ManualEdit,     ///< Typed or pasted by the user.
    VariableTweak   ///< Rewritten by the variable editor.
};

inline std::string ProvenanceToString(Provenance provenance) {
    switch (provenance) {
        case Provenance::AiGenerated: return "ai-generated";
        case Provenance::ManualEdit: return "manual-edit";
        case Provenance::VariableTweak: return "variable-tweak";
    }
    return "manual-edit";
}

/**
 * @brief Parses the on-disk tag. Returns nullopt for anything outside the closed set.
 */
inline std::optional<Provenance> ProvenanceFromString(const std::string& str) {
    if (str == "ai-generated") return Provenance::AiGenerated;
    if (str == "manual-edit") return Provenance::ManualEdit;
    if (str == "variable-tweak") return Provenance::VariableTweak;
    return std::nullopt;
}

/**
 * @enum ArtifactKind
 * @brief Which artifact slot of a version an attachment fills.
 */
enum class ArtifactKind {
    Video,
    Thumbnail
};

/**
 * @struct Version
 * @brief One node of the per-project version tree.
 *
 * The code is write-once. Only videoPath / thumbnailPath may change after
 * creation, and only through VersionStore::attachArtifact.
 */
struct Version {
    std::string id;
    std::string projectId;
    std::string code;
    std::optional<std::string> prompt;             ///< Prompt that produced the code, if any.
    Provenance provenance = Provenance::ManualEdit;
    std::optional<std::string> parentId;           ///< Absent for the root of a history.
    std::chrono::system_clock::time_point createdAt;
    std::optional<std::filesystem::path> videoPath;
    std::optional<std::filesystem::path> thumbnailPath;
};

} // namespace sceneloom::domain
