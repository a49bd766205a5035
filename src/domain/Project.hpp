/**
 * @file Project.hpp
 * @brief Domain entity for a user-level container of one animation's history.
 */

#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace sceneloom::domain {

/**
 * @struct Project
 * @brief Metadata of a project. Versions live beneath its storage location.
 */
struct Project {
    std::string id;                                   ///< Opaque unique identifier.
    std::string name;                                 ///< Display name.
    std::string description;
    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point updatedAt;
    std::optional<std::string> currentVersionId;      ///< Version shown in the editor, if any.
    std::filesystem::path directory;                  ///< Backing storage location.
};

} // namespace sceneloom::domain
