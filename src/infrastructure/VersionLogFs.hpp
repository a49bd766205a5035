/**
 * @file VersionLogFs.hpp
 * @brief Append-only, file-system based log of version events for one project.
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sceneloom::infrastructure {

/**
 * @struct VersionLogEntry
 * @brief One line of `<project>/versions.ndjson`.
 */
struct VersionLogEntry {
    static constexpr const char* VersionCreated = "VersionCreated";
    static constexpr const char* ArtifactAttached = "ArtifactAttached";

    std::string type;                       ///< VersionCreated or ArtifactAttached.
    std::string versionId;
    std::optional<std::string> parentId;    ///< VersionCreated only.
    std::string artifactKind;               ///< ArtifactAttached only: "video" / "thumbnail".
    std::string artifactPath;               ///< ArtifactAttached only.
    std::chrono::system_clock::time_point timestamp;
};

/**
 * @class VersionLogFs
 * @brief Reads and appends the newline-delimited JSON log that orders a project's versions.
 *
 * The log is the index of the version tree: creation order is line order, so
 * listing versions never needs a directory scan.
 */
class VersionLogFs {
public:
    explicit VersionLogFs(std::filesystem::path projectDir);

    /** @throws domain::StorageError */
    void append(const VersionLogEntry& entry);

    /** @brief All well-formed entries in file order. Malformed lines are reported and skipped. */
    std::vector<VersionLogEntry> readAll() const;

    /** @brief Replaces the whole log (used when rebuilding from version records). */
    void rewrite(const std::vector<VersionLogEntry>& entries);

    bool exists() const;

private:
    std::filesystem::path m_logPath;
};

} // namespace sceneloom::infrastructure
