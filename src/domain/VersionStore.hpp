/**
 * @file VersionStore.hpp
 * @brief Interface for durable, append-only storage of projects and versions.
 */

#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/Project.hpp"
#include "domain/Version.hpp"

namespace sceneloom::domain {

/**
 * @class VersionStoreListener
 * @brief Observer for changes made through a VersionStore instance.
 *
 * Callbacks run synchronously on the thread that performed the change.
 */
class VersionStoreListener {
public:
    virtual ~VersionStoreListener() = default;

    virtual void onProjectCreated(const Project& project) { (void)project; }
    virtual void onProjectDeleted(const std::string& projectId) { (void)projectId; }
    virtual void onVersionCreated(const Version& version) { (void)version; }
    virtual void onArtifactAttached(const Version& version, ArtifactKind kind) { (void)version; (void)kind; }
};

/**
 * @class VersionStore
 * @brief Abstract interface for the project / version history.
 *
 * Errors are reported with the exceptions of domain/Errors.hpp.
 */
class VersionStore {
public:
    virtual ~VersionStore() = default;

    /**
     * @brief Allocates an identifier, creates backing storage and writes metadata.
     * @throws StorageError if the storage location is not writable.
     */
    virtual Project createProject(const std::string& name, const std::string& description) = 0;

    /**
     * @brief Loads project metadata.
     * @throws NotFoundError if absent, CorruptRecordError if unreadable.
     */
    virtual Project openProject(const std::string& projectId) = 0;

    /** @brief All readable projects, most recently updated first. */
    virtual std::vector<Project> listProjects() = 0;

    /** @brief Changes name and description, bumping the update time. */
    virtual Project updateProject(const std::string& projectId, const std::string& name, const std::string& description) = 0;

    /**
     * @brief Points the project at one of its versions.
     * @throws NotFoundError if the version does not belong to the project.
     */
    virtual Project setCurrentVersion(const std::string& projectId, const std::string& versionId) = 0;

    /** @brief Removes the project and every version beneath it. Idempotent. */
    virtual void deleteProject(const std::string& projectId) = 0;

    /**
     * @brief Appends a new code snapshot to the project's history.
     * @throws ParentNotFoundError if parentId does not name a version of projectId.
     */
    virtual Version createVersion(const std::string& projectId,
                                  const std::string& code,
                                  const std::optional<std::string>& prompt,
                                  Provenance provenance,
                                  const std::optional<std::string>& parentId) = 0;

    /** @throws NotFoundError, CorruptRecordError */
    virtual Version getVersion(const std::string& projectId, const std::string& versionId) = 0;

    /** @brief Versions of a project in creation order, oldest first. */
    virtual std::vector<Version> listVersions(const std::string& projectId) = 0;

    /** @brief Last version in creation order. */
    virtual std::optional<Version> latestVersion(const std::string& projectId) = 0;

    /**
     * @brief The one permitted post-creation mutation: records a rendered artifact.
     * @throws NotFoundError if the version does not exist.
     */
    virtual Version attachArtifact(const std::string& projectId,
                                   const std::string& versionId,
                                   const std::filesystem::path& artifactPath,
                                   ArtifactKind kind = ArtifactKind::Video) = 0;

    virtual void subscribe(std::shared_ptr<VersionStoreListener> listener) = 0;
};

} // namespace sceneloom::domain
