/**
 * @file FileVersionStore.hpp
 * @brief Filesystem-based implementation of the VersionStore.
 */

#pragma once
#include "domain/VersionStore.hpp"
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace sceneloom::infrastructure {

/**
 * @class FileVersionStore
 * @brief Stores projects and versions as JSON records beneath a projects root.
 *
 * Layout:
 *   <root>/<project>/project.json
 *   <root>/<project>/versions.ndjson              (ordered version log)
 *   <root>/<project>/versions/<version>/version.json
 *   <root>/<project>/versions/<version>/scene.py
 *   <root>/<project>/versions/<version>/output/   (copied-in artifacts)
 *
 * Writers to the same project are serialized by a per-project mutex;
 * different projects never contend.
 */
class FileVersionStore : public domain::VersionStore {
public:
    /**
     * @param projectsRoot Directory holding one subdirectory per project. Created on first write.
     */
    explicit FileVersionStore(std::filesystem::path projectsRoot);

    domain::Project createProject(const std::string& name, const std::string& description) override;
    domain::Project openProject(const std::string& projectId) override;
    std::vector<domain::Project> listProjects() override;
    domain::Project updateProject(const std::string& projectId, const std::string& name, const std::string& description) override;
    domain::Project setCurrentVersion(const std::string& projectId, const std::string& versionId) override;
    void deleteProject(const std::string& projectId) override;

    domain::Version createVersion(const std::string& projectId,
                                  const std::string& code,
                                  const std::optional<std::string>& prompt,
                                  domain::Provenance provenance,
                                  const std::optional<std::string>& parentId) override;
    domain::Version getVersion(const std::string& projectId, const std::string& versionId) override;
    std::vector<domain::Version> listVersions(const std::string& projectId) override;
    std::optional<domain::Version> latestVersion(const std::string& projectId) override;

    /** @brief Copies the artifact into the version's output/ directory and records the copy. */
    domain::Version attachArtifact(const std::string& projectId,
                                   const std::string& versionId,
                                   const std::filesystem::path& artifactPath,
                                   domain::ArtifactKind kind = domain::ArtifactKind::Video) override;

    void subscribe(std::shared_ptr<domain::VersionStoreListener> listener) override;

    const std::filesystem::path& root() const { return m_root; }

private:
    /// In-memory index of one project's version log.
    struct ProjectState {
        std::mutex mutex;
        bool indexLoaded = false;
        std::vector<std::string> versionIds;            ///< Creation order.
        std::unordered_set<std::string> versionIdSet;
        std::chrono::system_clock::time_point lastCreatedAt{};
    };

    std::shared_ptr<ProjectState> stateFor(const std::string& projectId);
    void ensureIndexLoaded(const std::string& projectId, ProjectState& state);

    std::filesystem::path projectDir(const std::string& projectId) const;
    std::filesystem::path versionDir(const std::string& projectId, const std::string& versionId) const;

    domain::Project loadProject(const std::string& projectId) const;
    void saveProject(const domain::Project& project) const;
    domain::Version loadVersion(const std::string& projectId, const std::string& versionId) const;
    void saveVersionRecord(const domain::Version& version) const;

    std::vector<std::shared_ptr<domain::VersionStoreListener>> listenersSnapshot();

    std::filesystem::path m_root;

    std::mutex m_registryMutex;  ///< Guards m_projectStates.
    std::map<std::string, std::shared_ptr<ProjectState>> m_projectStates;

    std::mutex m_listenersMutex;
    std::vector<std::shared_ptr<domain::VersionStoreListener>> m_listeners;
};

} // namespace sceneloom::infrastructure
