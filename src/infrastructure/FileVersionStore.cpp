/**
 * @file FileVersionStore.cpp
 * @brief Implementation of the FileVersionStore class.
 */
#include "infrastructure/FileVersionStore.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/AtomicFile.hpp"
#include "infrastructure/IdGenerator.hpp"
#include "infrastructure/VersionLogFs.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <system_error>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace sceneloom::infrastructure {

namespace {

constexpr const char* kProjectFile = "project.json";
constexpr const char* kVersionFile = "version.json";
constexpr const char* kSceneFile = "scene.py";

long long ToMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point FromMillis(long long ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

// Millisecond precision, so records compare equal after a reload.
std::chrono::system_clock::time_point Now() {
    return FromMillis(ToMillis(std::chrono::system_clock::now()));
}

// Identifiers become path components; anything else cannot name a record.
bool IsSafeId(const std::string& id) {
    if (id.empty() || id.size() > 128) return false;
    return std::all_of(id.begin(), id.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_';
    });
}

std::string ArtifactKindToString(domain::ArtifactKind kind) {
    return kind == domain::ArtifactKind::Thumbnail ? "thumbnail" : "video";
}

json OptionalToJson(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

std::optional<std::string> OptionalFromJson(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return std::nullopt;
}

} // namespace

FileVersionStore::FileVersionStore(fs::path projectsRoot)
    : m_root(std::move(projectsRoot)) {}

fs::path FileVersionStore::projectDir(const std::string& projectId) const {
    return m_root / projectId;
}

fs::path FileVersionStore::versionDir(const std::string& projectId, const std::string& versionId) const {
    return m_root / projectId / "versions" / versionId;
}

std::shared_ptr<FileVersionStore::ProjectState> FileVersionStore::stateFor(const std::string& projectId) {
    std::lock_guard<std::mutex> lock(m_registryMutex);
    auto& state = m_projectStates[projectId];
    if (!state) state = std::make_shared<ProjectState>();
    return state;
}

std::vector<std::shared_ptr<domain::VersionStoreListener>> FileVersionStore::listenersSnapshot() {
    std::lock_guard<std::mutex> lock(m_listenersMutex);
    return m_listeners;
}

void FileVersionStore::subscribe(std::shared_ptr<domain::VersionStoreListener> listener) {
    if (!listener) return;
    std::lock_guard<std::mutex> lock(m_listenersMutex);
    m_listeners.push_back(std::move(listener));
}

// --- Projects ---

domain::Project FileVersionStore::loadProject(const std::string& projectId) const {
    if (!IsSafeId(projectId)) {
        throw domain::NotFoundError("Project not found: " + projectId);
    }
    fs::path file = projectDir(projectId) / kProjectFile;
    std::error_code ec;
    if (!fs::exists(file, ec)) {
        throw domain::NotFoundError("Project not found: " + projectId);
    }

    auto content = ReadTextFile(file);
    if (!content) {
        throw domain::CorruptRecordError("Project record unreadable: " + file.string());
    }

    try {
        auto j = json::parse(*content);
        domain::Project project;
        project.id = j.at("id").get<std::string>();
        if (project.id != projectId) {
            throw domain::CorruptRecordError("Project record " + file.string() + " names id " + project.id);
        }
        project.name = j.at("name").get<std::string>();
        project.description = j.value("description", "");
        project.createdAt = FromMillis(j.at("created_at").get<long long>());
        project.updatedAt = FromMillis(j.at("updated_at").get<long long>());
        project.currentVersionId = OptionalFromJson(j, "current_version_id");
        project.directory = projectDir(projectId);
        return project;
    } catch (const json::exception& e) {
        throw domain::CorruptRecordError("Project record corrupt: " + file.string() + " (" + e.what() + ")");
    }
}

void FileVersionStore::saveProject(const domain::Project& project) const {
    json j;
    j["id"] = project.id;
    j["name"] = project.name;
    j["description"] = project.description;
    j["created_at"] = ToMillis(project.createdAt);
    j["updated_at"] = ToMillis(project.updatedAt);
    j["current_version_id"] = OptionalToJson(project.currentVersionId);
    j["directory_path"] = project.directory.string();
    WriteTextAtomic(project.directory / kProjectFile, j.dump(2));
}

domain::Project FileVersionStore::createProject(const std::string& name, const std::string& description) {
    std::error_code ec;
    fs::create_directories(m_root, ec);
    if (ec) {
        throw domain::StorageError("Cannot create projects root " + m_root.string() + ": " + ec.message());
    }

    std::string projectId;
    do {
        projectId = GenerateUuid();
    } while (fs::exists(projectDir(projectId), ec));

    domain::Project project;
    project.id = projectId;
    project.name = name;
    project.description = description;
    project.createdAt = Now();
    project.updatedAt = project.createdAt;
    project.directory = projectDir(projectId);

    fs::create_directories(project.directory / "versions", ec);
    if (ec) {
        throw domain::StorageError("Cannot create project directory " + project.directory.string() + ": " + ec.message());
    }

    try {
        saveProject(project);
    } catch (const domain::StorageError&) {
        std::error_code cleanupEc;
        fs::remove_all(project.directory, cleanupEc);
        throw;
    }

    std::cout << "[FileVersionStore] Created project " << project.id << " (" << name << ")" << std::endl;
    for (const auto& listener : listenersSnapshot()) listener->onProjectCreated(project);
    return project;
}

domain::Project FileVersionStore::openProject(const std::string& projectId) {
    return loadProject(projectId);
}

std::vector<domain::Project> FileVersionStore::listProjects() {
    std::vector<domain::Project> projects;
    std::error_code ec;
    if (!fs::exists(m_root, ec)) return projects;

    for (const auto& entry : fs::directory_iterator(m_root, ec)) {
        if (!entry.is_directory()) continue;
        std::string projectId = entry.path().filename().string();
        if (!IsSafeId(projectId) || !fs::exists(entry.path() / kProjectFile)) continue;
        try {
            projects.push_back(loadProject(projectId));
        } catch (const domain::NotFoundError& e) {
            std::cerr << "[FileVersionStore] Skipping project " << projectId << ": " << e.what() << std::endl;
        }
    }
    if (ec) {
        std::cerr << "[FileVersionStore] Error scanning " << m_root << ": " << ec.message() << std::endl;
    }

    std::sort(projects.begin(), projects.end(), [](const domain::Project& a, const domain::Project& b) {
        return a.updatedAt > b.updatedAt;
    });
    return projects;
}

domain::Project FileVersionStore::updateProject(const std::string& projectId, const std::string& name, const std::string& description) {
    auto state = stateFor(projectId);
    std::lock_guard<std::mutex> lock(state->mutex);

    domain::Project project = loadProject(projectId);
    project.name = name;
    project.description = description;
    project.updatedAt = std::max(Now(), project.updatedAt);
    saveProject(project);
    return project;
}

domain::Project FileVersionStore::setCurrentVersion(const std::string& projectId, const std::string& versionId) {
    auto state = stateFor(projectId);
    std::lock_guard<std::mutex> lock(state->mutex);

    domain::Project project = loadProject(projectId);
    ensureIndexLoaded(projectId, *state);
    if (state->versionIdSet.count(versionId) == 0) {
        throw domain::NotFoundError("Version " + versionId + " not found in project " + projectId);
    }
    project.currentVersionId = versionId;
    project.updatedAt = std::max(Now(), project.updatedAt);
    saveProject(project);
    return project;
}

void FileVersionStore::deleteProject(const std::string& projectId) {
    if (!IsSafeId(projectId)) return;

    auto state = stateFor(projectId);
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        fs::path dir = projectDir(projectId);
        std::error_code ec;
        if (!fs::exists(dir, ec)) {
            state->indexLoaded = false;
        } else {
            fs::remove_all(dir, ec);
            if (ec) {
                throw domain::StorageError("Cannot delete project " + projectId + ": " + ec.message());
            }
            state->indexLoaded = false;
            state->versionIds.clear();
            state->versionIdSet.clear();
            std::cout << "[FileVersionStore] Deleted project " << projectId << std::endl;
        }
    }
    {
        std::lock_guard<std::mutex> lock(m_registryMutex);
        m_projectStates.erase(projectId);
    }
    for (const auto& listener : listenersSnapshot()) listener->onProjectDeleted(projectId);
}

// --- Versions ---

void FileVersionStore::ensureIndexLoaded(const std::string& projectId, ProjectState& state) {
    if (state.indexLoaded) return;

    state.versionIds.clear();
    state.versionIdSet.clear();
    state.lastCreatedAt = {};

    VersionLogFs log(projectDir(projectId));
    if (log.exists()) {
        for (const auto& entry : log.readAll()) {
            if (entry.type != VersionLogEntry::VersionCreated) continue;
            if (!state.versionIdSet.insert(entry.versionId).second) continue;
            state.versionIds.push_back(entry.versionId);
            state.lastCreatedAt = std::max(state.lastCreatedAt, entry.timestamp);
        }
        state.indexLoaded = true;
        return;
    }

    // No log yet: rebuild it once from the version records.
    std::vector<domain::Version> found;
    fs::path versionsRoot = projectDir(projectId) / "versions";
    std::error_code ec;
    if (fs::exists(versionsRoot, ec)) {
        for (const auto& entry : fs::directory_iterator(versionsRoot, ec)) {
            if (!entry.is_directory()) continue;
            try {
                found.push_back(loadVersion(projectId, entry.path().filename().string()));
            } catch (const domain::NotFoundError& e) {
                std::cerr << "[FileVersionStore] Skipping version " << entry.path() << ": " << e.what() << std::endl;
            }
        }
    }
    std::stable_sort(found.begin(), found.end(), [](const domain::Version& a, const domain::Version& b) {
        return a.createdAt < b.createdAt;
    });

    std::vector<VersionLogEntry> entries;
    for (const auto& version : found) {
        VersionLogEntry entry;
        entry.type = VersionLogEntry::VersionCreated;
        entry.versionId = version.id;
        entry.parentId = version.parentId;
        entry.timestamp = version.createdAt;
        entries.push_back(entry);
        state.versionIds.push_back(version.id);
        state.versionIdSet.insert(version.id);
        state.lastCreatedAt = std::max(state.lastCreatedAt, version.createdAt);
    }
    if (!entries.empty()) {
        log.rewrite(entries);
        std::cout << "[FileVersionStore] Rebuilt version log for " << projectId
                  << " (" << entries.size() << " versions)" << std::endl;
    }
    state.indexLoaded = true;
}

domain::Version FileVersionStore::loadVersion(const std::string& projectId, const std::string& versionId) const {
    if (!IsSafeId(projectId) || !IsSafeId(versionId)) {
        throw domain::NotFoundError("Version not found: " + versionId);
    }
    fs::path dir = versionDir(projectId, versionId);
    std::error_code ec;
    if (!fs::exists(dir / kVersionFile, ec)) {
        throw domain::NotFoundError("Version " + versionId + " not found in project " + projectId);
    }

    auto meta = ReadTextFile(dir / kVersionFile);
    auto code = ReadTextFile(dir / kSceneFile);
    if (!meta || !code) {
        throw domain::CorruptRecordError("Version record unreadable: " + dir.string());
    }

    try {
        auto j = json::parse(*meta);
        domain::Version version;
        version.id = j.at("id").get<std::string>();
        version.projectId = j.at("project_id").get<std::string>();
        if (version.id != versionId || version.projectId != projectId) {
            throw domain::CorruptRecordError("Version record " + dir.string() + " does not match its location");
        }
        version.code = std::move(*code);
        version.prompt = OptionalFromJson(j, "prompt");

        std::string source = j.at("source").get<std::string>();
        auto provenance = domain::ProvenanceFromString(source);
        if (!provenance) {
            throw domain::CorruptRecordError("Unknown provenance '" + source + "' in " + dir.string());
        }
        version.provenance = *provenance;

        version.parentId = OptionalFromJson(j, "parent_version_id");
        version.createdAt = FromMillis(j.at("created_at").get<long long>());
        if (auto video = OptionalFromJson(j, "video_path")) version.videoPath = fs::path(*video);
        if (auto thumb = OptionalFromJson(j, "thumbnail_path")) version.thumbnailPath = fs::path(*thumb);
        return version;
    } catch (const json::exception& e) {
        throw domain::CorruptRecordError("Version record corrupt: " + dir.string() + " (" + e.what() + ")");
    }
}

void FileVersionStore::saveVersionRecord(const domain::Version& version) const {
    json j;
    j["id"] = version.id;
    j["project_id"] = version.projectId;
    j["prompt"] = OptionalToJson(version.prompt);
    j["source"] = domain::ProvenanceToString(version.provenance);
    j["parent_version_id"] = OptionalToJson(version.parentId);
    j["created_at"] = ToMillis(version.createdAt);
    j["video_path"] = version.videoPath ? json(version.videoPath->string()) : json(nullptr);
    j["thumbnail_path"] = version.thumbnailPath ? json(version.thumbnailPath->string()) : json(nullptr);
    WriteTextAtomic(versionDir(version.projectId, version.id) / kVersionFile, j.dump(2));
}

domain::Version FileVersionStore::createVersion(const std::string& projectId,
                                                const std::string& code,
                                                const std::optional<std::string>& prompt,
                                                domain::Provenance provenance,
                                                const std::optional<std::string>& parentId) {
    auto state = stateFor(projectId);
    domain::Version version;
    {
        std::lock_guard<std::mutex> lock(state->mutex);

        loadProject(projectId); // NotFoundError / CorruptRecordError
        ensureIndexLoaded(projectId, *state);

        if (parentId && state->versionIdSet.count(*parentId) == 0) {
            throw domain::ParentNotFoundError("Parent version " + *parentId + " is not part of project " + projectId);
        }

        std::error_code ec;
        do {
            version.id = GenerateUuid();
        } while (state->versionIdSet.count(version.id) != 0 || fs::exists(versionDir(projectId, version.id), ec));

        version.projectId = projectId;
        version.code = code;
        version.prompt = prompt;
        version.provenance = provenance;
        version.parentId = parentId;
        // Creation order is the canonical "latest" rule, so never step back in time.
        version.createdAt = std::max(Now(), state->lastCreatedAt);

        fs::path dir = versionDir(projectId, version.id);
        try {
            fs::create_directories(dir / "output", ec);
            if (ec) {
                throw domain::StorageError("Cannot create version directory " + dir.string() + ": " + ec.message());
            }
            WriteTextAtomic(dir / kSceneFile, code);
            saveVersionRecord(version);

            VersionLogEntry entry;
            entry.type = VersionLogEntry::VersionCreated;
            entry.versionId = version.id;
            entry.parentId = parentId;
            entry.timestamp = version.createdAt;
            VersionLogFs(projectDir(projectId)).append(entry);
        } catch (const domain::StorageError&) {
            std::error_code cleanupEc;
            fs::remove_all(dir, cleanupEc);
            throw;
        }

        state->versionIds.push_back(version.id);
        state->versionIdSet.insert(version.id);
        state->lastCreatedAt = version.createdAt;
    }

    for (const auto& listener : listenersSnapshot()) listener->onVersionCreated(version);
    return version;
}

domain::Version FileVersionStore::getVersion(const std::string& projectId, const std::string& versionId) {
    return loadVersion(projectId, versionId);
}

std::vector<domain::Version> FileVersionStore::listVersions(const std::string& projectId) {
    auto state = stateFor(projectId);
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        loadProject(projectId);
        ensureIndexLoaded(projectId, *state);
        ids = state->versionIds;
    }

    std::vector<domain::Version> versions;
    versions.reserve(ids.size());
    for (const auto& id : ids) {
        versions.push_back(loadVersion(projectId, id));
    }
    return versions;
}

std::optional<domain::Version> FileVersionStore::latestVersion(const std::string& projectId) {
    auto state = stateFor(projectId);
    std::string lastId;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        loadProject(projectId);
        ensureIndexLoaded(projectId, *state);
        if (state->versionIds.empty()) return std::nullopt;
        lastId = state->versionIds.back();
    }
    return loadVersion(projectId, lastId);
}

domain::Version FileVersionStore::attachArtifact(const std::string& projectId,
                                                 const std::string& versionId,
                                                 const fs::path& artifactPath,
                                                 domain::ArtifactKind kind) {
    auto state = stateFor(projectId);
    domain::Version version;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        version = loadVersion(projectId, versionId);

        std::error_code ec;
        if (!fs::is_regular_file(artifactPath, ec)) {
            throw domain::StorageError("Artifact does not exist: " + artifactPath.string());
        }

        fs::path outputDir = versionDir(projectId, versionId) / "output";
        fs::path dest = outputDir / artifactPath.filename();
        if (fs::absolute(artifactPath).lexically_normal() != fs::absolute(dest).lexically_normal()) {
            fs::create_directories(outputDir, ec);
            if (!ec) fs::copy_file(artifactPath, dest, fs::copy_options::overwrite_existing, ec);
            if (ec) {
                throw domain::StorageError("Cannot copy artifact into " + outputDir.string() + ": " + ec.message());
            }
        }

        if (kind == domain::ArtifactKind::Thumbnail) {
            version.thumbnailPath = dest;
        } else {
            version.videoPath = dest;
        }
        saveVersionRecord(version);

        VersionLogEntry entry;
        entry.type = VersionLogEntry::ArtifactAttached;
        entry.versionId = versionId;
        entry.artifactKind = ArtifactKindToString(kind);
        entry.artifactPath = dest.string();
        entry.timestamp = Now();
        VersionLogFs(projectDir(projectId)).append(entry);
    }

    for (const auto& listener : listenersSnapshot()) listener->onArtifactAttached(version, kind);
    return version;
}

} // namespace sceneloom::infrastructure
