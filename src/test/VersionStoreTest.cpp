#include <atomic>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <set>
#include <thread>
#include <vector>
#include <unistd.h>

#include "domain/Errors.hpp"
#include "infrastructure/FileVersionStore.hpp"

namespace fs = std::filesystem;
using namespace sceneloom;

namespace {

template <typename E, typename Fn>
bool Throws(Fn fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    }
    return false;
}

// True only for a NotFoundError that is not a CorruptRecordError.
template <typename Fn>
bool ThrowsPlainNotFound(Fn fn) {
    try {
        fn();
    } catch (const domain::CorruptRecordError&) {
        return false;
    } catch (const domain::NotFoundError&) {
        return true;
    }
    return false;
}

class RecordingListener : public domain::VersionStoreListener {
public:
    void onVersionCreated(const domain::Version&) override { versions++; }
    void onArtifactAttached(const domain::Version&, domain::ArtifactKind) override { artifacts++; }
    void onProjectDeleted(const std::string&) override { deletions++; }

    std::atomic<int> versions{0};
    std::atomic<int> artifacts{0};
    std::atomic<int> deletions{0};
};

} // namespace

int main() {
    std::cout << "[Test] Starting VersionStore Test..." << std::endl;

    const fs::path testRoot = fs::temp_directory_path() / ("sceneloom_store_test_" + std::to_string(::getpid()));
    fs::remove_all(testRoot);

    auto listener = std::make_shared<RecordingListener>();
    infrastructure::FileVersionStore store(testRoot);
    store.subscribe(listener);

    domain::Project project = store.createProject("Circles", "Intro animation");
    assert(!project.id.empty());
    assert(fs::exists(testRoot / project.id / "project.json"));
    assert(store.openProject(project.id).name == "Circles");
    std::cout << "[PASS] Project created and reopened." << std::endl;

    // Code must come back byte for byte, including CRLF, tabs and non-ASCII text.
    const std::string rootCode = "from manim import *\r\n\nclass A(Scene):\n\tdef construct(self):\n        self.add(Text(\"\xC3\xA9t\xC3\xA9\"))  \n";
    domain::Version root = store.createVersion(project.id, rootCode, std::nullopt, domain::Provenance::ManualEdit, std::nullopt);
    assert(store.getVersion(project.id, root.id).code == rootCode);
    assert(!root.parentId);

    domain::Version child = store.createVersion(project.id, rootCode + "# tweak\n", std::string("make it blue"),
                                                domain::Provenance::AiGenerated, root.id);
    domain::Version loaded = store.getVersion(project.id, child.id);
    assert(loaded.parentId && *loaded.parentId == root.id);
    assert(loaded.prompt && *loaded.prompt == "make it blue");
    assert(loaded.provenance == domain::Provenance::AiGenerated);
    assert(loaded.createdAt >= root.createdAt);
    assert(listener->versions == 2);
    std::cout << "[PASS] Versions round-trip with parent, prompt and provenance." << std::endl;

    // Parents must exist and belong to the same project.
    domain::Project other = store.createProject("Other", "");
    domain::Version foreign = store.createVersion(other.id, "x = 1\n", std::nullopt, domain::Provenance::ManualEdit, std::nullopt);
    assert(Throws<domain::ParentNotFoundError>([&] {
        store.createVersion(project.id, "y = 2\n", std::nullopt, domain::Provenance::ManualEdit, std::string("does-not-exist"));
    }));
    assert(Throws<domain::ParentNotFoundError>([&] {
        store.createVersion(project.id, "y = 2\n", std::nullopt, domain::Provenance::ManualEdit, foreign.id);
    }));
    assert(store.listVersions(project.id).size() == 2);
    std::cout << "[PASS] Invalid parents rejected." << std::endl;

    auto versions = store.listVersions(project.id);
    assert(versions[0].id == root.id && versions[1].id == child.id);
    assert(store.latestVersion(project.id)->id == child.id);
    assert(Throws<domain::NotFoundError>([&] { store.listVersions("no-such-project"); }));
    assert(Throws<domain::NotFoundError>([&] { store.getVersion(project.id, "../" + other.id); }));
    std::cout << "[PASS] Listing is in creation order." << std::endl;

    store.setCurrentVersion(project.id, root.id);
    assert(*store.openProject(project.id).currentVersionId == root.id);
    assert(Throws<domain::NotFoundError>([&] { store.setCurrentVersion(project.id, foreign.id); }));

    // Artifacts are copied into the version's output directory.
    const fs::path video = testRoot / "incoming.mp4";
    { std::ofstream(video) << "fake video"; }
    domain::Version withVideo = store.attachArtifact(project.id, child.id, video);
    assert(withVideo.videoPath);
    assert(withVideo.videoPath->parent_path() == testRoot / project.id / "versions" / child.id / "output");
    assert(fs::exists(*withVideo.videoPath));
    assert(store.getVersion(project.id, child.id).videoPath == withVideo.videoPath);
    assert(store.getVersion(project.id, child.id).code == child.code);
    assert(Throws<domain::StorageError>([&] { store.attachArtifact(project.id, child.id, testRoot / "missing.mp4"); }));
    assert(listener->artifacts == 1);

    const fs::path thumb = testRoot / "thumb.png";
    { std::ofstream(thumb) << "png"; }
    domain::Version withThumb = store.attachArtifact(project.id, child.id, thumb, domain::ArtifactKind::Thumbnail);
    assert(withThumb.thumbnailPath && withThumb.thumbnailPath->filename() == "thumb.png");
    assert(withThumb.videoPath == withVideo.videoPath);
    assert(Throws<domain::NotFoundError>([&] { store.attachArtifact(project.id, "no-such-version", video); }));
    std::cout << "[PASS] Artifact attached." << std::endl;

    domain::Project renamed = store.updateProject(project.id, "Circles v2", "Renamed");
    assert(renamed.updatedAt >= project.updatedAt);
    assert(store.openProject(project.id).name == "Circles v2");
    assert(store.openProject(project.id).currentVersionId == root.id);

    // A fresh store reads the same history; a lost log is rebuilt from the records.
    {
        infrastructure::FileVersionStore reopened(testRoot);
        auto again = reopened.listVersions(project.id);
        assert(again.size() == 2 && again[1].id == child.id);
    }
    fs::remove(testRoot / project.id / "versions.ndjson");
    {
        infrastructure::FileVersionStore rebuilt(testRoot);
        auto again = rebuilt.listVersions(project.id);
        assert(again.size() == 2);
        assert((again[0].id == root.id && again[1].id == child.id) || (again[0].createdAt == again[1].createdAt));
        assert(fs::exists(testRoot / project.id / "versions.ndjson"));
    }
    std::cout << "[PASS] History survives reopen and log loss." << std::endl;

    // Concurrent creation: every id is distinct and nothing is lost.
    const int kThreads = 8;
    const int kPerThread = 10;
    std::vector<std::thread> threads;
    std::mutex idsMutex;
    std::set<std::string> ids;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                auto v = store.createVersion(other.id, "n = " + std::to_string(t * 100 + i) + "\n",
                                             std::nullopt, domain::Provenance::VariableTweak, foreign.id);
                std::lock_guard<std::mutex> lock(idsMutex);
                ids.insert(v.id);
            }
        });
    }
    for (auto& th : threads) th.join();
    assert(ids.size() == static_cast<size_t>(kThreads * kPerThread));
    assert(store.listVersions(other.id).size() == static_cast<size_t>(kThreads * kPerThread + 1));
    std::cout << "[PASS] Concurrent createVersion kept every version." << std::endl;

    store.deleteProject(project.id);
    assert(!fs::exists(testRoot / project.id));
    assert(Throws<domain::NotFoundError>([&] { store.getVersion(project.id, root.id); }));
    assert(Throws<domain::NotFoundError>([&] { store.openProject(project.id); }));
    store.deleteProject(project.id);
    assert(store.listProjects().size() == 1);
    std::cout << "[PASS] Deleted project is gone." << std::endl;

    // Damaged records are reported as corrupt, absent ones as not found.
    const fs::path damagedRoot = testRoot.string() + "_damaged";
    fs::remove_all(damagedRoot);
    {
        infrastructure::FileVersionStore scratch(damagedRoot);
        domain::Project damaged = scratch.createProject("Damaged", "");
        domain::Version dv = scratch.createVersion(damaged.id, "a = 1\n", std::nullopt,
                                                   domain::Provenance::ManualEdit, std::nullopt);

        assert(ThrowsPlainNotFound([&] { scratch.openProject("no-such-project"); }));
        assert(ThrowsPlainNotFound([&] { scratch.getVersion(damaged.id, "no-such-version"); }));

        {
            std::ofstream out(damagedRoot / damaged.id / "versions" / dv.id / "version.json", std::ios::trunc);
            out << "{\"id\": \"" << dv.id;
        }
        assert(Throws<domain::CorruptRecordError>([&] { scratch.getVersion(damaged.id, dv.id); }));

        {
            std::ofstream out(damagedRoot / damaged.id / "project.json", std::ios::trunc);
            out << "not json at all";
        }
        assert(Throws<domain::CorruptRecordError>([&] { scratch.openProject(damaged.id); }));
    }
    fs::remove_all(damagedRoot);
    std::cout << "[PASS] Corrupt records are distinguished from missing ones." << std::endl;

    fs::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
