#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>
#include <unistd.h>

#include "application/RenderJobManager.hpp"
#include "StubRenderer.hpp"

namespace fs = std::filesystem;
using namespace sceneloom;
using application::RenderJobManager;

namespace {

struct Event {
    std::string kind;
    domain::RenderJobId jobId;
    std::string detail;
    domain::FailureKind failureKind = domain::FailureKind::NonZeroExit;
};

class RecordingListener : public domain::RenderEventListener {
public:
    explicit RecordingListener(RenderJobManager* manager = nullptr) : m_manager(manager) {}

    void onRenderStarted(domain::RenderJobId jobId) override { record({"started", jobId, ""}); }
    void onRenderFinished(domain::RenderJobId jobId, const fs::path& path) override {
        // Calling back into the manager from a callback must not deadlock.
        if (m_manager) (void)m_manager->lastOutputPath();
        record({"finished", jobId, path.string()});
    }
    void onRenderFailed(domain::RenderJobId jobId, const domain::RenderFailure& failure) override {
        if (m_manager) (void)m_manager->isRendering();
        record({"failed", jobId, failure.reason, failure.kind});
    }

    bool waitForTerminal(domain::RenderJobId jobId, std::chrono::seconds timeout = std::chrono::seconds(10)) {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cv.wait_for(lock, timeout, [&] {
            for (const auto& e : m_events) {
                if (e.jobId == jobId && (e.kind == "finished" || e.kind == "failed")) return true;
            }
            return false;
        });
    }

    std::vector<Event> eventsFor(domain::RenderJobId jobId) {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<Event> out;
        for (const auto& e : m_events) {
            if (e.jobId == jobId) out.push_back(e);
        }
        return out;
    }

private:
    void record(Event e) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_events.push_back(std::move(e));
        }
        m_cv.notify_all();
    }

    RenderJobManager* m_manager;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::vector<Event> m_events;
};

const std::string kScene = "from manim import *\nclass Orbit(Scene):\n    pass\n";

} // namespace

int main() {
    std::cout << "[Test] Starting RenderJobManager Test..." << std::endl;

    const fs::path testDir = fs::temp_directory_path() / ("sceneloom_manager_test_" + std::to_string(::getpid()));
    fs::remove_all(testDir);
    const auto stub = test::WriteStubRenderer(testDir);

    fs::path workspaceRoot;
    {
        RenderJobManager manager(stub, domain::RenderConfig{}, testDir);
        workspaceRoot = manager.workspace().root();
        auto listener = std::make_shared<RecordingListener>(&manager);
        manager.subscribe(listener);

        // Entry point is detected from the code.
        auto handle = manager.submit(kScene);
        auto outcome = handle.outcome.get();
        assert(outcome.success());
        assert(outcome.artifactPath->filename() == "Orbit.mp4");
        assert(listener->waitForTerminal(handle.jobId));
        auto events = listener->eventsFor(handle.jobId);
        assert(events.front().kind == "started");
        assert(events.back().kind == "finished" && events.back().detail == outcome.artifactPath->string());
        assert(manager.lastOutputPath() == outcome.artifactPath);
        assert(!manager.isRendering());
        std::cout << "[PASS] Single render with detected entry point." << std::endl;

        // Latest wins: A is superseded silently, never two live subprocesses.
        std::atomic<bool> sampling{true};
        std::atomic<int> maxLive{0};
        std::thread sampler([&] {
            while (sampling) {
                int live = infrastructure::RenderWorker::LiveProcessCount();
                if (live > maxLive) maxLive = live;
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        });

        auto a = manager.submit(kScene + "# SLEEP\n");
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        assert(manager.isRendering());
        auto b = manager.submit(kScene + "# second take\n");
        assert(a.outcome.get().status == domain::RenderStatus::Cancelled);
        assert(b.outcome.get().status == domain::RenderStatus::Completed);
        assert(listener->waitForTerminal(b.jobId));
        // Give the dispatcher a moment to deliver anything stray for A.
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        for (const auto& e : listener->eventsFor(a.jobId)) {
            assert(e.kind == "started");
        }
        assert(listener->eventsFor(b.jobId).back().kind == "finished");

        // A burst of submissions still ends with the last one.
        domain::RenderJobId lastJob = 0;
        std::shared_future<domain::RenderOutcome> lastOutcome;
        for (int i = 0; i < 5; ++i) {
            auto h = manager.submit(kScene + "# SLEEP " + std::to_string(i) + "\n");
            lastJob = h.jobId;
            lastOutcome = h.outcome;
        }
        manager.cancel();
        assert(lastOutcome.get().status == domain::RenderStatus::Cancelled);
        assert(listener->waitForTerminal(lastJob));

        sampling = false;
        sampler.join();
        assert(maxLive <= 1);
        std::cout << "[PASS] Superseded jobs are cancelled and suppressed (max live " << maxLive << ")." << std::endl;

        // Explicit cancel is reported as a failure of kind Cancelled.
        auto cancelled = listener->eventsFor(lastJob).back();
        assert(cancelled.kind == "failed");
        assert(cancelled.failureKind == domain::FailureKind::Cancelled);
        assert(cancelled.detail == "Render cancelled by user");
        std::cout << "[PASS] Explicit cancel." << std::endl;

        // Failures carry the parsed reason.
        auto failing = manager.submit(kScene + "# FAIL\n");
        assert(listener->waitForTerminal(failing.jobId));
        auto failure = listener->eventsFor(failing.jobId).back();
        assert(failure.kind == "failed" && failure.failureKind == domain::FailureKind::NonZeroExit);
        assert(failure.detail.find("ValueError") != std::string::npos);
        assert(manager.lastOutputPath() == b.outcome.get().artifactPath);
        std::cout << "[PASS] Failure reported." << std::endl;

        // Explicit entry point and config.
        domain::RenderRequest request;
        request.code = kScene;
        request.entryPointName = "Orbit";
        request.config.quality = domain::QualityPreset::High;
        request.config.format = domain::OutputFormat::Gif;
        auto custom = manager.submit(request).outcome.get();
        assert(custom.success());
        assert(custom.artifactPath->parent_path().filename() == "1080p60");
        assert(custom.artifactPath->extension() == ".gif");

        domain::RenderConfig medium;
        medium.quality = domain::QualityPreset::Medium;
        manager.setDefaultConfig(medium);
        assert(manager.defaultConfig().quality == domain::QualityPreset::Medium);
        auto byDefault = manager.submit(kScene).outcome.get();
        assert(byDefault.success());
        assert(byDefault.artifactPath->parent_path().filename() == "720p30");
        std::cout << "[PASS] Request config honoured." << std::endl;

        // Shutdown with a render in flight.
        manager.submit(kScene + "# SLEEP\n");
        manager.shutdown();
        assert(!fs::exists(workspaceRoot));
        assert(infrastructure::RenderWorker::LiveProcessCount() == 0);
        bool threw = false;
        try {
            manager.submit(kScene);
        } catch (const std::logic_error&) {
            threw = true;
        }
        assert(threw);
        manager.shutdown();
        std::cout << "[PASS] Shutdown." << std::endl;
    }

    // The destructor shuts down when the owner did not.
    {
        RenderJobManager manager(stub, domain::RenderConfig{}, testDir);
        workspaceRoot = manager.workspace().root();
        manager.submit(kScene + "# SLEEP\n");
    }
    assert(!fs::exists(workspaceRoot));
    assert(infrastructure::RenderWorker::LiveProcessCount() == 0);
    std::cout << "[PASS] Destructor shuts down." << std::endl;

    fs::remove_all(testDir);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
