#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <unistd.h>

#include "infrastructure/RenderWorker.hpp"
#include "infrastructure/Workspace.hpp"
#include "StubRenderer.hpp"

namespace fs = std::filesystem;
using namespace sceneloom;
using infrastructure::RenderWorker;
using infrastructure::WorkerState;
using Clock = std::chrono::steady_clock;

namespace {

const char* kScene = "from manim import *\nclass Intro(Scene):\n    pass\n";

domain::RenderOutcome RenderOnce(const std::vector<std::string>& command, infrastructure::Workspace& workspace,
                                 const std::string& code, const domain::RenderConfig& config = {}) {
    RenderWorker worker(command);
    auto source = workspace.writeSource(code, "Intro");
    return worker.start(source, "Intro", config).get();
}

} // namespace

int main() {
    std::cout << "[Test] Starting RenderWorker Test..." << std::endl;

    const fs::path testDir = fs::temp_directory_path() / ("sceneloom_worker_test_" + std::to_string(::getpid()));
    fs::remove_all(testDir);
    const auto stub = test::WriteStubRenderer(testDir);
    infrastructure::Workspace workspace(testDir);

    // Command line layout.
    domain::RenderConfig cfg;
    cfg.quality = domain::QualityPreset::Medium;
    cfg.format = domain::OutputFormat::Webm;
    auto args = RenderWorker::BuildArguments({"python3", "-m", "manim", "render"}, "/w/intro.py", "Intro", cfg, "/w/media");
    const std::vector<std::string> expectedArgs = {"python3", "-m", "manim", "render", "/w/intro.py", "Intro",
                                                   "-qm", "--format", "webm", "--media_dir", "/w/media", "--disable_caching"};
    assert(args == expectedArgs);
    cfg.disableCaching = false;
    assert(RenderWorker::BuildArguments({"manim"}, "/w/intro.py", "Intro", cfg, "/w/media").back() == "/w/media");
    std::cout << "[PASS] Arguments." << std::endl;

    // The renderer inherits /dev/null as stdin and no other copy of it.
    {
        auto outcome = RenderOnce(stub, workspace, std::string(kScene) + "# FDCHECK\n");
        assert(outcome.status == domain::RenderStatus::Completed);
        std::cout << "[PASS] No stray descriptors in the renderer." << std::endl;
    }

    // Success: artifact located in the job's media tree, callbacks fired.
    {
        RenderWorker worker(stub);
        auto source = workspace.writeSource(kScene, "Intro");
        std::atomic<int> finishedCalls{0};
        std::atomic<int> lastPercent{-1};
        auto future = worker.start(source, "Intro", domain::RenderConfig{},
            [&](const domain::RenderOutcome&) { finishedCalls++; },
            [&](std::optional<int> percent) { if (percent) lastPercent = *percent; });
        assert(worker.state() != WorkerState::Idle);
        auto outcome = future.get();
        assert(outcome.status == domain::RenderStatus::Completed);
        assert(outcome.artifactPath && fs::exists(*outcome.artifactPath));
        assert(*outcome.artifactPath == source.mediaDir / "videos" / "intro" / "480p15" / "Intro.mp4");
        assert(!outcome.failure);
        worker.wait();
        assert(finishedCalls == 1);
        assert(lastPercent == 100);
        assert(worker.state() == WorkerState::Completed);

        worker.cancel();
        assert(worker.state() == WorkerState::Completed);
        bool threw = false;
        try {
            worker.start(source, "Intro", domain::RenderConfig{});
        } catch (const std::logic_error&) {
            threw = true;
        }
        assert(threw);
    }
    std::cout << "[PASS] Completed render." << std::endl;

    // Non-zero exit carries the code and the parsed traceback.
    {
        auto outcome = RenderOnce(stub, workspace, std::string(kScene) + "# FAIL\n");
        assert(outcome.status == domain::RenderStatus::Failed);
        assert(outcome.failure && outcome.failure->kind == domain::FailureKind::NonZeroExit);
        assert(outcome.failure->exitCode == 1);
        assert(outcome.failure->reason.find("ValueError on line 3: boom") != std::string::npos);
        assert(outcome.failure->stderrTail.find("ValueError: boom") != std::string::npos);
        assert(!outcome.artifactPath);
    }
    std::cout << "[PASS] Non-zero exit." << std::endl;

    {
        auto outcome = RenderOnce(stub, workspace, std::string(kScene) + "# NOVIDEO\n");
        assert(outcome.status == domain::RenderStatus::Failed);
        assert(outcome.failure->kind == domain::FailureKind::ArtifactNotFound);
        assert(outcome.failure->reason == "Render completed but output video not found");
    }
    std::cout << "[PASS] Missing artifact." << std::endl;

    {
        auto outcome = RenderOnce({(testDir / "no-such-renderer").string()}, workspace, kScene);
        assert(outcome.status == domain::RenderStatus::Failed);
        assert(outcome.failure->kind == domain::FailureKind::ProcessLaunchFailure);
        assert(RenderWorker::LiveProcessCount() == 0);
    }
    std::cout << "[PASS] Launch failure." << std::endl;

    // Timeout kills the sleeper and reports the configured budget.
    {
        domain::RenderConfig config;
        config.timeout = std::chrono::seconds(2);
        auto started = Clock::now();
        auto outcome = RenderOnce(stub, workspace, std::string(kScene) + "# SLEEP\n", config);
        auto wall = Clock::now() - started;
        assert(outcome.status == domain::RenderStatus::TimedOut);
        assert(outcome.failure->kind == domain::FailureKind::Timeout);
        assert(outcome.elapsed == std::chrono::seconds(2));
        assert(wall >= std::chrono::milliseconds(1900) && wall < std::chrono::seconds(5));
        assert(RenderWorker::LiveProcessCount() == 0);
    }
    std::cout << "[PASS] Timeout." << std::endl;

    // Cancel wakes the worker right away.
    {
        RenderWorker worker(stub);
        auto source = workspace.writeSource(std::string(kScene) + "# SLEEP\n", "Intro");
        auto future = worker.start(source, "Intro", domain::RenderConfig{});
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        assert(worker.isRunning());
        assert(worker.pid() > 0);
        auto cancelledAt = Clock::now();
        worker.cancel();
        auto outcome = future.get();
        assert(outcome.status == domain::RenderStatus::Cancelled);
        assert(outcome.failure->kind == domain::FailureKind::Cancelled);
        assert(Clock::now() - cancelledAt < std::chrono::seconds(2));
        worker.wait();
        assert(worker.state() == WorkerState::Cancelled);
        assert(RenderWorker::LiveProcessCount() == 0);
    }
    std::cout << "[PASS] Cancel." << std::endl;

    // A renderer that ignores SIGTERM is killed after the grace period.
    {
        RenderWorker worker(stub);
        auto source = workspace.writeSource(std::string(kScene) + "# STUBBORN\n", "Intro");
        auto future = worker.start(source, "Intro", domain::RenderConfig{});
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        auto cancelledAt = Clock::now();
        worker.cancel();
        auto outcome = future.get();
        auto waited = Clock::now() - cancelledAt;
        assert(outcome.status == domain::RenderStatus::Cancelled);
        assert(waited >= std::chrono::milliseconds(1500) && waited < std::chrono::seconds(6));
        assert(RenderWorker::LiveProcessCount() == 0);
    }
    std::cout << "[PASS] Cancel escalates to SIGKILL." << std::endl;

    // Destroying a running worker cancels it.
    {
        auto source = workspace.writeSource(std::string(kScene) + "# SLEEP\n", "Intro");
        auto started = Clock::now();
        {
            RenderWorker worker(stub);
            worker.start(source, "Intro", domain::RenderConfig{});
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        assert(Clock::now() - started < std::chrono::seconds(3));
        assert(RenderWorker::LiveProcessCount() == 0);
    }
    std::cout << "[PASS] Destructor cleans up." << std::endl;

    workspace.purge();
    fs::remove_all(testDir);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
