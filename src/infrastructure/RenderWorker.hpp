/**
 * @file RenderWorker.hpp
 * @brief Runs one renderer subprocess with a wall-clock timeout and cooperative cancellation.
 */

#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <sys/types.h>
#include "domain/RenderTypes.hpp"
#include "infrastructure/CancellationToken.hpp"
#include "infrastructure/Workspace.hpp"

namespace sceneloom::infrastructure {

/**
 * @enum WorkerState
 * @brief Idle -> Running -> one terminal state. No further transitions.
 */
enum class WorkerState {
    Idle,
    Running,
    Completed,
    Failed,
    TimedOut,
    Cancelled
};

/**
 * @class RenderWorker
 * @brief Single-use worker: one start(), one outcome.
 *
 * The subprocess runs in its own process group so a timeout or cancellation
 * reaches anything it spawned. A timeout kills the group outright; a cancel
 * sends SIGTERM and escalates to SIGKILL after a short grace period.
 */
class RenderWorker {
public:
    using OnFinished = std::function<void(const domain::RenderOutcome& outcome)>;
    using OnProgress = std::function<void(std::optional<int> percent)>;

    /**
     * @param rendererCommand Program and leading arguments, e.g. {"python3", "-m", "manim", "render"}.
     */
    explicit RenderWorker(std::vector<std::string> rendererCommand);

    /** @brief Cancels a running render and waits for it. */
    ~RenderWorker();

    RenderWorker(const RenderWorker&) = delete;
    RenderWorker& operator=(const RenderWorker&) = delete;

    /**
     * @brief Idle -> Running. Returns immediately; the subprocess is driven on a worker thread.
     * @param onFinished Invoked on the worker thread with the terminal outcome, before the future is made ready.
     * @param onProgress Invoked on the worker thread whenever the renderer prints a new percentage.
     * @throws std::logic_error if the worker was already started.
     */
    std::shared_future<domain::RenderOutcome> start(const SourceHandle& source,
                                                    const std::string& entryPointName,
                                                    const domain::RenderConfig& config,
                                                    OnFinished onFinished = nullptr,
                                                    OnProgress onProgress = nullptr);

    /**
     * @brief Requests termination. The outcome becomes Cancelled. No-op once terminal.
     */
    void cancel();

    /** @brief Blocks until the worker thread has finished and the subprocess is reaped. */
    void wait();

    WorkerState state() const { return m_state.load(); }
    bool isRunning() const { return m_state.load() == WorkerState::Running; }

    /** @brief Pid of the subprocess, or -1 before launch. Stays set after it exits. */
    pid_t pid() const { return m_pid.load(); }

    /** @brief Renderer subprocesses currently alive across all workers in this process. */
    static int LiveProcessCount();

    /**
     * @brief Full argv for the renderer:
     *        <command...> <source> <entry> -q<flag> --format <ext> --media_dir <dir> [--disable_caching]
     */
    static std::vector<std::string> BuildArguments(const std::vector<std::string>& rendererCommand,
                                                   const std::filesystem::path& sourcePath,
                                                   const std::string& entryPointName,
                                                   const domain::RenderConfig& config,
                                                   const std::filesystem::path& mediaDir);

private:
    void run(SourceHandle source, std::string entryPointName, domain::RenderConfig config);
    domain::RenderOutcome execute(const SourceHandle& source, const std::string& entryPointName,
                                  const domain::RenderConfig& config);
    void reportProgress(const std::string& chunk);

    std::vector<std::string> m_command;
    std::shared_ptr<CancellationToken> m_cancel;

    std::atomic<WorkerState> m_state{WorkerState::Idle};
    std::atomic<pid_t> m_pid{-1};

    OnFinished m_onFinished;
    OnProgress m_onProgress;
    int m_lastPercent = -1; ///< Worker thread only.

    std::promise<domain::RenderOutcome> m_promise;
    std::thread m_thread;
    std::mutex m_joinMutex;
};

} // namespace sceneloom::infrastructure
