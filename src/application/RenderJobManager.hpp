/**
 * @file RenderJobManager.hpp
 * @brief Owns the single active render and turns worker outcomes into listener events.
 */

#pragma once

#include <atomic>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "application/EventDispatcher.hpp"
#include "domain/RenderEventListener.hpp"
#include "domain/RenderTypes.hpp"
#include "infrastructure/RenderWorker.hpp"
#include "infrastructure/Workspace.hpp"

namespace sceneloom::application {

/**
 * @struct RenderJobHandle
 * @brief Identifies a submitted job. The future carries the raw outcome even when
 *        the job is superseded and its events are suppressed.
 */
struct RenderJobHandle {
    domain::RenderJobId jobId = 0;
    std::shared_future<domain::RenderOutcome> outcome;
    /// Job this submit superseded before it reported. It will never produce an event.
    std::optional<domain::RenderJobId> supersededJobId;
};

/**
 * @class RenderJobManager
 * @brief Latest-wins render orchestration.
 *
 * At most one renderer subprocess is alive per manager. A new submit() cancels
 * the running job and waits for it to die before the next one starts; the
 * superseded job produces no events. Listener callbacks run on an internal
 * dispatcher thread, in order.
 */
class RenderJobManager {
public:
    /**
     * @param rendererCommand Renderer program and leading arguments.
     * @param defaultConfig Used by submit(code, entryPointName).
     * @param workspaceParent Where the scratch workspace is created; system temp when empty.
     * @throws domain::StorageError if the workspace cannot be created.
     */
    RenderJobManager(std::vector<std::string> rendererCommand,
                     domain::RenderConfig defaultConfig = {},
                     const std::filesystem::path& workspaceParent = {});

    /** @brief Calls shutdown() if the owner did not. */
    ~RenderJobManager();

    RenderJobManager(const RenderJobManager&) = delete;
    RenderJobManager& operator=(const RenderJobManager&) = delete;

    /**
     * @brief Supersedes any running job and starts rendering `request`.
     *
     * Blocks only while a superseded subprocess is being terminated.
     * @throws std::logic_error after shutdown().
     */
    RenderJobHandle submit(const domain::RenderRequest& request);

    /** @brief submit() with the default config. */
    RenderJobHandle submit(const std::string& code,
                           const std::optional<std::string>& entryPointName = std::nullopt);

    /**
     * @brief Cancels the active job, if any. Listeners get a failure of kind Cancelled.
     */
    void cancel();

    /**
     * @brief Cancels and awaits the active job, delivers the events already queued,
     *        then purges the workspace. Later calls do nothing.
     */
    void shutdown();

    void subscribe(std::shared_ptr<domain::RenderEventListener> listener);

    bool isRendering() const;

    /** @brief Artifact of the most recent job that completed without being superseded. */
    std::optional<std::filesystem::path> lastOutputPath() const;

    void setDefaultConfig(const domain::RenderConfig& config);
    domain::RenderConfig defaultConfig() const;

    const infrastructure::Workspace& workspace() const { return m_workspace; }

private:
    void onWorkerFinished(domain::RenderJobId jobId, const domain::RenderOutcome& outcome);
    void onWorkerProgress(domain::RenderJobId jobId, std::optional<int> percent);
    bool isCurrent(domain::RenderJobId jobId) const;

    template <typename Fn>
    void notify(Fn fn) {
        m_dispatcher.post([this, fn]() {
            std::vector<std::shared_ptr<domain::RenderEventListener>> listeners;
            {
                std::lock_guard<std::mutex> lock(m_listenersMutex);
                listeners = m_listeners;
            }
            for (const auto& listener : listeners) fn(*listener);
        });
    }

    std::vector<std::string> m_command;
    infrastructure::Workspace m_workspace;

    mutable std::mutex m_mutex; ///< Guards the fields below.
    std::unique_ptr<infrastructure::RenderWorker> m_worker;
    domain::RenderJobId m_activeJobId = 0;
    domain::RenderJobId m_lastReportedJobId = 0;
    std::optional<std::filesystem::path> m_lastOutput;
    domain::RenderConfig m_defaultConfig;

    std::mutex m_submitMutex; ///< Serializes submit() and shutdown().
    bool m_shutdown = false;
    std::atomic<domain::RenderJobId> m_nextJobId{0};

    std::mutex m_listenersMutex;
    std::vector<std::shared_ptr<domain::RenderEventListener>> m_listeners;

    EventDispatcher m_dispatcher;
};

} // namespace sceneloom::application
