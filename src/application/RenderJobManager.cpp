#include "application/RenderJobManager.hpp"
#include "domain/Errors.hpp"
#include "domain/SceneCodeInspector.hpp"

#include <iostream>
#include <stdexcept>

namespace sceneloom::application {

RenderJobManager::RenderJobManager(std::vector<std::string> rendererCommand,
                                   domain::RenderConfig defaultConfig,
                                   const std::filesystem::path& workspaceParent)
    : m_command(std::move(rendererCommand))
    , m_workspace(workspaceParent)
    , m_defaultConfig(std::move(defaultConfig))
{}

RenderJobManager::~RenderJobManager() {
    shutdown();
}

RenderJobHandle RenderJobManager::submit(const std::string& code, const std::optional<std::string>& entryPointName) {
    domain::RenderRequest request;
    request.code = code;
    request.entryPointName = entryPointName;
    request.config = defaultConfig();
    return submit(request);
}

RenderJobHandle RenderJobManager::submit(const domain::RenderRequest& request) {
    std::lock_guard<std::mutex> submitLock(m_submitMutex);
    if (m_shutdown) {
        throw std::logic_error("RenderJobManager::submit after shutdown");
    }

    const domain::RenderJobId jobId = ++m_nextJobId;
    domain::RenderJobId previousJobId = 0;
    std::unique_ptr<infrastructure::RenderWorker> previous;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        previousJobId = m_activeJobId;
        m_activeJobId = jobId;
        previous = std::move(m_worker);
    }

    if (previous) {
        if (previous->isRunning()) {
            std::cout << "[RenderJobManager] Job " << jobId << " supersedes a running render" << std::endl;
        }
        previous->cancel();
        previous->wait();
        previous.reset();
    }

    RenderJobHandle handle;
    handle.jobId = jobId;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (previousJobId != 0 && previousJobId != m_lastReportedJobId) {
            handle.supersededJobId = previousJobId;
        }
    }

    const std::string entryPoint = request.entryPointName && !request.entryPointName->empty()
        ? *request.entryPointName
        : domain::SceneCodeInspector::DetectEntryPoint(request.code);

    notify([jobId](domain::RenderEventListener& l) { l.onRenderStarted(jobId); });

    infrastructure::SourceHandle source;
    try {
        source = m_workspace.writeSource(request.code, entryPoint);
    } catch (const domain::StorageError& e) {
        std::cerr << "[RenderJobManager] Job " << jobId << ": " << e.what() << std::endl;
        domain::RenderOutcome outcome;
        outcome.status = domain::RenderStatus::Failed;
        outcome.failure = domain::RenderFailure{domain::FailureKind::ProcessLaunchFailure, 0,
                                                std::string("Could not write scene source: ") + e.what(), {}};
        std::promise<domain::RenderOutcome> promise;
        handle.outcome = promise.get_future().share();
        promise.set_value(outcome);
        onWorkerFinished(jobId, outcome);
        return handle;
    }

    std::cout << "[RenderJobManager] Job " << jobId << ": rendering " << entryPoint
              << " (" << domain::QualityToString(request.config.quality) << ", "
              << domain::FormatExtension(request.config.format) << ")" << std::endl;

    auto worker = std::make_unique<infrastructure::RenderWorker>(m_command);
    handle.outcome = worker->start(
        source, entryPoint, request.config,
        [this, jobId](const domain::RenderOutcome& outcome) { onWorkerFinished(jobId, outcome); },
        [this, jobId](std::optional<int> percent) { onWorkerProgress(jobId, percent); });

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_worker = std::move(worker);
    }
    return handle;
}

void RenderJobManager::cancel() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_worker && m_worker->isRunning()) {
        std::cout << "[RenderJobManager] Cancelling job " << m_activeJobId << std::endl;
        m_worker->cancel();
    }
}

void RenderJobManager::shutdown() {
    std::lock_guard<std::mutex> submitLock(m_submitMutex);
    if (m_shutdown) return;
    m_shutdown = true;

    std::unique_ptr<infrastructure::RenderWorker> worker;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        worker = std::move(m_worker);
    }
    if (worker) {
        worker->cancel();
        worker->wait();
    }

    // Queued finished events still point into the workspace.
    m_dispatcher.stop();
    m_workspace.purge();
}

void RenderJobManager::subscribe(std::shared_ptr<domain::RenderEventListener> listener) {
    if (!listener) return;
    std::lock_guard<std::mutex> lock(m_listenersMutex);
    m_listeners.push_back(std::move(listener));
}

bool RenderJobManager::isRendering() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_worker && m_worker->isRunning();
}

std::optional<std::filesystem::path> RenderJobManager::lastOutputPath() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastOutput;
}

void RenderJobManager::setDefaultConfig(const domain::RenderConfig& config) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_defaultConfig = config;
}

domain::RenderConfig RenderJobManager::defaultConfig() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_defaultConfig;
}

bool RenderJobManager::isCurrent(domain::RenderJobId jobId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return jobId == m_activeJobId;
}

void RenderJobManager::onWorkerFinished(domain::RenderJobId jobId, const domain::RenderOutcome& outcome) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (jobId != m_activeJobId) {
            std::cout << "[RenderJobManager] Job " << jobId << " was superseded ("
                      << domain::RenderStatusToString(outcome.status) << "), dropping its result" << std::endl;
            return;
        }
        m_lastReportedJobId = jobId;
        if (outcome.success() && outcome.artifactPath) {
            m_lastOutput = *outcome.artifactPath;
        }
    }

    if (outcome.success() && outcome.artifactPath) {
        const std::filesystem::path artifact = *outcome.artifactPath;
        std::cout << "[RenderJobManager] Job " << jobId << " finished in " << outcome.elapsed.count()
                  << " ms: " << artifact.string() << std::endl;
        notify([jobId, artifact](domain::RenderEventListener& l) { l.onRenderFinished(jobId, artifact); });
        return;
    }

    domain::RenderFailure failure = outcome.failure.value_or(
        domain::RenderFailure{domain::FailureKind::NonZeroExit, 0, "Unknown render error", {}});
    if (outcome.status == domain::RenderStatus::Cancelled) {
        failure.kind = domain::FailureKind::Cancelled;
        failure.reason = "Render cancelled by user";
    }
    std::cerr << "[RenderJobManager] Job " << jobId << " " << domain::RenderStatusToString(outcome.status)
              << ": " << failure.reason << std::endl;
    notify([jobId, failure](domain::RenderEventListener& l) { l.onRenderFailed(jobId, failure); });
}

void RenderJobManager::onWorkerProgress(domain::RenderJobId jobId, std::optional<int> percent) {
    if (!isCurrent(jobId)) return;
    notify([jobId, percent](domain::RenderEventListener& l) { l.onRenderProgress(jobId, percent); });
}

} // namespace sceneloom::application
