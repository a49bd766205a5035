#include "application/StudioController.hpp"
#include "domain/Errors.hpp"

#include <iostream>
#include <stdexcept>

namespace sceneloom::application {

namespace {
    std::string Trimmed(const std::string& s) {
        size_t start = s.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) return "";
        size_t end = s.find_last_not_of(" \t\r\n");
        return s.substr(start, end - start + 1);
    }
}

StudioController::StudioController(domain::VersionStore& store,
                                   RenderJobManager& renderer,
                                   AsyncTaskManager& tasks,
                                   std::shared_ptr<domain::CodeGenerator> generator)
    : m_store(store)
    , m_renderer(renderer)
    , m_tasks(tasks)
    , m_generator(std::move(generator))
    , m_status("Ready")
{}

domain::Project StudioController::createProject(const std::string& name, const std::string& description) {
    std::lock_guard<std::mutex> lock(m_mutex);
    domain::Project project = m_store.createProject(name, description);
    m_projectId = project.id;
    m_versionId.reset();
    m_versionedCode.clear();
    m_status = "Project created: " + project.name;
    return project;
}

domain::Project StudioController::openProject(const std::string& projectId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    domain::Project project = m_store.openProject(projectId);
    m_projectId = project.id;
    m_versionId.reset();
    m_versionedCode.clear();

    if (project.currentVersionId) {
        try {
            domain::Version current = m_store.getVersion(project.id, *project.currentVersionId);
            m_versionId = current.id;
            m_versionedCode = current.code;
            m_currentCode = current.code;
            m_lastVideo = current.videoPath;
        } catch (const domain::NotFoundError& e) {
            std::cerr << "[StudioController] Current version of " << project.id
                      << " is unreadable: " << e.what() << std::endl;
        }
    }
    m_status = "Opened project: " + project.name;
    return project;
}

void StudioController::closeProject() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_projectId.reset();
    m_versionId.reset();
    m_versionedCode.clear();
}

std::optional<RenderJobHandle> StudioController::runCode(const std::string& code,
                                                          domain::Provenance provenance,
                                                          const std::optional<domain::RenderConfig>& config,
                                                          const std::optional<std::string>& entryPointName) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return runCodeLocked(code, provenance, std::nullopt, config, entryPointName);
}

std::optional<RenderJobHandle> StudioController::applyGeneratedCode(const std::string& prompt, const std::string& code,
                                                                     const std::optional<domain::RenderConfig>& config,
                                                                     const std::optional<std::string>& entryPointName) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return runCodeLocked(code, domain::Provenance::AiGenerated, prompt, config, entryPointName);
}

std::optional<RenderJobHandle> StudioController::runCodeLocked(const std::string& code,
                                                                domain::Provenance provenance,
                                                                const std::optional<std::string>& prompt,
                                                                const std::optional<domain::RenderConfig>& config,
                                                                const std::optional<std::string>& entryPointName) {
    const std::string trimmed = Trimmed(code);
    if (trimmed.empty()) return std::nullopt;

    m_currentCode = code;

    if (m_projectId && trimmed != Trimmed(m_versionedCode)) {
        domain::Version version = m_store.createVersion(*m_projectId, code, prompt, provenance, m_versionId);
        m_store.setCurrentVersion(*m_projectId, version.id);
        m_versionId = version.id;
        m_versionedCode = version.code;
        std::cout << "[StudioController] New version " << version.id << " ("
                  << domain::ProvenanceToString(provenance) << ")" << std::endl;
    }

    domain::RenderRequest request;
    request.code = code;
    request.entryPointName = entryPointName;
    request.config = config.value_or(m_renderer.defaultConfig());

    // Held across submit so the finished event cannot be handled before the origin is recorded.
    RenderJobHandle handle = m_renderer.submit(request);
    if (handle.supersededJobId) {
        m_jobOrigins.erase(*handle.supersededJobId);
    }
    if (m_projectId && m_versionId) {
        m_jobOrigins[handle.jobId] = JobOrigin{*m_projectId, *m_versionId};
    }
    m_lastFailure.reset();
    m_status = "Rendering...";
    return handle;
}

std::string StudioController::loadVersion(const std::string& versionId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_projectId) {
        throw std::logic_error("No project is open");
    }
    domain::Version version = m_store.getVersion(*m_projectId, versionId);
    m_store.setCurrentVersion(*m_projectId, version.id);
    m_versionId = version.id;
    m_versionedCode = version.code;
    m_currentCode = version.code;
    m_lastVideo = version.videoPath;
    m_status = "Loaded version " + version.id;
    return version.code;
}

std::shared_ptr<TaskStatus> StudioController::requestGeneration(const std::string& prompt, bool includeCurrentCode) {
    if (!m_generator) {
        throw std::logic_error("No code generator configured");
    }
    std::optional<std::string> context;
    if (includeCurrentCode) {
        std::string code = currentCode();
        if (!Trimmed(code).empty()) context = code;
    }

    return m_tasks.SubmitTask(TaskType::CodeGeneration, "Generate: " + prompt,
        [this, prompt, context](std::shared_ptr<TaskStatus>) {
            std::optional<std::string> code = m_generator->generate(prompt, context);
            if (!code || Trimmed(*code).empty()) {
                throw std::runtime_error("Code generator returned no code");
            }
            applyGeneratedCode(prompt, *code);
        });
}

std::shared_ptr<TaskStatus> StudioController::requestVariableEdit(std::shared_ptr<domain::CodeTransform> transform) {
    if (!transform) {
        throw std::invalid_argument("Variable edit needs a transform");
    }
    const std::string code = currentCode();
    return m_tasks.SubmitTask(TaskType::VariableEdit, "Variable edit",
        [this, transform, code](std::shared_ptr<TaskStatus>) {
            std::string edited = transform->apply(code);
            runCode(edited, domain::Provenance::VariableTweak);
        });
}

void StudioController::cancelRender() {
    m_renderer.cancel();
}

void StudioController::onRenderStarted(domain::RenderJobId jobId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    (void)jobId;
    m_status = "Rendering...";
}

void StudioController::onRenderProgress(domain::RenderJobId jobId, std::optional<int> percent) {
    std::lock_guard<std::mutex> lock(m_mutex);
    (void)jobId;
    m_status = percent ? "Rendering... " + std::to_string(*percent) + "%" : "Rendering...";
}

void StudioController::onRenderFinished(domain::RenderJobId jobId, const std::filesystem::path& artifactPath) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_lastVideo = artifactPath;
    m_status = "Render complete";

    auto it = m_jobOrigins.find(jobId);
    if (it == m_jobOrigins.end()) return;
    JobOrigin origin = it->second;
    m_jobOrigins.erase(it);

    try {
        domain::Version version = m_store.attachArtifact(origin.projectId, origin.versionId, artifactPath);
        if (version.videoPath) m_lastVideo = version.videoPath;
    } catch (const domain::StorageError& e) {
        std::cerr << "[StudioController] Could not attach video to " << origin.versionId << ": " << e.what() << std::endl;
    } catch (const domain::NotFoundError& e) {
        std::cerr << "[StudioController] Version " << origin.versionId << " is gone: " << e.what() << std::endl;
    }
}

void StudioController::onRenderFailed(domain::RenderJobId jobId, const domain::RenderFailure& failure) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_jobOrigins.erase(jobId);
    m_lastFailure = failure;
    m_status = "Render failed: " + failure.reason;
}

std::optional<std::string> StudioController::currentProjectId() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_projectId;
}

std::optional<std::string> StudioController::currentVersionId() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_versionId;
}

std::string StudioController::currentCode() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_currentCode;
}

std::string StudioController::statusMessage() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_status;
}

std::optional<std::filesystem::path> StudioController::lastVideoPath() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastVideo;
}

std::optional<domain::RenderFailure> StudioController::lastFailure() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastFailure;
}

size_t StudioController::pendingJobCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_jobOrigins.size();
}

} // namespace sceneloom::application
