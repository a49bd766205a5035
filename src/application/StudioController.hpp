/**
 * @file StudioController.hpp
 * @brief Session logic tying the version graph to the render pipeline.
 */

#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "application/AsyncTaskManager.hpp"
#include "application/RenderJobManager.hpp"
#include "domain/CodeProducers.hpp"
#include "domain/RenderEventListener.hpp"
#include "domain/VersionStore.hpp"

namespace sceneloom::application {

/**
 * @class StudioController
 * @brief One editing session: an open project, its current version and the render in flight.
 *
 * Every code path that renders (editor, generator, variable edit) goes through
 * runCode(), which versions the code when it changed and remembers which
 * version each render job belongs to. When a job finishes its artifact is
 * attached to that version.
 *
 * The owner must subscribe the controller to the RenderJobManager it was given.
 */
class StudioController : public domain::RenderEventListener {
public:
    StudioController(domain::VersionStore& store,
                     RenderJobManager& renderer,
                     AsyncTaskManager& tasks,
                     std::shared_ptr<domain::CodeGenerator> generator = nullptr);

    /** @brief Creates a project and makes it the open one. */
    domain::Project createProject(const std::string& name, const std::string& description);

    /**
     * @brief Opens a project. Its current version, if any, becomes the code baseline.
     * @throws domain::NotFoundError if the project does not exist.
     */
    domain::Project openProject(const std::string& projectId);

    /** @brief Closes the open project; later renders are not versioned. */
    void closeProject();

    /**
     * @brief Versions `code` if it differs from the last versioned code, then renders it.
     * @param entryPointName Scene class to render; detected from the code when absent.
     * @return The submitted job, or nullopt for blank code.
     */
    std::optional<RenderJobHandle> runCode(const std::string& code,
                                           domain::Provenance provenance = domain::Provenance::ManualEdit,
                                           const std::optional<domain::RenderConfig>& config = std::nullopt,
                                           const std::optional<std::string>& entryPointName = std::nullopt);

    /**
     * @brief Makes an existing version current and returns its code. Does not render.
     * @throws std::logic_error if no project is open.
     */
    std::string loadVersion(const std::string& versionId);

    /** @brief Versions generator output with its prompt and renders it. */
    std::optional<RenderJobHandle> applyGeneratedCode(const std::string& prompt, const std::string& code,
                                                      const std::optional<domain::RenderConfig>& config = std::nullopt,
                                                      const std::optional<std::string>& entryPointName = std::nullopt);

    /**
     * @brief Runs the code generator in the background and applies its result.
     * @throws std::logic_error if the controller has no generator.
     */
    std::shared_ptr<TaskStatus> requestGeneration(const std::string& prompt, bool includeCurrentCode);

    /** @brief Applies `transform` to the current code in the background and renders the result. */
    std::shared_ptr<TaskStatus> requestVariableEdit(std::shared_ptr<domain::CodeTransform> transform);

    void cancelRender();

    // RenderEventListener
    void onRenderStarted(domain::RenderJobId jobId) override;
    void onRenderProgress(domain::RenderJobId jobId, std::optional<int> percent) override;
    void onRenderFinished(domain::RenderJobId jobId, const std::filesystem::path& artifactPath) override;
    void onRenderFailed(domain::RenderJobId jobId, const domain::RenderFailure& failure) override;

    std::optional<std::string> currentProjectId() const;
    std::optional<std::string> currentVersionId() const;
    std::string currentCode() const;
    std::string statusMessage() const;
    std::optional<std::filesystem::path> lastVideoPath() const;
    std::optional<domain::RenderFailure> lastFailure() const;

    /** @brief Jobs still expected to report back to a version. */
    size_t pendingJobCount() const;

private:
    std::optional<RenderJobHandle> runCodeLocked(const std::string& code,
                                                 domain::Provenance provenance,
                                                 const std::optional<std::string>& prompt,
                                                 const std::optional<domain::RenderConfig>& config,
                                                 const std::optional<std::string>& entryPointName);

    struct JobOrigin {
        std::string projectId;
        std::string versionId;
    };

    domain::VersionStore& m_store;
    RenderJobManager& m_renderer;
    AsyncTaskManager& m_tasks;
    std::shared_ptr<domain::CodeGenerator> m_generator;

    mutable std::mutex m_mutex;
    std::optional<std::string> m_projectId;
    std::optional<std::string> m_versionId;
    std::string m_versionedCode;   ///< Code of m_versionId, the baseline for change detection.
    std::string m_currentCode;     ///< Last code run or loaded.
    std::string m_status;
    std::optional<std::filesystem::path> m_lastVideo;
    std::optional<domain::RenderFailure> m_lastFailure;
    std::map<domain::RenderJobId, JobOrigin> m_jobOrigins;
};

} // namespace sceneloom::application
