/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/AsyncTaskManager.hpp"
#include "application/RenderJobManager.hpp"
#include "application/StudioController.hpp"
#include "domain/CodeProducers.hpp"
#include "domain/VersionStore.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace sceneloom::application {

/**
 * @struct AppServices
 * @brief Owns the service graph. Members are destroyed bottom-up: pending
 *        background tasks are joined before the render manager shuts down.
 */
struct AppServices {
    std::shared_ptr<domain::VersionStore> versionStore;
    std::unique_ptr<RenderJobManager> renderManager;
    std::unique_ptr<AsyncTaskManager> taskManager;
    std::shared_ptr<StudioController> controller;

    /**
     * @brief Wires a file-backed store, a render manager and a controller from settings.
     * @throws domain::StorageError if the render workspace cannot be created.
     */
    static AppServices Create(const infrastructure::StudioSettings& settings,
                              std::shared_ptr<domain::CodeGenerator> generator = nullptr);

    /** @brief Joins background tasks and stops rendering. Safe to call more than once. */
    void shutdown();
};

} // namespace sceneloom::application
