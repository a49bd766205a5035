#include "application/AppServices.hpp"
#include "infrastructure/FileVersionStore.hpp"

namespace sceneloom::application {

AppServices AppServices::Create(const infrastructure::StudioSettings& settings,
                                std::shared_ptr<domain::CodeGenerator> generator) {
    AppServices services;
    services.versionStore = std::make_shared<infrastructure::FileVersionStore>(settings.projectsDir);
    services.renderManager = std::make_unique<RenderJobManager>(settings.rendererCommand, settings.renderDefaults);
    services.taskManager = std::make_unique<AsyncTaskManager>();
    services.controller = std::make_shared<StudioController>(*services.versionStore,
                                                             *services.renderManager,
                                                             *services.taskManager,
                                                             std::move(generator));
    services.renderManager->subscribe(services.controller);
    return services;
}

void AppServices::shutdown() {
    if (taskManager) taskManager->waitAll();
    if (renderManager) renderManager->shutdown();
}

} // namespace sceneloom::application
