#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "application/AppServices.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"

namespace fs = std::filesystem;
using namespace sceneloom;

namespace {

void PrintUsage() {
    std::cout <<
        "SceneLoom - versioned animation scene renderer\n"
        "\n"
        "Usage:\n"
        "  sceneloom new <name> [description]\n"
        "  sceneloom projects\n"
        "  sceneloom versions <projectId>\n"
        "  sceneloom show <projectId> <versionId>\n"
        "  sceneloom checkout <projectId> <versionId>\n"
        "  sceneloom run <projectId> <scene.py> [options] [--prompt <text>]\n"
        "  sceneloom render <scene.py> [options]\n"
        "  sceneloom delete <projectId>\n"
        "  sceneloom config\n"
        "\n"
        "Options:\n"
        "  --quality <low|medium|high|ultra>\n"
        "  --format <mp4|mov|webm|gif>\n"
        "  --timeout <seconds>\n"
        "  --scene <ClassName>\n"
        "  --cache               keep the renderer's cache enabled\n";
}

std::string FormatTime(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

std::string ReadSceneFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw domain::NotFoundError("Cannot read scene file: " + path.string());
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

struct RenderOptions {
    domain::RenderConfig config;
    std::optional<std::string> scene;
    std::optional<std::string> prompt;
};

RenderOptions ParseRenderOptions(const std::vector<std::string>& args, size_t first, domain::RenderConfig defaults) {
    RenderOptions options;
    options.config = defaults;
    for (size_t i = first; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= args.size()) throw std::invalid_argument("Missing value for " + arg);
            return args[++i];
        };
        if (arg == "--quality") {
            std::string name = value();
            auto quality = domain::QualityFromString(name);
            if (!quality) throw std::invalid_argument("Unknown quality: " + name);
            options.config.quality = *quality;
        } else if (arg == "--format") {
            std::string name = value();
            auto format = domain::FormatFromString(name);
            if (!format) throw std::invalid_argument("Unknown format: " + name);
            options.config.format = *format;
        } else if (arg == "--timeout") {
            int seconds = std::stoi(value());
            if (seconds <= 0) throw std::invalid_argument("Timeout must be positive");
            options.config.timeout = std::chrono::seconds(seconds);
        } else if (arg == "--scene") {
            options.scene = value();
        } else if (arg == "--prompt") {
            options.prompt = value();
        } else if (arg == "--cache") {
            options.config.disableCaching = false;
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }
    return options;
}

int ReportOutcome(const domain::RenderOutcome& outcome) {
    if (outcome.success()) {
        std::cout << "Rendered in " << outcome.elapsed.count() << " ms: " << outcome.artifactPath->string() << std::endl;
        return 0;
    }
    std::cerr << "Render " << domain::RenderStatusToString(outcome.status);
    if (outcome.failure) std::cerr << ": " << outcome.failure->reason;
    std::cerr << std::endl;
    if (outcome.failure && !outcome.failure->stderrTail.empty()) {
        std::cerr << outcome.failure->stderrTail << std::endl;
    }
    return 1;
}

void PrintVersion(const domain::Version& v, const std::optional<std::string>& currentId) {
    std::cout << (currentId && *currentId == v.id ? "* " : "  ")
              << v.id << "  " << FormatTime(v.createdAt)
              << "  " << domain::ProvenanceToString(v.provenance)
              << "  parent=" << v.parentId.value_or("-");
    if (v.videoPath) std::cout << "  video=" << v.videoPath->string();
    if (v.prompt) std::cout << "  prompt=\"" << *v.prompt << "\"";
    std::cout << std::endl;
}

int Run(const std::vector<std::string>& args) {
    if (args.empty() || args[0] == "help" || args[0] == "--help") {
        PrintUsage();
        return args.empty() ? 1 : 0;
    }

    const fs::path settingsFile = infrastructure::PathUtils::GetSettingsFile();
    infrastructure::StudioSettings settings = infrastructure::ConfigLoader::Load(settingsFile);
    const std::string& command = args[0];

    if (command == "config") {
        std::cout << "settings:        " << settingsFile.string() << "\n"
                  << "projects_dir:    " << settings.projectsDir.string() << "\n"
                  << "default_quality: " << domain::QualityToString(settings.renderDefaults.quality) << "\n"
                  << "output_format:   " << domain::FormatExtension(settings.renderDefaults.format) << "\n"
                  << "render_timeout:  "
                  << std::chrono::duration_cast<std::chrono::seconds>(settings.renderDefaults.timeout).count() << "\n"
                  << "disable_caching: " << (settings.renderDefaults.disableCaching ? "true" : "false") << "\n"
                  << "renderer:       ";
        for (const auto& part : settings.rendererCommand) std::cout << " " << part;
        std::cout << std::endl;
        return 0;
    }

    application::AppServices services = application::AppServices::Create(settings);
    auto& store = *services.versionStore;
    auto& controller = *services.controller;
    int status = 0;

    if (command == "new" && args.size() >= 2) {
        domain::Project project = controller.createProject(args[1], args.size() >= 3 ? args[2] : "");
        std::cout << project.id << std::endl;
    } else if (command == "projects") {
        for (const auto& p : store.listProjects()) {
            std::cout << p.id << "  " << FormatTime(p.updatedAt) << "  " << p.name;
            if (!p.description.empty()) std::cout << " - " << p.description;
            std::cout << std::endl;
        }
    } else if (command == "versions" && args.size() >= 2) {
        domain::Project project = store.openProject(args[1]);
        for (const auto& v : store.listVersions(project.id)) PrintVersion(v, project.currentVersionId);
    } else if (command == "show" && args.size() >= 3) {
        std::cout << store.getVersion(args[1], args[2]).code;
    } else if (command == "checkout" && args.size() >= 3) {
        controller.openProject(args[1]);
        controller.loadVersion(args[2]);
        std::cout << "Current version: " << args[2] << std::endl;
    } else if (command == "delete" && args.size() >= 2) {
        store.deleteProject(args[1]);
        std::cout << "Deleted " << args[1] << std::endl;
    } else if ((command == "run" && args.size() >= 3) || (command == "render" && args.size() >= 2)) {
        const bool versioned = command == "run";
        const fs::path scenePath = versioned ? args[2] : args[1];
        RenderOptions options = ParseRenderOptions(args, versioned ? 3 : 2, settings.renderDefaults);
        const std::string code = ReadSceneFile(scenePath);

        std::optional<application::RenderJobHandle> handle;
        if (versioned) {
            controller.openProject(args[1]);
            handle = options.prompt
                ? controller.applyGeneratedCode(*options.prompt, code, options.config, options.scene)
                : controller.runCode(code, domain::Provenance::ManualEdit, options.config, options.scene);
        } else {
            domain::RenderRequest request{code, options.scene, options.config};
            handle = services.renderManager->submit(request);
        }

        if (!handle) {
            std::cerr << "Error: scene file is empty" << std::endl;
            status = 1;
        } else {
            status = ReportOutcome(handle->outcome.get());
            services.shutdown();
            if (versioned && status == 0) {
                if (auto video = controller.lastVideoPath()) std::cout << "Stored: " << video->string() << std::endl;
            }
        }
    } else {
        PrintUsage();
        status = 1;
    }

    services.shutdown();
    return status;
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    try {
        return Run(args);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
