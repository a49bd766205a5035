#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include "domain/Errors.hpp"
#include "infrastructure/Workspace.hpp"

namespace fs = std::filesystem;
using namespace sceneloom;

int main() {
    std::cout << "[Test] Starting Workspace Test..." << std::endl;

    assert(infrastructure::Workspace::DeriveStem("GeneratedScene") == "generatedscene");
    assert(infrastructure::Workspace::DeriveStem("My Scene-2") == "my_scene_2");
    assert(infrastructure::Workspace::DeriveStem("") == "scene");

    fs::path root;
    {
        infrastructure::Workspace workspace;
        root = workspace.root();
        assert(fs::is_directory(root));

        auto a = workspace.writeSource("print('a')\n", "Intro");
        auto b = workspace.writeSource("print('b')\n", "Intro");
        assert(a.path != b.path);
        assert(a.jobDir != b.jobDir);
        assert(a.stem == "intro" && a.path.filename() == "intro.py");
        assert(fs::is_directory(a.mediaDir));

        std::ifstream in(b.path);
        std::stringstream content;
        content << in.rdbuf();
        assert(content.str() == "print('b')\n");
        std::cout << "[PASS] Each job gets its own source file." << std::endl;

        workspace.purge();
        assert(!fs::exists(root));
        workspace.purge();
        bool threw = false;
        try {
            workspace.writeSource("x", "Intro");
        } catch (const domain::StorageError&) {
            threw = true;
        }
        assert(threw);
        std::cout << "[PASS] Purge removes everything and is idempotent." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
