#include <cassert>
#include <iostream>
#include <string>

#include "domain/SceneCodeInspector.hpp"

using sceneloom::domain::SceneCodeInspector;

int main() {
    std::cout << "[Test] Starting SceneCodeInspector Test..." << std::endl;

    const std::string twoScenes =
        "from manim import *\n"
        "\n"
        "class Helper:\n"
        "    pass\n"
        "\n"
        "class Intro(Scene):\n"
        "    def construct(self):\n"
        "        pass\n"
        "\n"
        "class Outro(MovingCameraScene):\n"
        "    pass\n";
    auto scenes = SceneCodeInspector::FindSceneClasses(twoScenes);
    assert(scenes.size() == 2);
    assert(scenes[0] == "Intro" && scenes[1] == "Outro");
    assert(SceneCodeInspector::DetectEntryPoint(twoScenes) == "Intro");
    // Deterministic: same input, same answer.
    assert(SceneCodeInspector::DetectEntryPoint(twoScenes) == SceneCodeInspector::DetectEntryPoint(twoScenes));
    std::cout << "[PASS] First scene class in source order." << std::endl;

    const std::string qualified =
        "import manim\n"
        "class Shape(object):\n"
        "    pass\n"
        "class Demo(\n"
        "        Mixin,\n"
        "        manim.ThreeDScene,\n"
        "):\n"
        "    pass\n";
    assert(SceneCodeInspector::DetectEntryPoint(qualified) == "Demo");
    std::cout << "[PASS] Qualified and multi-line base lists." << std::endl;

    const std::string docstring =
        "\"\"\"\n"
        "class Fake(Scene):\n"
        "\"\"\"\n"
        "class Real(Scene):\n"
        "    pass\n";
    assert(SceneCodeInspector::DetectEntryPoint(docstring) == "Real");
    std::cout << "[PASS] Classes inside docstrings are ignored." << std::endl;

    assert(SceneCodeInspector::DetectEntryPoint("x = 1\n") == "GeneratedScene");
    assert(SceneCodeInspector::DetectEntryPoint("") == SceneCodeInspector::kDefaultSceneName);
    assert(SceneCodeInspector::DetectEntryPoint("class Meta(metaclass=SceneMeta):\n    pass\n") == "GeneratedScene");
    assert(!SceneCodeInspector::FindFirstSceneClass("class NoBases:\n    pass\n"));
    std::cout << "[PASS] Default entry point when nothing matches." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
