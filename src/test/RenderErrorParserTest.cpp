#include <cassert>
#include <iostream>
#include <string>

#include "infrastructure/RenderErrorParser.hpp"

using sceneloom::infrastructure::RenderErrorParser;

int main() {
    std::cout << "[Test] Starting RenderErrorParser Test..." << std::endl;

    const std::string stderrText =
        "\x1b[31mManim Community v0.18.0\x1b[0m\n"
        "Traceback (most recent call last):\n"
        "  File \"/usr/lib/python3/site-packages/manim/cli/render/commands.py\", line 120, in render\n"
        "    scene.render()\n"
        "  File \"/tmp/sceneloom_ab12/job-1/intro.py\", line 8, in construct\n"
        "    c = Circl()\n"
        "  File \"/usr/lib/python3/site-packages/manim/scene/scene.py\", line 230, in render\n"
        "    self.construct()\n"
        "NameError: name 'Circl' is not defined\n";

    auto parsed = RenderErrorParser::Parse(stderrText, "/tmp/sceneloom_ab12/job-1/intro.py");
    assert(parsed.errorType && *parsed.errorType == "NameError");
    assert(parsed.message && *parsed.message == "name 'Circl' is not defined");
    assert(parsed.lineNumber && *parsed.lineNumber == 8);
    assert(parsed.summary == "NameError on line 8: name 'Circl' is not defined");
    assert(parsed.cleanedStderr.find('\x1b') == std::string::npos);
    std::cout << "[PASS] Traceback parsed, user frame preferred." << std::endl;

    auto noTraceback = RenderErrorParser::Parse("\n  ffmpeg: codec not found\nmore\n");
    assert(!noTraceback.errorType);
    assert(noTraceback.summary == "ffmpeg: codec not found");
    assert(RenderErrorParser::Parse("").summary == "Unknown render error");
    assert(RenderErrorParser::Parse(std::string(300, 'x')).summary.size() == 120);
    std::cout << "[PASS] Fallback summaries." << std::endl;

    assert(RenderErrorParser::Tail("a\nb\nc\nd", 2) == "c\nd");
    assert(RenderErrorParser::Tail("a\nb", 5) == "a\nb");
    std::cout << "[PASS] Tail." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
