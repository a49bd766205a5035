#include "infrastructure/RenderErrorParser.hpp"
#include <regex>
#include <sstream>
#include <utility>
#include <vector>

namespace sceneloom::infrastructure {

namespace {
    const std::regex& AnsiRegex() {
        static const std::regex re("\x1b\\[[0-9;]*[a-zA-Z]");
        return re;
    }

    const std::regex& ExceptionRegex() {
        static const std::regex re("^(\\w[\\w.]*): (.+)$");
        return re;
    }

    const std::regex& FileLineRegex() {
        static const std::regex re("File \"([^\"]+)\", line (\\d+)");
        return re;
    }

    std::string Trimmed(const std::string& s) {
        size_t start = s.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) return "";
        size_t end = s.find_last_not_of(" \t\r\n");
        return s.substr(start, end - start + 1);
    }

    std::vector<std::string> SplitLines(const std::string& text) {
        std::vector<std::string> lines;
        std::stringstream ss(text);
        std::string line;
        while (std::getline(ss, line)) lines.push_back(line);
        return lines;
    }
}

std::string RenderErrorParser::StripAnsi(const std::string& text) {
    return std::regex_replace(text, AnsiRegex(), "");
}

std::string RenderErrorParser::Tail(const std::string& text, size_t maxLines) {
    auto lines = SplitLines(text);
    size_t first = lines.size() > maxLines ? lines.size() - maxLines : 0;
    std::string out;
    for (size_t i = first; i < lines.size(); ++i) {
        out += lines[i];
        if (i + 1 < lines.size()) out += '\n';
    }
    return out;
}

ParsedRenderError RenderErrorParser::Parse(const std::string& stderrText, const std::string& sceneFilePath) {
    ParsedRenderError result;
    result.cleanedStderr = StripAnsi(stderrText);

    const std::string marker = "Traceback (most recent call last):";
    size_t lastTb = result.cleanedStderr.rfind(marker);

    if (lastTb != std::string::npos) {
        auto lines = SplitLines(result.cleanedStderr.substr(lastTb));

        // Exception type / message from the final non-empty line.
        for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
            std::string line = Trimmed(*it);
            if (line.empty()) continue;
            std::smatch m;
            if (std::regex_match(line, m, ExceptionRegex())) {
                result.errorType = m[1].str();
                result.message = m[2].str();
            }
            break;
        }

        std::vector<std::pair<std::string, int>> frames;
        for (const auto& line : lines) {
            std::smatch m;
            if (std::regex_search(line, m, FileLineRegex())) {
                frames.emplace_back(m[1].str(), std::stoi(m[2].str()));
            }
        }

        // Prefer the user's own file, then anything outside site-packages, then the last frame.
        if (!frames.empty()) {
            if (!sceneFilePath.empty()) {
                for (const auto& [path, line] : frames) {
                    if (path.find(sceneFilePath) != std::string::npos && path.find("site-packages") == std::string::npos) {
                        result.lineNumber = line;
                    }
                }
            }
            if (!result.lineNumber) {
                for (const auto& [path, line] : frames) {
                    if (path.find("site-packages") == std::string::npos) result.lineNumber = line;
                }
            }
            if (!result.lineNumber) result.lineNumber = frames.back().second;
        }
    }

    if (result.errorType && result.message) {
        if (result.lineNumber) {
            result.summary = *result.errorType + " on line " + std::to_string(*result.lineNumber) + ": " + *result.message;
        } else {
            result.summary = *result.errorType + ": " + *result.message;
        }
    } else {
        std::string fallback;
        for (const auto& line : SplitLines(result.cleanedStderr)) {
            fallback = Trimmed(line);
            if (!fallback.empty()) break;
        }
        result.summary = fallback.empty() ? "Unknown render error" : fallback.substr(0, 120);
    }
    return result;
}

} // namespace sceneloom::infrastructure
