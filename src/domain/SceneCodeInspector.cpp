#include "domain/SceneCodeInspector.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace sceneloom::domain {

namespace {
    void Trim(std::string& s) {
        if (s.empty()) return;
        s.erase(0, s.find_first_not_of(" \t\r"));
        if (!s.empty()) s.erase(s.find_last_not_of(" \t\r") + 1);
    }

    bool IsIdentChar(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    }

    // Tracks whether the end of `line` is still inside a triple-quoted string.
    // `openDelim` is empty outside strings, otherwise the delimiter that closes it.
    void UpdateTripleQuoteState(const std::string& line, std::string& openDelim) {
        size_t pos = 0;
        while (pos < line.size()) {
            if (!openDelim.empty()) {
                size_t close = line.find(openDelim, pos);
                if (close == std::string::npos) return;
                pos = close + 3;
                openDelim.clear();
                continue;
            }
            size_t dq = line.find("\"\"\"", pos);
            size_t sq = line.find("'''", pos);
            size_t open = std::min(dq, sq);
            if (open == std::string::npos) return;
            size_t comment = line.find('#', pos);
            if (comment != std::string::npos && comment < open) return;
            openDelim = line.substr(open, 3);
            pos = open + 3;
        }
    }

    bool BaseNamesScene(std::string base) {
        Trim(base);
        if (base.empty() || base.find('=') != std::string::npos) return false; // metaclass=..., keyword args
        size_t bracket = base.find('[');
        if (bracket != std::string::npos) base = base.substr(0, bracket);
        size_t dot = base.find_last_of('.');
        if (dot != std::string::npos) base = base.substr(dot + 1);
        Trim(base);
        return base.find("Scene") != std::string::npos;
    }
}

std::vector<std::string> SceneCodeInspector::FindSceneClasses(const std::string& code) {
    std::vector<std::string> scenes;
    std::vector<std::string> lines;
    {
        std::stringstream ss(code);
        std::string line;
        while (std::getline(ss, line)) lines.push_back(line);
    }

    std::string openDelim;
    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        bool startedInString = !openDelim.empty();
        UpdateTripleQuoteState(line, openDelim);
        if (startedInString) continue;

        std::string stripped = line;
        Trim(stripped);
        if (stripped.compare(0, 5, "class") != 0 || stripped.size() < 6 || !std::isspace(static_cast<unsigned char>(stripped[5]))) {
            continue;
        }

        size_t pos = 5;
        while (pos < stripped.size() && std::isspace(static_cast<unsigned char>(stripped[pos]))) ++pos;
        size_t nameStart = pos;
        while (pos < stripped.size() && IsIdentChar(stripped[pos])) ++pos;
        if (pos == nameStart) continue;
        std::string name = stripped.substr(nameStart, pos - nameStart);

        while (pos < stripped.size() && std::isspace(static_cast<unsigned char>(stripped[pos]))) ++pos;
        if (pos >= stripped.size() || stripped[pos] != '(') continue; // no bases

        // Base list may span several lines.
        std::string bases;
        int depth = 0;
        size_t lineIdx = i;
        std::string current = stripped.substr(pos);
        bool closed = false;
        while (!closed) {
            for (char c : current) {
                if (c == '(') {
                    if (depth++ == 0) continue;
                } else if (c == ')') {
                    if (--depth == 0) { closed = true; break; }
                }
                bases += c;
            }
            if (closed || ++lineIdx >= lines.size()) break;
            current = lines[lineIdx];
            bases += ' ';
        }
        if (!closed) continue;

        // Split on top-level commas.
        std::string item;
        int nested = 0;
        bool isScene = false;
        for (char c : bases) {
            if (c == '(' || c == '[') ++nested;
            if (c == ')' || c == ']') --nested;
            if (c == ',' && nested == 0) {
                isScene = isScene || BaseNamesScene(item);
                item.clear();
                continue;
            }
            item += c;
        }
        isScene = isScene || BaseNamesScene(item);

        if (isScene) scenes.push_back(name);
    }
    return scenes;
}

std::optional<std::string> SceneCodeInspector::FindFirstSceneClass(const std::string& code) {
    auto scenes = FindSceneClasses(code);
    if (scenes.empty()) return std::nullopt;
    return scenes.front();
}

std::string SceneCodeInspector::DetectEntryPoint(const std::string& code) {
    auto first = FindFirstSceneClass(code);
    return first ? *first : std::string(kDefaultSceneName);
}

} // namespace sceneloom::domain
