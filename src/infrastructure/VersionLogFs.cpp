/**
 * @file VersionLogFs.cpp
 * @brief Implementation of VersionLogFs.
 */

#include "infrastructure/VersionLogFs.hpp"
#include "infrastructure/AtomicFile.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace sceneloom::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {
    json ToJson(const VersionLogEntry& entry) {
        json j;
        j["type"] = entry.type;
        j["id"] = entry.versionId;
        if (entry.type == VersionLogEntry::VersionCreated) {
            j["parent"] = entry.parentId ? json(*entry.parentId) : json(nullptr);
        } else {
            j["kind"] = entry.artifactKind;
            j["path"] = entry.artifactPath;
        }
        j["ts"] = std::chrono::duration_cast<std::chrono::milliseconds>(
            entry.timestamp.time_since_epoch()).count();
        return j;
    }
}

VersionLogFs::VersionLogFs(fs::path projectDir)
    : m_logPath(std::move(projectDir) / "versions.ndjson") {}

bool VersionLogFs::exists() const {
    std::error_code ec;
    return fs::exists(m_logPath, ec);
}

void VersionLogFs::append(const VersionLogEntry& entry) {
    AppendLine(m_logPath, ToJson(entry).dump());
}

void VersionLogFs::rewrite(const std::vector<VersionLogEntry>& entries) {
    std::stringstream content;
    for (const auto& entry : entries) {
        content << ToJson(entry).dump() << "\n";
    }
    WriteTextAtomic(m_logPath, content.str());
}

std::vector<VersionLogEntry> VersionLogFs::readAll() const {
    std::vector<VersionLogEntry> results;
    std::ifstream inFile(m_logPath);
    if (!inFile) return results;

    std::string line;
    size_t lineNo = 0;
    while (std::getline(inFile, line)) {
        ++lineNo;
        if (line.empty()) continue;
        try {
            auto j = json::parse(line);
            VersionLogEntry entry;
            entry.type = j.at("type").get<std::string>();
            entry.versionId = j.at("id").get<std::string>();
            if (j.contains("parent") && j["parent"].is_string()) {
                entry.parentId = j["parent"].get<std::string>();
            }
            entry.artifactKind = j.value("kind", "");
            entry.artifactPath = j.value("path", "");

            long long ts = j.value("ts", 0LL);
            entry.timestamp = std::chrono::system_clock::time_point(
                std::chrono::milliseconds(ts));

            results.push_back(entry);
        } catch (const json::exception& e) {
            // A crash mid-append leaves at most one torn trailing line.
            std::cerr << "[VersionLogFs] Skipping malformed line " << lineNo << " of "
                      << m_logPath << ": " << e.what() << std::endl;
        }
    }
    return results;
}

} // namespace sceneloom::infrastructure
