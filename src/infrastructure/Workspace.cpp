#include "infrastructure/Workspace.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/AtomicFile.hpp"
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <system_error>
#include <vector>

namespace sceneloom::infrastructure {

namespace fs = std::filesystem;

Workspace::Workspace(const fs::path& parentDir) {
    fs::path parent = parentDir.empty() ? fs::temp_directory_path() : parentDir;
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        throw domain::StorageError("Cannot create workspace parent " + parent.string() + ": " + ec.message());
    }

    std::string pattern = (parent / "sceneloom_XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
        throw domain::StorageError("Cannot create workspace under " + parent.string() + ": " + std::strerror(errno));
    }
    m_root = fs::path(buffer.data());
}

std::string Workspace::DeriveStem(const std::string& logicalName) {
    std::string stem;
    stem.reserve(logicalName.size());
    for (unsigned char c : logicalName) {
        if (std::isalnum(c)) {
            stem += static_cast<char>(std::tolower(c));
        } else {
            stem += '_';
        }
    }
    if (stem.empty()) stem = "scene";
    return stem;
}

SourceHandle Workspace::writeSource(const std::string& code, const std::string& logicalName) {
    if (m_purged) {
        throw domain::StorageError("Workspace " + m_root.string() + " has been purged");
    }

    SourceHandle handle;
    handle.stem = DeriveStem(logicalName);
    handle.jobDir = m_root / ("job-" + std::to_string(m_nextJob++));
    handle.mediaDir = handle.jobDir / "media";
    handle.path = handle.jobDir / (handle.stem + ".py");

    std::error_code ec;
    fs::create_directories(handle.mediaDir, ec);
    if (ec) {
        throw domain::StorageError("Cannot create job directory " + handle.jobDir.string() + ": " + ec.message());
    }
    WriteTextAtomic(handle.path, code);
    return handle;
}

void Workspace::purge() {
    if (m_purged.exchange(true)) return;

    std::error_code ec;
    fs::remove_all(m_root, ec);
    if (ec) {
        std::cerr << "[Workspace] Failed to remove " << m_root << ": " << ec.message() << std::endl;
    }
}

} // namespace sceneloom::infrastructure
