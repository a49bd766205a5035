/**
 * @file AtomicFile.cpp
 * @brief Implementation of the atomic write helpers.
 */

#include "infrastructure/AtomicFile.hpp"
#include "domain/Errors.hpp"
#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

namespace sceneloom::infrastructure {

namespace fs = std::filesystem;

namespace {
    std::atomic<unsigned long long> g_tempCounter{0};
}

void WriteTextAtomic(const fs::path& path, const std::string& content) {
    // Create unique temp path: filename.<timestamp>.<counter>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = path;
    tempPath += "." + std::to_string(timestamp) + "." + std::to_string(g_tempCounter++) + ".tmp";

    // 1. Ensure directory exists
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw domain::StorageError("Cannot create directory " + path.parent_path().string() + ": " + ec.message());
        }
    }

    // 2. Write to Temp
    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw domain::StorageError("Cannot open " + tempPath.string() + " for writing");
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            std::error_code ec;
            fs::remove(tempPath, ec);
            throw domain::StorageError("Write failed: " + tempPath.string());
        }
    } // Close happens here automatically

    // 3. Atomic Rename
    std::error_code ec;
    fs::rename(tempPath, path, ec);
    if (ec) {
        std::error_code cleanupEc;
        fs::remove(tempPath, cleanupEc);
        throw domain::StorageError("Rename to " + path.string() + " failed: " + ec.message());
    }
}

void AppendLine(const fs::path& path, const std::string& line) {
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw domain::StorageError("Cannot create directory " + path.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream ofs(path, std::ios::binary | std::ios::app);
    if (!ofs.is_open()) {
        throw domain::StorageError("Cannot open " + path.string() + " for appending");
    }
    ofs << line << '\n';
    ofs.flush();
    if (ofs.fail()) {
        throw domain::StorageError("Append failed: " + path.string());
    }
}

std::optional<std::string> ReadTextFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace sceneloom::infrastructure
