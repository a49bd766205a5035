/**
 * @file AtomicFile.hpp
 * @brief Synchronous atomic file writes (temp -> rename) for durable records.
 */

#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace sceneloom::infrastructure {

/**
 * @brief Writes `content` to `path` through a uniquely named temp file and a rename,
 *        creating parent directories as needed.
 *
 * Readers never observe a half-written file.
 * @throws domain::StorageError on any failure; the temp file is removed.
 */
void WriteTextAtomic(const std::filesystem::path& path, const std::string& content);

/**
 * @brief Appends one line (a newline is added) and flushes.
 * @throws domain::StorageError if the file cannot be opened or written.
 */
void AppendLine(const std::filesystem::path& path, const std::string& line);

/**
 * @brief Reads a whole file in binary mode. Returns nullopt if it cannot be opened.
 */
std::optional<std::string> ReadTextFile(const std::filesystem::path& path);

} // namespace sceneloom::infrastructure
