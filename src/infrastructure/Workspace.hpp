/**
 * @file Workspace.hpp
 * @brief Process-lifetime scratch directory holding the source files handed to the renderer.
 */

#pragma once
#include <atomic>
#include <filesystem>
#include <string>

namespace sceneloom::infrastructure {

/**
 * @struct SourceHandle
 * @brief A scene file written for one render job.
 */
struct SourceHandle {
    std::filesystem::path path;      ///< The .py file.
    std::string stem;                ///< Filename without extension; the renderer names its output tree after it.
    std::filesystem::path jobDir;    ///< Directory private to this job.
    std::filesystem::path mediaDir;  ///< Default --media_dir for this job (jobDir/media).
};

/**
 * @class Workspace
 * @brief Owns a scratch root under the system temp directory.
 *
 * Every writeSource() call gets its own `job-<n>/` directory so a later job
 * never sees an earlier job's output. The root is only removed by purge();
 * an owner that never calls it leaks the directory.
 */
class Workspace {
public:
    /**
     * @param parentDir Where to create the scratch root. Defaults to the system temp directory.
     * @throws domain::StorageError if the root cannot be created.
     */
    explicit Workspace(const std::filesystem::path& parentDir = {});

    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    /**
     * @brief Writes `code` into a fresh job directory.
     * @param logicalName Usually the scene class name. The filename is derived
     *        from it deterministically (see DeriveStem) with ".py" appended.
     * @throws domain::StorageError if the file cannot be written or the workspace was purged.
     */
    SourceHandle writeSource(const std::string& code, const std::string& logicalName);

    /**
     * @brief Recursively removes the scratch root. Safe to call repeatedly; errors are logged only.
     */
    void purge();

    const std::filesystem::path& root() const { return m_root; }
    bool isPurged() const { return m_purged.load(); }

    /**
     * @brief Lower-cases `logicalName` and replaces anything but [a-z0-9_] with '_'.
     *        An empty result becomes "scene".
     */
    static std::string DeriveStem(const std::string& logicalName);

private:
    std::filesystem::path m_root;
    std::atomic<unsigned long long> m_nextJob{1};
    std::atomic<bool> m_purged{false};
};

} // namespace sceneloom::infrastructure
