/**
 * @file AsyncTaskManager.hpp
 * @brief Runs code producers in the background with unified status tracking.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sceneloom::application {

/**
 * @enum TaskType
 * @brief Categories of background work.
 */
enum class TaskType {
    CodeGeneration,
    VariableEdit
};

/**
 * @struct TaskStatus
 * @brief Information about a running or completed task.
 */
struct TaskStatus {
    int id;
    TaskType type;
    std::string description;
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::string errorMessage; ///< Written once, before isCompleted is set.
};

/**
 * @class AsyncTaskManager
 * @brief Manages background execution of generator and transform calls.
 *
 * Threads are owned, not detached: waitAll() and the destructor join them, so
 * a task never outlives the objects its callable captured.
 */
class AsyncTaskManager {
public:
    AsyncTaskManager() = default;
    ~AsyncTaskManager() { waitAll(); }

    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    /** @brief Runs `f(status)` on a new thread. Exceptions mark the task failed. */
    template<typename F>
    std::shared_ptr<TaskStatus> SubmitTask(TaskType type, const std::string& description, F&& f) {
        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->type = type;
        status->description = description;

        JoinFinishedThreads();

        std::lock_guard<std::mutex> lock(m_tasksMutex);
        m_activeTasks.push_back(status);
        std::thread thread([this, status, userFunc = std::forward<F>(f)]() mutable {
            try {
                userFunc(status);
            } catch (const std::exception& e) {
                status->failed = true;
                status->errorMessage = e.what();
            }
            status->isCompleted = true;
            CleanupCompletedTasks();
        });
        m_threads.push_back(OwnedThread{status, std::move(thread)});
        return status;
    }

    /** @brief Returns snapshots of all active tasks. */
    std::vector<std::shared_ptr<TaskStatus>> GetActiveTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_activeTasks;
    }

    /** @brief Joins every task submitted so far. Must not be called from a task. */
    void waitAll() {
        std::vector<OwnedThread> threads;
        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            threads.swap(m_threads);
        }
        for (auto& t : threads) {
            if (t.thread.joinable()) t.thread.join();
        }
    }

    /** @brief Threads not yet joined, finished or not. */
    size_t ownedThreadCount() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_threads.size();
    }

private:
    struct OwnedThread {
        std::shared_ptr<TaskStatus> status;
        std::thread thread;
    };

    // Joined outside the lock: a finishing task still takes it in CleanupCompletedTasks().
    void JoinFinishedThreads() {
        std::vector<OwnedThread> finished;
        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            auto split = std::stable_partition(m_threads.begin(), m_threads.end(),
                [](const OwnedThread& t) { return !t.status->isCompleted.load(); });
            std::move(split, m_threads.end(), std::back_inserter(finished));
            m_threads.erase(split, m_threads.end());
        }
        for (auto& t : finished) {
            if (t.thread.joinable()) t.thread.join();
        }
    }

    void CleanupCompletedTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        m_activeTasks.erase(
            std::remove_if(m_activeTasks.begin(), m_activeTasks.end(),
                [](const auto& s) { return s->isCompleted.load(); }),
            m_activeTasks.end()
        );
    }

    std::atomic<int> m_nextId{0};
    std::vector<std::shared_ptr<TaskStatus>> m_activeTasks;
    std::vector<OwnedThread> m_threads;
    std::mutex m_tasksMutex;
};

} // namespace sceneloom::application
