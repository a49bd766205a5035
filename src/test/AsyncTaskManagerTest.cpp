#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "application/AsyncTaskManager.hpp"

using namespace sceneloom;

namespace {

bool AllCompleted(const std::vector<std::shared_ptr<application::TaskStatus>>& statuses) {
    for (const auto& s : statuses) {
        if (!s->isCompleted) return false;
    }
    return true;
}

} // namespace

int main() {
    std::cout << "[Test] Starting AsyncTaskManager Test..." << std::endl;

    application::AsyncTaskManager tasks;
    std::atomic<int> runs{0};

    std::vector<std::shared_ptr<application::TaskStatus>> statuses;
    for (int i = 0; i < 5; ++i) {
        statuses.push_back(tasks.SubmitTask(application::TaskType::VariableEdit, "edit " + std::to_string(i),
            [&runs](std::shared_ptr<application::TaskStatus>) { runs++; }));
    }
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (!AllCompleted(statuses) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(AllCompleted(statuses));
    assert(runs == 5);

    // Finished threads are joined by the next submit instead of piling up.
    auto failing = tasks.SubmitTask(application::TaskType::CodeGeneration, "generate",
        [](std::shared_ptr<application::TaskStatus>) { throw std::runtime_error("generator offline"); });
    assert(tasks.ownedThreadCount() == 1);
    std::cout << "[PASS] Completed task threads are reclaimed." << std::endl;

    tasks.waitAll();
    assert(failing->isCompleted);
    assert(failing->failed);
    assert(failing->errorMessage == "generator offline");
    assert(tasks.ownedThreadCount() == 0);
    assert(tasks.GetActiveTasks().empty());
    std::cout << "[PASS] Failures are recorded and waitAll joins everything." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
