#include "application/EventDispatcher.hpp"
#include <iostream>

namespace sceneloom::application {

EventDispatcher::EventDispatcher() : m_running(true) {
    m_worker = std::thread(&EventDispatcher::workerLoop, this);
}

EventDispatcher::~EventDispatcher() {
    stop();
}

void EventDispatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        if (isDispatcherThread()) {
            m_worker.detach();
        } else {
            m_worker.join();
        }
    }
}

void EventDispatcher::post(Event event) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_queue.push(std::move(event));
    }
    m_cv.notify_one();
}

bool EventDispatcher::isDispatcherThread() const {
    return std::this_thread::get_id() == m_worker.get_id();
}

void EventDispatcher::workerLoop() {
    while (true) {
        Event event;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (!m_running && m_queue.empty()) {
                return;
            }

            event = std::move(m_queue.front());
            m_queue.pop();
        }

        try {
            event();
        } catch (const std::exception& e) {
            std::cerr << "[EventDispatcher] Listener threw: " << e.what() << std::endl;
        }
    }
}

} // namespace sceneloom::application
