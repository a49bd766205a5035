/**
 * @file EventDispatcher.hpp
 * @brief Single background thread that runs queued notifications in order.
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>

namespace sceneloom::application {

/**
 * @class EventDispatcher
 * @brief Serializes listener callbacks onto one thread.
 *
 * Events are delivered in post() order. Because callbacks never run on the
 * poster's thread, a listener may call back into whoever posted the event.
 */
class EventDispatcher {
public:
    using Event = std::function<void()>;

    EventDispatcher();
    ~EventDispatcher();

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    /** @brief Queues an event. Ignored after stop(). */
    void post(Event event);

    /**
     * @brief Delivers everything already queued, then joins the thread. Idempotent.
     */
    void stop();

    /** @brief True when called from the dispatcher thread itself. */
    bool isDispatcherThread() const;

private:
    void workerLoop();

    std::queue<Event> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;

    std::thread m_worker;
    std::atomic<bool> m_running;
};

} // namespace sceneloom::application
