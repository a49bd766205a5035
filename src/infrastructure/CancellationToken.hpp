#pragma once
#include <atomic>

namespace sceneloom::infrastructure {

/**
 * @class CancellationToken
 * @brief One-shot cancellation request that a poll()-based loop can wait on.
 *
 * cancel() flips the flag and makes waitFd() readable, so a worker blocked in
 * poll() on its subprocess pipes wakes up immediately instead of polling a
 * flag on a timer. Shared between the requester and the worker through a
 * shared_ptr.
 */
class CancellationToken {
public:
    /** @throws std::system_error if the wake-up pipe cannot be created. */
    CancellationToken();
    ~CancellationToken();

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /** @brief Idempotent. Safe from any thread. */
    void cancel();

    bool isCancelled() const { return m_cancelled.load(); }

    /** @brief Read end of the wake-up pipe; becomes readable once cancelled. */
    int waitFd() const { return m_pipe[0]; }

private:
    std::atomic<bool> m_cancelled{false};
    int m_pipe[2] = {-1, -1};
};

} // namespace sceneloom::infrastructure
