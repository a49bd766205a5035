#include "infrastructure/CancellationToken.hpp"
#include <cerrno>
#include <fcntl.h>
#include <system_error>
#include <unistd.h>

namespace sceneloom::infrastructure {

CancellationToken::CancellationToken() {
    if (::pipe(m_pipe) != 0) {
        throw std::system_error(errno, std::generic_category(), "CancellationToken: pipe");
    }
    for (int fd : m_pipe) {
        ::fcntl(fd, F_SETFD, FD_CLOEXEC);
        ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | O_NONBLOCK);
    }
}

CancellationToken::~CancellationToken() {
    for (int fd : m_pipe) {
        if (fd >= 0) ::close(fd);
    }
}

void CancellationToken::cancel() {
    if (m_cancelled.exchange(true)) return;
    const char byte = 1;
    // Non-blocking; one byte is enough to keep the read end readable.
    ssize_t written = ::write(m_pipe[1], &byte, 1);
    (void)written;
}

} // namespace sceneloom::infrastructure
