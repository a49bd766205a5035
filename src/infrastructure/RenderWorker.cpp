#include "infrastructure/RenderWorker.hpp"
#include "infrastructure/ArtifactLocator.hpp"
#include "infrastructure/RenderErrorParser.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <poll.h>
#include <regex>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

namespace sceneloom::infrastructure {

namespace {
    using Clock = std::chrono::steady_clock;

    constexpr auto kTerminateGrace = std::chrono::seconds(2);
    constexpr auto kPollSlice = std::chrono::milliseconds(100);
    constexpr size_t kStderrTailLines = 20;

    std::atomic<int> g_liveProcesses{0};

    void CloseFd(int& fd) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }

    // Reads whatever is available. Returns false once the pipe hit EOF or failed.
    bool DrainInto(int fd, std::string& sink, std::string* lastChunk) {
        char buffer[4096];
        while (true) {
            ssize_t n = ::read(fd, buffer, sizeof(buffer));
            if (n > 0) {
                sink.append(buffer, static_cast<size_t>(n));
                if (lastChunk) lastChunk->append(buffer, static_cast<size_t>(n));
                continue;
            }
            if (n == 0) return false;
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
            return false;
        }
    }

    void SignalGroup(pid_t pgid, int sig) {
        if (pgid <= 0) return;
        if (::killpg(pgid, sig) != 0 && errno != ESRCH) {
            std::cerr << "[RenderWorker] killpg(" << pgid << ", " << sig << ") failed: "
                      << std::strerror(errno) << std::endl;
        }
    }

    domain::RenderOutcome LaunchFailure(const std::string& reason, Clock::time_point startedAt) {
        domain::RenderOutcome outcome;
        outcome.status = domain::RenderStatus::Failed;
        outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - startedAt);
        outcome.failure = domain::RenderFailure{domain::FailureKind::ProcessLaunchFailure, 0, reason, {}};
        return outcome;
    }

    std::string DescribeCommand(const std::vector<std::string>& argv) {
        std::string out;
        for (const auto& arg : argv) {
            if (!out.empty()) out += ' ';
            out += arg;
        }
        return out;
    }
}

RenderWorker::RenderWorker(std::vector<std::string> rendererCommand)
    : m_command(std::move(rendererCommand))
    , m_cancel(std::make_shared<CancellationToken>())
{}

RenderWorker::~RenderWorker() {
    if (isRunning()) cancel();
    wait();
}

int RenderWorker::LiveProcessCount() {
    return g_liveProcesses.load();
}

std::vector<std::string> RenderWorker::BuildArguments(const std::vector<std::string>& rendererCommand,
                                                      const std::filesystem::path& sourcePath,
                                                      const std::string& entryPointName,
                                                      const domain::RenderConfig& config,
                                                      const std::filesystem::path& mediaDir) {
    std::vector<std::string> argv = rendererCommand;
    argv.push_back(sourcePath.string());
    argv.push_back(entryPointName);
    argv.push_back(std::string("-q") + domain::QualityFlag(config.quality));
    argv.push_back("--format");
    argv.push_back(domain::FormatExtension(config.format));
    argv.push_back("--media_dir");
    argv.push_back(mediaDir.string());
    if (config.disableCaching) argv.push_back("--disable_caching");
    return argv;
}

std::shared_future<domain::RenderOutcome> RenderWorker::start(const SourceHandle& source,
                                                              const std::string& entryPointName,
                                                              const domain::RenderConfig& config,
                                                              OnFinished onFinished,
                                                              OnProgress onProgress) {
    WorkerState expected = WorkerState::Idle;
    if (!m_state.compare_exchange_strong(expected, WorkerState::Running)) {
        throw std::logic_error("RenderWorker::start called twice");
    }

    m_onFinished = std::move(onFinished);
    m_onProgress = std::move(onProgress);
    std::shared_future<domain::RenderOutcome> future = m_promise.get_future().share();

    m_thread = std::thread(&RenderWorker::run, this, source, entryPointName, config);
    return future;
}

void RenderWorker::cancel() {
    WorkerState current = m_state.load();
    if (current != WorkerState::Idle && current != WorkerState::Running) return;
    m_cancel->cancel();
}

void RenderWorker::wait() {
    std::lock_guard<std::mutex> lock(m_joinMutex);
    if (m_thread.joinable()) {
        if (m_thread.get_id() == std::this_thread::get_id()) {
            // Called from the worker's own callback; the owner joins later.
            return;
        }
        m_thread.join();
    }
}

void RenderWorker::run(SourceHandle source, std::string entryPointName, domain::RenderConfig config) {
    domain::RenderOutcome outcome;
    try {
        outcome = execute(source, entryPointName, config);
    } catch (const std::exception& e) {
        outcome = LaunchFailure(std::string("Render worker error: ") + e.what(), Clock::now());
    }

    switch (outcome.status) {
        case domain::RenderStatus::Completed: m_state = WorkerState::Completed; break;
        case domain::RenderStatus::Failed: m_state = WorkerState::Failed; break;
        case domain::RenderStatus::TimedOut: m_state = WorkerState::TimedOut; break;
        case domain::RenderStatus::Cancelled: m_state = WorkerState::Cancelled; break;
    }

    if (m_onFinished) {
        try {
            m_onFinished(outcome);
        } catch (const std::exception& e) {
            std::cerr << "[RenderWorker] Completion callback threw: " << e.what() << std::endl;
        }
    }
    m_promise.set_value(std::move(outcome));
}

domain::RenderOutcome RenderWorker::execute(const SourceHandle& source,
                                            const std::string& entryPointName,
                                            const domain::RenderConfig& config) {
    const auto startedAt = Clock::now();

    if (m_cancel->isCancelled()) {
        domain::RenderOutcome outcome;
        outcome.status = domain::RenderStatus::Cancelled;
        outcome.failure = domain::RenderFailure{domain::FailureKind::Cancelled, 0, "Render cancelled", {}};
        return outcome;
    }
    if (m_command.empty()) {
        return LaunchFailure("Renderer command is empty", startedAt);
    }

    const std::filesystem::path mediaDir = config.outputDir.empty() ? source.mediaDir : config.outputDir;
    std::error_code ec;
    std::filesystem::create_directories(mediaDir, ec);

    const std::vector<std::string> args = BuildArguments(m_command, source.path, entryPointName, config, mediaDir);
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    std::cout << "[RenderWorker] Running: " << DescribeCommand(args) << std::endl;

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int execPipe[2] = {-1, -1};
    if (::pipe2(outPipe, O_CLOEXEC) != 0 || ::pipe2(errPipe, O_CLOEXEC) != 0 || ::pipe2(execPipe, O_CLOEXEC) != 0) {
        std::string reason = std::string("Failed to create pipes: ") + std::strerror(errno);
        for (int* p : {outPipe, errPipe, execPipe}) {
            CloseFd(p[0]);
            CloseFd(p[1]);
        }
        return LaunchFailure(reason, startedAt);
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        std::string reason = std::string("fork failed: ") + std::strerror(errno);
        for (int* p : {outPipe, errPipe, execPipe}) {
            CloseFd(p[0]);
            CloseFd(p[1]);
        }
        return LaunchFailure(reason, startedAt);
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        int devNull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devNull == STDIN_FILENO) {
            ::fcntl(devNull, F_SETFD, 0);
        } else if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
            ::close(devNull);
        }
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::execvp(argv[0], argv.data());
        int err = errno;
        ssize_t written = ::write(execPipe[1], &err, sizeof(err));
        (void)written;
        ::_exit(127);
    }

    // Both sides set the group so killpg works no matter which runs first.
    ::setpgid(pid, pid);
    const pid_t pgid = pid;
    m_pid = pid;
    ++g_liveProcesses;

    CloseFd(outPipe[1]);
    CloseFd(errPipe[1]);
    CloseFd(execPipe[1]);

    // The exec pipe closes on a successful exec; a payload means exec failed.
    int execErrno = 0;
    ssize_t got;
    do {
        got = ::read(execPipe[0], &execErrno, sizeof(execErrno));
    } while (got < 0 && errno == EINTR);
    CloseFd(execPipe[0]);

    if (got == static_cast<ssize_t>(sizeof(execErrno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        --g_liveProcesses;
        CloseFd(outPipe[0]);
        CloseFd(errPipe[0]);
        return LaunchFailure("Failed to launch renderer '" + args.front() + "': " + std::strerror(execErrno),
                             startedAt);
    }

    for (int fd : {outPipe[0], errPipe[0]}) {
        ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | O_NONBLOCK);
    }

    int outFd = outPipe[0];
    int errFd = errPipe[0];
    int cancelFd = m_cancel->waitFd();

    domain::RenderOutcome outcome;
    const auto deadline = startedAt + config.timeout;
    bool timedOut = false;
    bool cancelled = false;
    bool exited = false;
    int waitStatus = 0;
    std::optional<Clock::time_point> escalateAt;

    while (!exited) {
        auto now = Clock::now();
        auto slice = kPollSlice;
        if (outFd < 0 && errFd < 0) slice = std::chrono::milliseconds(10);
        if (!timedOut && deadline - now < slice) {
            slice = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        }
        if (slice.count() < 0) slice = std::chrono::milliseconds(0);

        pollfd fds[3] = {
            {outFd, POLLIN, 0},
            {errFd, POLLIN, 0},
            {cancelFd, POLLIN, 0},
        };
        int ready = ::poll(fds, 3, static_cast<int>(slice.count()));
        if (ready < 0 && errno != EINTR) {
            std::cerr << "[RenderWorker] poll failed: " << std::strerror(errno) << std::endl;
        }

        if (ready > 0) {
            if (outFd >= 0 && (fds[0].revents & (POLLIN | POLLHUP | POLLERR))) {
                std::string chunk;
                if (!DrainInto(outFd, outcome.stdoutText, &chunk)) CloseFd(outFd);
                reportProgress(chunk);
            }
            if (errFd >= 0 && (fds[1].revents & (POLLIN | POLLHUP | POLLERR))) {
                std::string chunk;
                if (!DrainInto(errFd, outcome.stderrText, &chunk)) CloseFd(errFd);
                reportProgress(chunk);
            }
            if (cancelFd >= 0 && (fds[2].revents & POLLIN)) {
                cancelled = true;
                cancelFd = -1;
                if (!timedOut) {
                    std::cout << "[RenderWorker] Cancelling render (pid " << pid << ")" << std::endl;
                    SignalGroup(pgid, SIGTERM);
                    escalateAt = Clock::now() + kTerminateGrace;
                }
            }
        }

        now = Clock::now();
        if (!timedOut && !cancelled && now >= deadline) {
            std::cout << "[RenderWorker] Render timed out after " << config.timeout.count()
                      << " ms, killing pid " << pid << std::endl;
            timedOut = true;
            SignalGroup(pgid, SIGKILL);
        }
        if (escalateAt && now >= *escalateAt) {
            SignalGroup(pgid, SIGKILL);
            escalateAt.reset();
        }

        pid_t reaped = ::waitpid(pid, &waitStatus, WNOHANG);
        if (reaped == pid) {
            exited = true;
        } else if (reaped < 0 && errno != EINTR) {
            std::cerr << "[RenderWorker] waitpid failed: " << std::strerror(errno) << std::endl;
            exited = true;
        }
    }

    // Whatever the leader left behind in its group goes too.
    SignalGroup(pgid, SIGKILL);
    --g_liveProcesses;

    if (outFd >= 0) {
        DrainInto(outFd, outcome.stdoutText, nullptr);
        CloseFd(outFd);
    }
    if (errFd >= 0) {
        DrainInto(errFd, outcome.stderrText, nullptr);
        CloseFd(errFd);
    }

    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - startedAt);

    if (timedOut) {
        outcome.status = domain::RenderStatus::TimedOut;
        outcome.elapsed = config.timeout;
        const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(config.timeout).count();
        outcome.failure = domain::RenderFailure{domain::FailureKind::Timeout, 0,
                                                "Render timed out after " + std::to_string(seconds) + " seconds",
                                                RenderErrorParser::Tail(outcome.stderrText, kStderrTailLines)};
        return outcome;
    }
    if (cancelled) {
        outcome.status = domain::RenderStatus::Cancelled;
        outcome.failure = domain::RenderFailure{domain::FailureKind::Cancelled, 0, "Render cancelled", {}};
        return outcome;
    }

    int exitCode = 0;
    if (WIFEXITED(waitStatus)) {
        exitCode = WEXITSTATUS(waitStatus);
    } else if (WIFSIGNALED(waitStatus)) {
        exitCode = 128 + WTERMSIG(waitStatus);
    }

    if (exitCode != 0) {
        const auto parsed = RenderErrorParser::Parse(outcome.stderrText, source.path.string());
        outcome.status = domain::RenderStatus::Failed;
        outcome.failure = domain::RenderFailure{domain::FailureKind::NonZeroExit, exitCode,
                                                "Render failed with code " + std::to_string(exitCode) + ": " + parsed.summary,
                                                RenderErrorParser::Tail(parsed.cleanedStderr, kStderrTailLines)};
        return outcome;
    }

    auto artifact = ArtifactLocator::Locate(source.stem, entryPointName, config.quality, mediaDir, config.format);
    if (!artifact) {
        outcome.status = domain::RenderStatus::Failed;
        outcome.failure = domain::RenderFailure{domain::FailureKind::ArtifactNotFound, 0,
                                                "Render completed but output video not found", {}};
        return outcome;
    }

    outcome.status = domain::RenderStatus::Completed;
    outcome.artifactPath = *artifact;
    return outcome;
}

void RenderWorker::reportProgress(const std::string& chunk) {
    if (!m_onProgress || chunk.empty()) return;

    static const std::regex percentRe("(\\d{1,3})%");
    int percent = -1;
    for (auto it = std::sregex_iterator(chunk.begin(), chunk.end(), percentRe); it != std::sregex_iterator(); ++it) {
        int value = std::stoi((*it)[1].str());
        if (value <= 100) percent = value;
    }
    if (percent < 0 || percent == m_lastPercent) return;

    m_lastPercent = percent;
    try {
        m_onProgress(percent);
    } catch (const std::exception& e) {
        std::cerr << "[RenderWorker] Progress callback threw: " << e.what() << std::endl;
    }
}

} // namespace sceneloom::infrastructure
