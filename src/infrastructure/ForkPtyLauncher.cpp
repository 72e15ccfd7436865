/**
 * @file ForkPtyLauncher.cpp
 * @brief Implementation of ForkPtyLauncher.
 */

#include "infrastructure/ForkPtyLauncher.hpp"

#include "domain/Errors.hpp"

#include <pty.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <mutex>
#include <system_error>
#include <thread>
#include <vector>

extern char** environ;

namespace agentdeck::infrastructure {

namespace {

constexpr int kPollIntervalMs = 100;
constexpr std::size_t kReadChunk = 8192;

int DecodeExitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

std::vector<std::string> BuildEnvironment(const domain::SpawnRequest& request) {
    std::vector<std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        const std::string item(*entry);
        const std::string name = item.substr(0, item.find('='));
        const bool removed = std::find(request.unsetEnv.begin(), request.unsetEnv.end(), name) != request.unsetEnv.end();
        if (!removed && request.env.count(name) == 0) {
            env.push_back(item);
        }
    }
    for (const auto& [name, value] : request.env) {
        env.push_back(name + "=" + value);
    }
    return env;
}

/**
 * @class ForkPtyProcess
 * @brief Owns the master side of the pty, the child pid and the reader thread.
 */
class ForkPtyProcess : public domain::PtyProcess {
public:
    ForkPtyProcess(pid_t pid, int masterFd, domain::ProcessCallbacks callbacks, std::chrono::milliseconds killGrace)
        : m_pid(pid), m_masterFd(masterFd), m_callbacks(std::move(callbacks)), m_killGrace(killGrace) {
        m_reader = std::thread(&ForkPtyProcess::readerLoop, this);
    }

    ~ForkPtyProcess() override {
        if (!m_finished) {
            try {
                kill();
            } catch (const std::exception& e) {
                std::cerr << "[ForkPtyLauncher] Kill of pid " << m_pid << " failed: " << e.what() << std::endl;
            }
        }
        if (m_reader.joinable()) {
            m_reader.join();
        }
    }

    bool write(const std::string& data) override {
        std::lock_guard<std::mutex> lock(m_fdMutex);
        if (m_masterFd < 0) {
            return false;
        }
        std::size_t offset = 0;
        while (offset < data.size()) {
            const ssize_t n = ::write(m_masterFd, data.data() + offset, data.size() - offset);
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) {
                    continue;
                }
                return false;
            }
            offset += static_cast<std::size_t>(n);
        }
        return true;
    }

    bool resize(const domain::TerminalSize& size) override {
        std::lock_guard<std::mutex> lock(m_fdMutex);
        if (m_masterFd < 0) {
            return false;
        }
        struct winsize ws {};
        ws.ws_col = static_cast<unsigned short>(size.cols);
        ws.ws_row = static_cast<unsigned short>(size.rows);
        return ::ioctl(m_masterFd, TIOCSWINSZ, &ws) == 0;
    }

    void kill() override {
        if (m_finished) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(m_killMutex);
            if (!m_killRequested) {
                m_killRequested = true;
                m_killRequestedAt = std::chrono::steady_clock::now();
            }
        }
        // The child is a session leader: hang up its whole process group.
        ::kill(-m_pid, SIGHUP);
        if (::kill(m_pid, SIGTERM) != 0 && errno != ESRCH) {
            throw std::system_error(errno, std::generic_category(), "kill(" + std::to_string(m_pid) + ")");
        }
    }

    int pid() const override { return m_pid; }

private:
    bool reap(int& status) {
        const pid_t result = ::waitpid(m_pid, &status, WNOHANG);
        return result == m_pid;
    }

    void escalateIfDue() {
        std::lock_guard<std::mutex> lock(m_killMutex);
        if (m_killRequested && !m_escalated &&
            std::chrono::steady_clock::now() - m_killRequestedAt >= m_killGrace) {
            m_escalated = true;
            std::cerr << "[ForkPtyLauncher] pid " << m_pid << " ignored SIGTERM, sending SIGKILL" << std::endl;
            ::kill(-m_pid, SIGKILL);
            ::kill(m_pid, SIGKILL);
        }
    }

    void readerLoop() {
        int status = 0;
        bool reaped = false;
        std::vector<char> buffer(kReadChunk);

        while (true) {
            struct pollfd pfd {};
            pfd.fd = m_masterFd;
            pfd.events = POLLIN;
            const int ready = ::poll(&pfd, 1, kPollIntervalMs);

            if (ready > 0) {
                if (pfd.revents & POLLIN) {
                    const ssize_t n = ::read(m_masterFd, buffer.data(), buffer.size());
                    if (n > 0) {
                        if (m_callbacks.onData) {
                            m_callbacks.onData(std::string(buffer.data(), static_cast<std::size_t>(n)));
                        }
                        continue;
                    }
                    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
                        continue;
                    }
                    break; // EOF or EIO: the slave side is closed.
                }
                if (pfd.revents & (POLLHUP | POLLERR | POLLNVAL)) {
                    break;
                }
            } else if (ready < 0 && errno != EINTR) {
                break;
            }

            if (!reaped) {
                reaped = reap(status);
            } else if (ready == 0) {
                break; // Reaped and drained.
            }
            escalateIfDue();
        }

        while (!reaped) {
            reaped = reap(status);
            if (!reaped) {
                escalateIfDue();
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }
        }

        {
            std::lock_guard<std::mutex> lock(m_fdMutex);
            ::close(m_masterFd);
            m_masterFd = -1;
        }
        m_finished = true;
        if (m_callbacks.onExit) {
            m_callbacks.onExit(DecodeExitStatus(status));
        }
    }

    const pid_t m_pid;
    int m_masterFd;
    domain::ProcessCallbacks m_callbacks;
    std::chrono::milliseconds m_killGrace;

    std::mutex m_fdMutex;
    std::mutex m_killMutex;
    bool m_killRequested = false;
    bool m_escalated = false;
    std::chrono::steady_clock::time_point m_killRequestedAt;
    std::atomic<bool> m_finished{false};
    std::thread m_reader;
};

} // namespace

ForkPtyLauncher::ForkPtyLauncher(std::chrono::milliseconds killGrace) : m_killGrace(killGrace) {}

std::unique_ptr<domain::PtyProcess> ForkPtyLauncher::spawn(const domain::SpawnRequest& request,
                                                           domain::ProcessCallbacks callbacks) {
    if (request.command.empty()) {
        throw domain::SpawnError("No command to launch");
    }

    // Everything the child needs is prepared before fork().
    std::vector<std::string> args;
    args.push_back(request.command);
    args.insert(args.end(), request.args.begin(), request.args.end());
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> envStrings = BuildEnvironment(request);
    std::vector<char*> envp;
    for (auto& entry : envStrings) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    const char* workingDirectory = request.workingDirectory ? request.workingDirectory->c_str() : nullptr;

    int errorPipe[2];
    if (::pipe2(errorPipe, O_CLOEXEC) != 0) {
        throw domain::SpawnError(std::string("pipe2() failed: ") + std::strerror(errno));
    }

    struct winsize ws {};
    ws.ws_col = static_cast<unsigned short>(request.size.cols > 0 ? request.size.cols : 80);
    ws.ws_row = static_cast<unsigned short>(request.size.rows > 0 ? request.size.rows : 24);

    int masterFd = -1;
    const pid_t pid = ::forkpty(&masterFd, nullptr, nullptr, &ws);
    if (pid < 0) {
        const int err = errno;
        ::close(errorPipe[0]);
        ::close(errorPipe[1]);
        throw domain::SpawnError(std::string("forkpty() failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on.
        ::close(errorPipe[0]);
        // The host may block signals it handles synchronously; the mask survives exec.
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);
        if (workingDirectory && ::chdir(workingDirectory) != 0) {
            const int err = errno;
            ssize_t ignored = ::write(errorPipe[1], &err, sizeof(err));
            (void)ignored;
            ::_exit(127);
        }
        environ = envp.data();
        ::execvp(argv[0], argv.data());
        const int err = errno;
        ssize_t ignored = ::write(errorPipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    ::close(errorPipe[1]);
    int childErrno = 0;
    ssize_t n;
    do {
        n = ::read(errorPipe[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    ::close(errorPipe[0]);

    if (n > 0) {
        ::close(masterFd);
        int status = 0;
        ::waitpid(pid, &status, 0);
        throw domain::SpawnError("Failed to launch " + request.command + ": " + std::strerror(childErrno));
    }

    ::fcntl(masterFd, F_SETFD, FD_CLOEXEC);
    return std::make_unique<ForkPtyProcess>(pid, masterFd, std::move(callbacks), m_killGrace);
}

} // namespace agentdeck::infrastructure
