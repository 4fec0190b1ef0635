#include "backend/ProcessTransfer.hpp"
#include "transfer/errors.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace sf::backend;
using namespace sf::transfer;

namespace {

struct Fd {
    int fd = -1;
    ~Fd() { if (fd >= 0) ::close(fd); }
    void reset() { if (fd >= 0) ::close(fd); fd = -1; }
};

}

ProcessTransfer::ProcessTransfer(std::string name, std::vector<std::string> argv, const bool pausable,
                                 std::filesystem::path output, const std::chrono::milliseconds killGrace)
    : ThreadedTransfer(std::move(name), pausable),
      argv_(std::move(argv)), output_(std::move(output)), killGrace_(killGrace) {
    if (argv_.empty()) throw std::invalid_argument("ProcessTransfer requires a program");
}

std::string ProcessTransfer::lastLines(const std::deque<std::string>& tail, const size_t n) {
    std::string out;
    const size_t start = tail.size() > n ? tail.size() - n : 0;
    for (size_t i = start; i < tail.size(); ++i) {
        if (!out.empty()) out += " | ";
        out += tail[i];
    }
    return out;
}

void ProcessTransfer::classifyExit(const int exitCode, const std::deque<std::string>& tail) {
    throw FatalTransferError(fmt::format("{} exited with status {}: {}", argv_.front(), exitCode, lastLines(tail)));
}

void ProcessTransfer::emitLine() {
    if (partial_.empty()) return;
    std::string line;
    line.swap(partial_);

    tail_.push_back(line);
    if (tail_.size() > TAIL_LINES) tail_.pop_front();

    onLine(line);
}

void ProcessTransfer::feed(const char* data, const size_t len) {
    for (size_t i = 0; i < len; ++i) {
        if (data[i] == '\n' || data[i] == '\r') emitLine();
        else partial_.push_back(data[i]);
    }
}

std::filesystem::path ProcessTransfer::run() {
    if (cancelRequested()) return {};

    // argv is materialised before fork; the child only calls async-signal-safe functions
    std::vector<char*> cargv;
    cargv.reserve(argv_.size() + 1);
    for (auto& a : argv_) cargv.push_back(a.data());
    cargv.push_back(nullptr);

    int pipefd[2];
    if (pipe2(pipefd, O_CLOEXEC) == -1) throw FatalTransferError(fmt::format("pipe2 failed: {}", std::strerror(errno)));
    Fd readEnd{pipefd[0]}, writeEnd{pipefd[1]};

    const pid_t pid = fork();
    if (pid < 0) throw TransientTransferError(fmt::format("fork failed: {}", std::strerror(errno)));

    if (pid == 0) {
        setpgid(0, 0);
        const int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        dup2(pipefd[1], STDOUT_FILENO);
        dup2(pipefd[1], STDERR_FILENO);
        execvp(cargv[0], cargv.data());
        _exit(127); // exec failed
    }

    setpgid(pid, pid);
    writeEnd.reset();
    log::Registry::download()->debug("[{}] Spawned {} (pid {})", name_, argv_.front(), pid);

    bool termSent = false, killSent = false, stopped = false, eof = false;
    auto termAt = std::chrono::steady_clock::now();
    int status = 0;
    bool reaped = false;

    const auto signalGroup = [pid](const int sig) {
        if (::kill(-pid, sig) == -1) ::kill(pid, sig);
    };

    while (!reaped) {
        if (cancelRequested() && !termSent) {
            signalGroup(SIGTERM);
            if (stopped) signalGroup(SIGCONT);
            termSent = true;
            termAt = std::chrono::steady_clock::now();
        } else if (termSent && !killSent && std::chrono::steady_clock::now() - termAt > killGrace_) {
            log::Registry::download()->warn("[{}] {} ignored SIGTERM, sending SIGKILL", name_, argv_.front());
            signalGroup(SIGKILL);
            killSent = true;
        }

        if (!termSent && supportsPause() && pauseRequested() != stopped) {
            signalGroup(pauseRequested() ? SIGSTOP : SIGCONT);
            stopped = pauseRequested();
        }

        if (!eof) {
            pollfd pfd{readEnd.fd, POLLIN, 0};
            const int rc = ::poll(&pfd, 1, 100);
            if (rc > 0) {
                char buf[4096];
                const ssize_t n = ::read(readEnd.fd, buf, sizeof(buf));
                if (n > 0) feed(buf, static_cast<size_t>(n));
                else if (n == 0 || (errno != EINTR && errno != EAGAIN)) eof = true;
            } else if (rc < 0 && errno != EINTR) eof = true;
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }

        const pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) reaped = true;
        else if (w < 0 && errno != EINTR) {
            reaped = true;
            status = 0;
        }
    }

    // drain anything left in the pipe
    if (!eof) {
        char buf[4096];
        ssize_t n;
        const int flags = fcntl(readEnd.fd, F_GETFL);
        fcntl(readEnd.fd, F_SETFL, flags | O_NONBLOCK);
        while ((n = ::read(readEnd.fd, buf, sizeof(buf))) > 0) feed(buf, static_cast<size_t>(n));
    }
    emitLine();

    if (cancelRequested()) return {};

    if (WIFSIGNALED(status))
        throw TransientTransferError(fmt::format("{} killed by signal {}", argv_.front(), WTERMSIG(status)));

    const int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (code == 127 && tail_.empty()) throw FatalTransferError("Failed to execute " + argv_.front());
    if (code != 0) {
        classifyExit(code, tail_);
        throw FatalTransferError(fmt::format("{} exited with status {}", argv_.front(), code));
    }

    return output_;
}
