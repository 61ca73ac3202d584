#include "util/Subprocess.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <string_view>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/core.h>

using namespace ss::util;
using namespace std::chrono;

namespace {

constexpr int EXEC_FAILED = 127;
constexpr milliseconds POLL_SLICE{50};

struct Pipe {
    int fds[2]{-1, -1};

    ~Pipe() { closeRead(); closeWrite(); }

    bool open() { return ::pipe(fds) == 0; }
    void closeRead() { if (fds[0] >= 0) { ::close(fds[0]); fds[0] = -1; } }
    void closeWrite() { if (fds[1] >= 0) { ::close(fds[1]); fds[1] = -1; } }
};

enum class ReadState { Data, Empty, Closed };

ReadState readSome(const int fd, std::string& into) {
    std::array<char, 4096> buf{};
    const ssize_t n = ::read(fd, buf.data(), buf.size());
    if (n > 0) {
        into.append(buf.data(), static_cast<size_t>(n));
        return ReadState::Data;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) return ReadState::Empty;
    return ReadState::Closed;
}

void drainAvailable(const int fd, std::string& into) {
    while (readSome(fd, into) == ReadState::Data) {}
}

bool reap(const pid_t pid, int& status) {
    return ::waitpid(pid, &status, WNOHANG) == pid;
}

// The child leads its own process group, so signals reach anything it spawned too.
void terminate(const pid_t pid, const milliseconds grace, int& status) {
    ::kill(-pid, SIGTERM);
    const auto deadline = steady_clock::now() + grace;
    while (steady_clock::now() < deadline) {
        if (reap(pid, status)) return;
        std::this_thread::sleep_for(POLL_SLICE);
    }
    ::kill(-pid, SIGKILL);
    ::waitpid(pid, &status, 0);
}

}

ProcessResult Subprocess::run(const std::vector<std::string>& argv, const ProcessOptions& options) {
    ProcessResult result;

    if (argv.empty()) {
        result.spawn_error = "empty command line";
        return result;
    }

    Pipe out, err, execNotify;
    if (!out.open() || !err.open() || !execNotify.open()) {
        result.spawn_error = fmt::format("pipe() failed: {}", std::strerror(errno));
        return result;
    }
    ::fcntl(execNotify.fds[1], F_SETFD, FD_CLOEXEC);

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        result.spawn_error = fmt::format("fork() failed: {}", std::strerror(errno));
        return result;
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(out.fds[1], STDOUT_FILENO);
        ::dup2(err.fds[1], STDERR_FILENO);
        if (const int devnull = ::open("/dev/null", O_RDONLY); devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::close(out.fds[0]);
        ::close(out.fds[1]);
        ::close(err.fds[0]);
        ::close(err.fds[1]);
        ::close(execNotify.fds[0]);

        ::execvp(cargv[0], cargv.data());
        const int code = errno;
        [[maybe_unused]] const auto n = ::write(execNotify.fds[1], &code, sizeof(code));
        _exit(EXEC_FAILED); // exec failed
    }

    out.closeWrite();
    err.closeWrite();
    execNotify.closeWrite();

    // A successful exec closes the CLOEXEC end without writing anything
    int execErrno = 0;
    if (::read(execNotify.fds[0], &execErrno, sizeof(execErrno)) == sizeof(execErrno))
        result.spawn_error = fmt::format("failed to execute '{}': {}", argv.front(), std::strerror(execErrno));
    execNotify.closeRead();

    ::fcntl(out.fds[0], F_SETFL, O_NONBLOCK);
    ::fcntl(err.fds[0], F_SETFL, O_NONBLOCK);

    const auto start = steady_clock::now();
    bool outOpen = true, errOpen = true;
    int status = 0;

    while (true) {
        std::array<pollfd, 2> pfds{};
        nfds_t n = 0;
        if (outOpen) pfds[n++] = {out.fds[0], POLLIN, 0};
        if (errOpen) pfds[n++] = {err.fds[0], POLLIN, 0};

        if (n > 0 && ::poll(pfds.data(), n, static_cast<int>(POLL_SLICE.count())) > 0) {
            for (nfds_t i = 0; i < n; ++i) {
                if (!(pfds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
                if (pfds[i].fd == out.fds[0]) outOpen = readSome(out.fds[0], result.stdout_text) != ReadState::Closed;
                else errOpen = readSome(err.fds[0], result.stderr_text) != ReadState::Closed;
            }
        } else if (n == 0) {
            std::this_thread::sleep_for(POLL_SLICE);
        }

        // Stop on child exit even if a grandchild still holds the pipes open
        if (reap(pid, status)) break;

        if (options.cancel && options.cancel->load()) {
            result.cancelled = true;
            terminate(pid, options.grace, status);
            break;
        }

        if (options.timeout && steady_clock::now() - start >= *options.timeout) {
            result.timed_out = true;
            terminate(pid, options.grace, status);
            break;
        }
    }

    if (outOpen) drainAvailable(out.fds[0], result.stdout_text);
    if (errOpen) drainAvailable(err.fds[0], result.stderr_text);

    if (WIFEXITED(status)) result.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) result.exit_code = 128 + WTERMSIG(status);

    if (result.spawn_error) result.exit_code = EXEC_FAILED;
    return result;
}

std::optional<std::string> Subprocess::which(const std::string& name) {
    namespace fs = std::filesystem;

    if (name.find('/') != std::string::npos) {
        if (::access(name.c_str(), X_OK) == 0) return name;
        return std::nullopt;
    }

    const char* path = std::getenv("PATH");
    if (!path) return std::nullopt;

    std::string_view rest(path);
    while (!rest.empty()) {
        const auto colon = rest.find(':');
        const auto dir = rest.substr(0, colon);
        if (!dir.empty()) {
            const auto candidate = fs::path(dir) / name;
            std::error_code ec;
            if (fs::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0)
                return candidate.string();
        }
        if (colon == std::string_view::npos) break;
        rest.remove_prefix(colon + 1);
    }
    return std::nullopt;
}
