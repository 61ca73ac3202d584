#include "watch/InotifyWatcher.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>
#include <fmt/core.h>

namespace fs = std::filesystem;

namespace ss::watch {

InotifyWatcher::InotifyWatcher(fs::path dir) : dir_(std::move(dir)) {
    fd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd_ < 0) throw std::runtime_error(fmt::format("inotify_init1 failed: {}", std::strerror(errno)));

    wd_ = ::inotify_add_watch(fd_, dir_.c_str(), IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_MOVED_TO);
    if (wd_ < 0) {
        const auto err = errno;
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error(fmt::format("inotify_add_watch({}) failed: {}", dir_.string(), std::strerror(err)));
    }

    log::Registry::watch()->debug("[InotifyWatcher] Watching {}", dir_.string());
}

InotifyWatcher::~InotifyWatcher() {
    if (fd_ >= 0) {
        if (wd_ >= 0) ::inotify_rm_watch(fd_, wd_);
        ::close(fd_);
    }
}

std::vector<FileEvent> InotifyWatcher::poll(const std::chrono::milliseconds timeout) {
    std::vector<FileEvent> events;

    pollfd pfd{fd_, POLLIN, 0};
    const int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready < 0) {
        if (errno != EINTR) log::Registry::watch()->warn("[InotifyWatcher] poll failed: {}", std::strerror(errno));
        return events;
    }
    if (ready == 0) return events;

    alignas(inotify_event) std::array<char, 16 * 1024> buf{};
    const auto now = std::chrono::system_clock::now();

    while (true) {
        const ssize_t len = ::read(fd_, buf.data(), buf.size());
        if (len <= 0) {
            if (len < 0 && errno != EAGAIN && errno != EINTR)
                log::Registry::watch()->warn("[InotifyWatcher] read failed: {}", std::strerror(errno));
            break;
        }

        for (ssize_t off = 0; off < len;) {
            const auto* ev = reinterpret_cast<const inotify_event*>(buf.data() + off);
            off += static_cast<ssize_t>(sizeof(inotify_event) + ev->len);

            if (ev->mask & IN_Q_OVERFLOW) {
                log::Registry::watch()->warn("[InotifyWatcher] Event queue overflowed, some files may be missed");
                continue;
            }
            if (ev->len == 0 || (ev->mask & IN_ISDIR)) continue;

            auto path = dir_ / ev->name;
            const bool seen = std::ranges::any_of(events, [&](const FileEvent& e) { return e.path == path; });
            if (!seen) events.push_back({std::move(path), now});
        }
    }

    return events;
}

}
