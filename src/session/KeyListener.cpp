#include "session/KeyListener.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace ss::session {

KeyListener::KeyListener(std::shared_ptr<std::atomic<bool>> cancel, const int fd)
    : AsyncService("KeyListener"), cancel_(std::move(cancel)), fd_(fd) {}

KeyListener::~KeyListener() {
    stop();
}

void KeyListener::start() {
    if (isRunning()) return;
    if (::isatty(fd_)) enterRawMode();
    AsyncService::start();
}

void KeyListener::stop() {
    AsyncService::stop();
    restoreTerminal();
}

void KeyListener::runLoop() {
    while (!interruptFlag_.load(std::memory_order_acquire) && !cancel_->load()) {
        pollfd pfd{fd_, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, 100);
        if (ready < 0) {
            if (errno == EINTR) continue;
            log::Registry::stitchsync()->debug("[KeyListener] poll failed: {}", std::strerror(errno));
            return;
        }
        if (ready == 0) continue;

        char c = 0;
        const ssize_t n = ::read(fd_, &c, 1);
        if (n == 0) return;   // stdin closed, only signals can stop us now
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return;
        }

        if (isQuitKey(c)) {
            log::Registry::stitchsync()->info("Stopping...");
            cancel_->store(true);
            return;
        }
    }
}

void KeyListener::enterRawMode() {
    termios tio{};
    if (::tcgetattr(fd_, &tio) != 0) {
        log::Registry::stitchsync()->debug("[KeyListener] tcgetattr failed: {}", std::strerror(errno));
        return;
    }
    savedTermios_ = tio;

    tio.c_lflag &= ~(ICANON | ECHO | ISIG);
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;
    if (::tcsetattr(fd_, TCSANOW, &tio) != 0) {
        log::Registry::stitchsync()->debug("[KeyListener] tcsetattr failed: {}", std::strerror(errno));
        savedTermios_.reset();
    }
}

void KeyListener::restoreTerminal() {
    if (!savedTermios_) return;
    ::tcsetattr(fd_, TCSANOW, &*savedTermios_);
    savedTermios_.reset();
}

}
