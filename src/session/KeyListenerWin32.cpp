#include "session/KeyListener.hpp"
#include "log/Registry.hpp"

#include <io.h>
#include <windows.h>

namespace ss::session {

namespace {

constexpr DWORD WAIT_SLICE_MS = 100;

HANDLE handleFor(const int fd) {
    return reinterpret_cast<HANDLE>(::_get_osfhandle(fd));
}

}

KeyListener::KeyListener(std::shared_ptr<std::atomic<bool>> cancel, const int fd)
    : AsyncService("KeyListener"), cancel_(std::move(cancel)), fd_(fd) {}

KeyListener::~KeyListener() {
    stop();
}

void KeyListener::start() {
    if (isRunning()) return;
    if (::_isatty(fd_)) enterRawMode();
    AsyncService::start();
}

void KeyListener::stop() {
    AsyncService::stop();
    restoreTerminal();
}

void KeyListener::runLoop() {
    const HANDLE in = handleFor(fd_);
    if (in == INVALID_HANDLE_VALUE) return;
    const bool console = ::GetFileType(in) == FILE_TYPE_CHAR;

    while (!interruptFlag_.load(std::memory_order_acquire) && !cancel_->load()) {
        char c = 0;

        if (console) {
            if (::WaitForSingleObject(in, WAIT_SLICE_MS) != WAIT_OBJECT_0) continue;

            INPUT_RECORD rec{};
            DWORD n = 0;
            if (!::ReadConsoleInputW(in, &rec, 1, &n)) {
                log::Registry::stitchsync()->debug("[KeyListener] ReadConsoleInput failed: {}", ::GetLastError());
                return;
            }
            // Mouse, focus and key-up records also wake the handle
            if (n == 0 || rec.EventType != KEY_EVENT || !rec.Event.KeyEvent.bKeyDown) continue;
            c = rec.Event.KeyEvent.uChar.AsciiChar;
        } else {
            DWORD available = 0;
            if (!::PeekNamedPipe(in, nullptr, 0, nullptr, &available, nullptr)) return;   // stdin closed
            if (available == 0) {
                ::Sleep(WAIT_SLICE_MS);
                continue;
            }

            DWORD n = 0;
            if (!::ReadFile(in, &c, 1, &n, nullptr) || n == 0) return;
        }

        if (isQuitKey(c)) {
            log::Registry::stitchsync()->info("Stopping...");
            cancel_->store(true);
            return;
        }
    }
}

// Without processed input Ctrl-C arrives as a key event (0x03) instead of a signal
void KeyListener::enterRawMode() {
    const HANDLE in = handleFor(fd_);
    DWORD mode = 0;
    if (!::GetConsoleMode(in, &mode)) {
        log::Registry::stitchsync()->debug("[KeyListener] GetConsoleMode failed: {}", ::GetLastError());
        return;
    }
    savedConsoleMode_ = mode;

    if (!::SetConsoleMode(in, mode & ~(ENABLE_LINE_INPUT | ENABLE_ECHO_INPUT | ENABLE_PROCESSED_INPUT))) {
        log::Registry::stitchsync()->debug("[KeyListener] SetConsoleMode failed: {}", ::GetLastError());
        savedConsoleMode_.reset();
    }
}

void KeyListener::restoreTerminal() {
    if (!savedConsoleMode_) return;
    ::SetConsoleMode(handleFor(fd_), *savedConsoleMode_);
    savedConsoleMode_.reset();
}

}
