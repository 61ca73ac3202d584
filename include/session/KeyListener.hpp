#pragma once

#include "concurrency/AsyncService.hpp"

#include <atomic>
#include <memory>
#include <optional>

#if !defined(_WIN32)
#include <termios.h>
#endif

namespace ss::session {

// Watches the terminal for a quit key and raises the cancel flag. Nothing else.
class KeyListener final : public concurrency::AsyncService {
public:
    explicit KeyListener(std::shared_ptr<std::atomic<bool>> cancel, int fd = 0);   // 0 is stdin
    ~KeyListener() override;

    void start() override;
    void stop() override;

    // q, Q and Ctrl-C (raw mode delivers it as 0x03)
    static bool isQuitKey(const char c) { return c == 'q' || c == 'Q' || c == 0x03; }

protected:
    void runLoop() override;

private:
    std::shared_ptr<std::atomic<bool>> cancel_;
    int fd_;
#if defined(_WIN32)
    std::optional<unsigned long> savedConsoleMode_;
#else
    std::optional<termios> savedTermios_;
#endif

    void enterRawMode();
    void restoreTerminal();
};

}
