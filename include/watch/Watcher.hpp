#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <vector>

namespace ss::watch {

struct FileEvent {
    std::filesystem::path path;
    std::chrono::system_clock::time_point detected_at;
};

class Watcher {
public:
    virtual ~Watcher() = default;

    // Blocks up to `timeout` and returns the paths touched since the last call,
    // one event per path, in first-seen order.
    virtual std::vector<FileEvent> poll(std::chrono::milliseconds timeout) = 0;

    [[nodiscard]] virtual const std::filesystem::path& directory() const = 0;
};

// inotify on Linux, snapshot polling elsewhere. Throws if dir is not a directory.
std::unique_ptr<Watcher> makeDefaultWatcher(const std::filesystem::path& dir);

}
