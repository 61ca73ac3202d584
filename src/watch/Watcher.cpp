#include "watch/Watcher.hpp"
#include "watch/PollingWatcher.hpp"
#include "log/Registry.hpp"

#if defined(__linux__)
#include "watch/InotifyWatcher.hpp"
#endif

#include <stdexcept>

namespace ss::watch {

std::unique_ptr<Watcher> makeDefaultWatcher(const std::filesystem::path& dir) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec))
        throw std::runtime_error("Watch directory does not exist: " + dir.string());

#if defined(__linux__)
    try {
        return std::make_unique<InotifyWatcher>(dir);
    } catch (const std::exception& e) {
        log::Registry::watch()->warn("[Watcher] inotify unavailable ({}), falling back to polling", e.what());
    }
#endif
    return std::make_unique<PollingWatcher>(dir);
}

}
