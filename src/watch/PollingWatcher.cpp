#include "watch/PollingWatcher.hpp"
#include "log/Registry.hpp"

#include <thread>

namespace fs = std::filesystem;

namespace ss::watch {

PollingWatcher::PollingWatcher(fs::path dir) : dir_(std::move(dir)) {
    // Files already present are not news
    last_ = scan();
    log::Registry::watch()->debug("[PollingWatcher] Watching {} ({} existing entries)", dir_.string(), last_.size());
}

PollingWatcher::Snapshot PollingWatcher::scan() const {
    Snapshot snap;
    std::error_code ec;
    for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entryEc;
        if (!it->is_regular_file(entryEc)) continue;
        const auto size = it->file_size(entryEc);
        if (entryEc) continue;
        const auto mtime = it->last_write_time(entryEc);
        if (entryEc) continue;
        snap.emplace(it->path().filename().string(), util::FileStamp{size, mtime});
    }
    if (ec) log::Registry::watch()->warn("[PollingWatcher] Failed to scan {}: {}", dir_.string(), ec.message());
    return snap;
}

std::vector<FileEvent> PollingWatcher::diff(const Snapshot& next) {
    std::vector<FileEvent> events;
    const auto now = std::chrono::system_clock::now();
    for (const auto& [name, stamp] : next) {
        const auto prev = last_.find(name);
        if (prev == last_.end() || !(prev->second == stamp))
            events.push_back({dir_ / name, now});
    }
    last_ = next;
    return events;
}

std::vector<FileEvent> PollingWatcher::poll(const std::chrono::milliseconds timeout) {
    auto events = diff(scan());
    if (!events.empty()) return events;

    std::this_thread::sleep_for(timeout);
    return diff(scan());
}

}
