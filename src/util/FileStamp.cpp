#include "util/FileStamp.hpp"

namespace fs = std::filesystem;

namespace ss::util {

std::optional<FileStamp> stampOf(const fs::path& path) {
    std::error_code ec;
    FileStamp s;
    s.size = fs::file_size(path, ec);
    if (ec) return std::nullopt;
    s.mtime = fs::last_write_time(path, ec);
    if (ec) return std::nullopt;
    return s;
}

StampCache::StampCache(const size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

std::string StampCache::keyFor(const fs::path& path) {
    return path.lexically_normal().string();
}

void StampCache::remember(const fs::path& path, const FileStamp& stamp) {
    auto key = keyFor(path);
    if (const auto it = index_.find(key); it != index_.end()) {
        it->second->second = stamp;
        entries_.splice(entries_.begin(), entries_, it->second);
        return;
    }

    entries_.emplace_front(key, stamp);
    index_.emplace(std::move(key), entries_.begin());

    while (index_.size() > capacity_) {
        index_.erase(entries_.back().first);
        entries_.pop_back();
    }
}

bool StampCache::matches(const fs::path& path, const std::optional<FileStamp>& current) {
    const auto it = index_.find(keyFor(path));
    if (it == index_.end()) return false;
    if (current && it->second->second == *current) return true;

    entries_.erase(it->second);
    index_.erase(it);
    return false;
}

void StampCache::evictPath(const fs::path& path) {
    const auto it = index_.find(keyFor(path));
    if (it == index_.end()) return;
    entries_.erase(it->second);
    index_.erase(it);
}

bool StampCache::contains(const fs::path& path) const {
    return index_.contains(keyFor(path));
}

}
