#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <list>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace ss::util {

struct FileStamp {
    std::uintmax_t size = 0;
    std::filesystem::file_time_type mtime;

    bool operator==(const FileStamp&) const = default;
};

// Size and mtime, or nullopt when the file is gone or cannot be read.
std::optional<FileStamp> stampOf(const std::filesystem::path& path);

// Remembers the stamp a path had at some point. Holds at most `capacity` paths;
// the least recently remembered one is evicted first, and an entry whose file has
// changed since is dropped the first time it is checked.
class StampCache {
public:
    static constexpr size_t DEFAULT_CAPACITY = 512;

    explicit StampCache(size_t capacity = DEFAULT_CAPACITY);

    void remember(const std::filesystem::path& path, const FileStamp& stamp);

    // True only when `path` was remembered with exactly `current`.
    bool matches(const std::filesystem::path& path, const std::optional<FileStamp>& current);

    void evictPath(const std::filesystem::path& path);

    [[nodiscard]] bool contains(const std::filesystem::path& path) const;
    [[nodiscard]] size_t size() const { return index_.size(); }
    [[nodiscard]] size_t capacity() const { return capacity_; }

private:
    using Entry = std::pair<std::string, FileStamp>;

    size_t capacity_;
    std::list<Entry> entries_;   // most recent first
    std::unordered_map<std::string, std::list<Entry>::iterator> index_;

    static std::string keyFor(const std::filesystem::path& path);
};

}
