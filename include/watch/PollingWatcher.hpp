#pragma once

#include "watch/Watcher.hpp"
#include "util/FileStamp.hpp"

#include <string>
#include <unordered_map>

namespace ss::watch {

class PollingWatcher final : public Watcher {
public:
    explicit PollingWatcher(std::filesystem::path dir);

    std::vector<FileEvent> poll(std::chrono::milliseconds timeout) override;
    [[nodiscard]] const std::filesystem::path& directory() const override { return dir_; }

private:
    using Snapshot = std::unordered_map<std::string, util::FileStamp>;

    std::filesystem::path dir_;
    Snapshot last_;

    [[nodiscard]] Snapshot scan() const;
    std::vector<FileEvent> diff(const Snapshot& next);
};

}
