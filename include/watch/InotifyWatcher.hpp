#pragma once

#include "watch/Watcher.hpp"

namespace ss::watch {

class InotifyWatcher final : public Watcher {
public:
    explicit InotifyWatcher(std::filesystem::path dir);
    ~InotifyWatcher() override;

    InotifyWatcher(const InotifyWatcher&) = delete;
    InotifyWatcher& operator=(const InotifyWatcher&) = delete;

    std::vector<FileEvent> poll(std::chrono::milliseconds timeout) override;
    [[nodiscard]] const std::filesystem::path& directory() const override { return dir_; }

private:
    std::filesystem::path dir_;
    int fd_ = -1;
    int wd_ = -1;
};

}
