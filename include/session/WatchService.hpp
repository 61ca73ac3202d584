#pragma once

#include "concurrency/AsyncService.hpp"
#include "session/Summary.hpp"
#include "watch/Watcher.hpp"
#include "util/FileStamp.hpp"

#include <atomic>
#include <vector>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

namespace ss::pipeline { class Pipeline; }

namespace ss::session {

// Pulls events from the watcher and feeds them to the pipeline one file at a time,
// in arrival order. Repeat notifications for a queued or already handled file are dropped.
class WatchService final : public concurrency::AsyncService {
public:
    using OutcomeCallback = std::function<void(const pipeline::CopyOutcome&)>;

    static constexpr std::chrono::milliseconds IDLE_POLL{250};

    WatchService(std::unique_ptr<watch::Watcher> watcher,
                 std::shared_ptr<pipeline::Pipeline> pipeline,
                 std::shared_ptr<std::atomic<bool>> cancel,
                 OutcomeCallback onOutcome = {});

    ~WatchService() override;

    [[nodiscard]] Summary summary() const;

protected:
    void runLoop() override;

private:
    std::unique_ptr<watch::Watcher> watcher_;
    std::shared_ptr<pipeline::Pipeline> pipeline_;
    std::shared_ptr<std::atomic<bool>> cancel_;
    OutcomeCallback onOutcome_;

    std::deque<watch::FileEvent> pending_;
    std::unordered_set<std::string> queued_;
    util::StampCache handled_;

    mutable std::mutex summaryMutex_;
    Summary summary_;

    void enqueue(std::vector<watch::FileEvent> events);
    [[nodiscard]] bool stopping() const;
};

}
