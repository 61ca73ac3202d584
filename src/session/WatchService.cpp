#include "session/WatchService.hpp"
#include "pipeline/Pipeline.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

namespace ss::session {

WatchService::WatchService(std::unique_ptr<watch::Watcher> watcher,
                           std::shared_ptr<pipeline::Pipeline> pipeline,
                           std::shared_ptr<std::atomic<bool>> cancel,
                           OutcomeCallback onOutcome)
    : AsyncService("WatchService"),
      watcher_(std::move(watcher)),
      pipeline_(std::move(pipeline)),
      cancel_(std::move(cancel)),
      onOutcome_(std::move(onOutcome)) {
    if (!watcher_ || !pipeline_) throw std::invalid_argument("WatchService requires a watcher and a pipeline");
}

WatchService::~WatchService() {
    stop();
}

Summary WatchService::summary() const {
    std::scoped_lock lock(summaryMutex_);
    return summary_;
}

bool WatchService::stopping() const {
    return interruptFlag_.load(std::memory_order_acquire) || (cancel_ && cancel_->load());
}

void WatchService::runLoop() {
    log::Registry::watch()->debug("[WatchService] Watching {}", watcher_->directory().string());

    while (!stopping()) {
        // Block only when idle; otherwise just pick up what arrived while the last file was handled
        enqueue(watcher_->poll(pending_.empty() ? IDLE_POLL : std::chrono::milliseconds(0)));
        if (pending_.empty()) continue;

        auto event = std::move(pending_.front());
        pending_.pop_front();
        const auto key = event.path.lexically_normal().string();
        queued_.erase(key);

        const auto outcome = pipeline_->process(event);

        if (const auto s = util::stampOf(event.path)) handled_.remember(event.path, *s);
        else handled_.evictPath(event.path);

        {
            std::scoped_lock lock(summaryMutex_);
            summary_.record(outcome);
        }
        if (onOutcome_) onOutcome_(outcome);
    }

    if (!pending_.empty())
        log::Registry::watch()->info("[WatchService] Stopped with {} file(s) still queued", pending_.size());
}

void WatchService::enqueue(std::vector<watch::FileEvent> events) {
    for (auto& e : events) {
        auto key = e.path.lexically_normal().string();
        if (queued_.contains(key)) continue;

        // Late notifications for a file we already finished with, unchanged since
        if (handled_.matches(e.path, util::stampOf(e.path))) continue;

        queued_.insert(std::move(key));
        pending_.push_back(std::move(e));
    }
}

}
