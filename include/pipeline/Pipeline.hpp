#pragma once

#include "pipeline/CopyOutcome.hpp"
#include "policy/ResolvedPolicy.hpp"
#include "watch/Watcher.hpp"
#include "config/Config.hpp"
#include "util/FileStamp.hpp"

#include <atomic>
#include <filesystem>
#include <optional>
#include <chrono>
#include <memory>
#include <string>

namespace ss::catalog { class Registry; }
namespace ss::convert { class Gateway; }
namespace ss::volume { class VolumeLocator; }

namespace ss::pipeline {

struct PipelineOptions {
    std::chrono::milliseconds stabilize_window{500};
    std::chrono::milliseconds poll_interval{100};
    std::chrono::milliseconds settle_timeout{std::chrono::seconds(60)};

    static PipelineOptions fromConfig(const config::WatchConfig& cfg);
};

enum class Classification { Ignored, Acceptable, NeedsConversion };

std::string to_string(Classification c);

// Takes one detected file from arrival to its final outcome. Each call is
// independent; failures are reported in the returned outcome and never thrown.
class Pipeline {
public:
    Pipeline(policy::ResolvedPolicy policy,
             std::shared_ptr<const convert::Gateway> gateway,
             std::shared_ptr<const volume::VolumeLocator> locator,
             std::shared_ptr<const catalog::Registry> registry,
             PipelineOptions options = {},
             std::shared_ptr<std::atomic<bool>> cancel = std::make_shared<std::atomic<bool>>(false));

    CopyOutcome process(const watch::FileEvent& event);

    // Extension-only decision; Ignored for codes outside the catalog.
    [[nodiscard]] Classification classify(const std::filesystem::path& path) const;

    [[nodiscard]] const policy::ResolvedPolicy& policy() const { return policy_; }
    [[nodiscard]] bool conversionWarningIssued() const { return conversionWarned_; }

private:
    enum class Stability { Stable, Vanished, TimedOut, Cancelled };

    policy::ResolvedPolicy policy_;
    std::shared_ptr<const convert::Gateway> gateway_;
    std::shared_ptr<const volume::VolumeLocator> locator_;
    std::shared_ptr<const catalog::Registry> registry_;
    PipelineOptions options_;
    std::shared_ptr<std::atomic<bool>> cancel_;

    bool conversionWarned_ = false;
    util::StampCache produced_;   // our own outputs written into the watch dir

    CopyOutcome run(const watch::FileEvent& event);
    [[nodiscard]] Stability waitUntilStable(const std::filesystem::path& path) const;
    [[nodiscard]] bool isOwnOutput(const std::filesystem::path& path);
    void rememberOutput(const std::filesystem::path& path);
    CopyOutcome deliver(CopyOutcome outcome);

    [[nodiscard]] bool cancelled() const { return cancel_ && cancel_->load(); }
};

}
