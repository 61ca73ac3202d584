#pragma once

#include "policy/ResolvedPolicy.hpp"
#include "policy/Settings.hpp"
#include "pipeline/Pipeline.hpp"
#include "session/Summary.hpp"
#include "config/Config.hpp"

#include <atomic>
#include <memory>

namespace ss::catalog { class Registry; }
namespace ss::convert { class Gateway; }
namespace ss::volume { class VolumeLocator; }
namespace ss::watch { class Watcher; }

namespace ss::session {

// One watch run: owns the policy and every collaborator for its lifetime.
class Session {
public:
    Session(policy::ResolvedPolicy policy,
            std::shared_ptr<const catalog::Registry> registry,
            std::shared_ptr<const convert::Gateway> gateway,
            std::shared_ptr<const volume::VolumeLocator> locator,
            std::unique_ptr<watch::Watcher> watcher,
            pipeline::PipelineOptions options,
            std::shared_ptr<std::atomic<bool>> cancel);

    ~Session();

    // Resolves the policy and probes the platform. Throws on unknown machine or
    // format and on a missing watch directory, before anything is watched.
    static std::unique_ptr<Session> create(const policy::Settings& settings,
                                           const config::Config& config,
                                           std::shared_ptr<const catalog::Registry> registry,
                                           std::shared_ptr<std::atomic<bool>> cancel);

    // Blocks until the cancel flag is raised (key, signal or caller), then drains and returns the counts.
    Summary run(bool interactive = true);

    [[nodiscard]] const policy::ResolvedPolicy& policy() const { return policy_; }
    [[nodiscard]] const std::shared_ptr<std::atomic<bool>>& cancelFlag() const { return cancel_; }

private:
    policy::ResolvedPolicy policy_;
    std::shared_ptr<const catalog::Registry> registry_;
    std::shared_ptr<const convert::Gateway> gateway_;
    std::shared_ptr<const volume::VolumeLocator> locator_;
    std::unique_ptr<watch::Watcher> watcher_;
    pipeline::PipelineOptions options_;
    std::shared_ptr<std::atomic<bool>> cancel_;

    void logBanner(const std::filesystem::path& dir) const;
};

}
