#include "session/Session.hpp"
#include "session/WatchService.hpp"
#include "session/KeyListener.hpp"
#include "policy/Resolver.hpp"
#include "catalog/Registry.hpp"
#include "convert/Gateway.hpp"
#include "volume/VolumeLocator.hpp"
#include "watch/Watcher.hpp"
#include "log/Registry.hpp"

#include <csignal>
#include <stdexcept>
#include <thread>
#include <fmt/format.h>

namespace ss::session {

namespace {

std::atomic<bool> shouldExit = false;

void signalHandler(int) {
    shouldExit = true;
}

// Installs SIGINT/SIGTERM for the lifetime of a run and puts the old handlers back after.
struct SignalScope {
    using Handler = void (*)(int);
    Handler prevInt, prevTerm;

    SignalScope() {
        shouldExit = false;
        prevInt = std::signal(SIGINT, signalHandler);
        prevTerm = std::signal(SIGTERM, signalHandler);
    }

    ~SignalScope() {
        std::signal(SIGINT, prevInt == SIG_ERR ? SIG_DFL : prevInt);
        std::signal(SIGTERM, prevTerm == SIG_ERR ? SIG_DFL : prevTerm);
    }
};

}

Session::Session(policy::ResolvedPolicy policy,
                 std::shared_ptr<const catalog::Registry> registry,
                 std::shared_ptr<const convert::Gateway> gateway,
                 std::shared_ptr<const volume::VolumeLocator> locator,
                 std::unique_ptr<watch::Watcher> watcher,
                 pipeline::PipelineOptions options,
                 std::shared_ptr<std::atomic<bool>> cancel)
    : policy_(std::move(policy)),
      registry_(std::move(registry)),
      gateway_(std::move(gateway)),
      locator_(std::move(locator)),
      watcher_(std::move(watcher)),
      options_(options),
      cancel_(cancel ? std::move(cancel) : std::make_shared<std::atomic<bool>>(false)) {}

Session::~Session() = default;

std::unique_ptr<Session> Session::create(const policy::Settings& settings,
                                         const config::Config& config,
                                         std::shared_ptr<const catalog::Registry> registry,
                                         std::shared_ptr<std::atomic<bool>> cancel) {
    auto policy = policy::Resolver(registry).resolve(settings);
    auto watcher = watch::makeDefaultWatcher(settings.watch_dir);
    auto gateway = convert::Gateway::probe(config.converter);
    std::shared_ptr<const volume::VolumeLocator> locator = volume::makeDefaultLocator();

    log::Registry::volume()->debug("[Session] Volume backend: {}", locator->backendName());

    return std::make_unique<Session>(std::move(policy), std::move(registry), std::move(gateway),
                                     std::move(locator), std::move(watcher),
                                     pipeline::PipelineOptions::fromConfig(config.watch), std::move(cancel));
}

void Session::logBanner(const std::filesystem::path& dir) const {
    const auto logger = log::Registry::stitchsync();
    logger->info("Watching {} for new embroidery files", dir.string());
    if (policy_.machine) {
        logger->info("Machine: {} (accepts {})", policy_.machine->name, fmt::join(policy_.accepted, ", "));
        if (policy_.machine->destination_subpath)
            logger->info("Files go to {} on the machine's USB drive", *policy_.machine->destination_subpath);
    } else {
        logger->info("Accepted formats: {}", fmt::join(policy_.accepted, ", "));
    }
    logger->info("Preferred format: {}", policy_.preferred);

    const auto a = gateway_->available();
    if (!a.has_converter) logger->debug("Inkscape not found, conversion disabled");
    else if (!a.has_extension) logger->debug("ink/stitch extension not found, conversion disabled");
}

Summary Session::run(const bool interactive) {
    if (!watcher_) throw std::runtime_error("Session has already run");

    const auto dir = watcher_->directory();
    logBanner(dir);

    auto pipeline = std::make_shared<pipeline::Pipeline>(policy_, gateway_, locator_, registry_, options_, cancel_);
    WatchService watchService(std::move(watcher_), pipeline, cancel_);

    SignalScope signals;
    KeyListener keys(cancel_);

    watchService.start();
    if (interactive) {
        keys.start();
        log::Registry::stitchsync()->info("Press 'q' to stop");
    }

    while (!cancel_->load()) {
        if (shouldExit) {
            log::Registry::stitchsync()->info("Signal received, stopping...");
            cancel_->store(true);
            break;
        }
        if (!watchService.isRunning()) {
            log::Registry::stitchsync()->error("[Session] Watch service exited unexpectedly");
            cancel_->store(true);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    keys.stop();
    watchService.stop();

    const auto summary = watchService.summary();
    log::Registry::stitchsync()->info("Done: {}", summary.str());
    return summary;
}

}
