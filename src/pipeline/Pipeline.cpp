#include "pipeline/Pipeline.hpp"
#include "catalog/Registry.hpp"
#include "convert/Gateway.hpp"
#include "volume/VolumeLocator.hpp"
#include "util/filename.hpp"
#include "util/FileStamp.hpp"
#include "log/Registry.hpp"

#include <stdexcept>
#include <thread>
#include <fmt/core.h>

namespace fs = std::filesystem;
using namespace std::chrono;

namespace ss::pipeline {

std::string to_string(const CopyOutcome::Kind kind) {
    switch (kind) {
        case CopyOutcome::Kind::Ignored: return "ignored";
        case CopyOutcome::Kind::CopiedLocal: return "kept locally";
        case CopyOutcome::Kind::CopiedRemote: return "copied to volume";
        case CopyOutcome::Kind::Failed: return "failed";
    }
    return "unknown";
}

std::string to_string(const Classification c) {
    switch (c) {
        case Classification::Ignored: return "ignored";
        case Classification::Acceptable: return "acceptable";
        case Classification::NeedsConversion: return "needs conversion";
    }
    return "unknown";
}

PipelineOptions PipelineOptions::fromConfig(const config::WatchConfig& cfg) {
    return {cfg.stabilize_window, cfg.poll_interval, duration_cast<milliseconds>(cfg.settle_timeout)};
}

Pipeline::Pipeline(policy::ResolvedPolicy policy,
                   std::shared_ptr<const convert::Gateway> gateway,
                   std::shared_ptr<const volume::VolumeLocator> locator,
                   std::shared_ptr<const catalog::Registry> registry,
                   PipelineOptions options,
                   std::shared_ptr<std::atomic<bool>> cancel)
    : policy_(std::move(policy)),
      gateway_(std::move(gateway)),
      locator_(std::move(locator)),
      registry_(std::move(registry)),
      options_(options),
      cancel_(std::move(cancel)) {
    if (!gateway_ || !locator_ || !registry_)
        throw std::invalid_argument("Pipeline requires a gateway, a volume locator and a catalog");
}

CopyOutcome Pipeline::process(const watch::FileEvent& event) {
    try {
        return run(event);
    } catch (const std::exception& e) {
        log::Registry::stitchsync()->error("[Pipeline] {}: {}", event.path.filename().string(), e.what());
        return {CopyOutcome::Kind::Failed, event.path, event.path, std::nullopt, e.what()};
    }
}

Classification Pipeline::classify(const fs::path& path) const {
    const auto ext = util::extensionOf(path);
    if (ext.empty() || !registry_->hasFormat(ext)) return Classification::Ignored;
    return policy_.accepts(ext) ? Classification::Acceptable : Classification::NeedsConversion;
}

CopyOutcome Pipeline::run(const watch::FileEvent& event) {
    const auto& path = event.path;
    const auto name = path.filename().string();
    CopyOutcome outcome{CopyOutcome::Kind::Ignored, path, path, std::nullopt, {}};

    // Cheap name checks first so temporary download files never wait for stabilization
    if (util::isHidden(path)) {
        outcome.reason = "hidden file";
        return outcome;
    }

    if (classify(path) == Classification::Ignored) {
        outcome.reason = "not an embroidery format";
        log::Registry::watch()->debug("[Pipeline] Ignoring {}: {}", name, outcome.reason);
        return outcome;
    }

    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        outcome.reason = "directory";
        return outcome;
    }

    if (isOwnOutput(path)) {
        outcome.reason = "produced by stitch-sync";
        log::Registry::watch()->debug("[Pipeline] Ignoring {}: {}", name, outcome.reason);
        return outcome;
    }

    log::Registry::watch()->debug("[Pipeline] Waiting for {} to settle", name);
    switch (waitUntilStable(path)) {
        case Stability::Stable: break;
        case Stability::Vanished:
            outcome.reason = "file disappeared before it settled";
            log::Registry::watch()->debug("[Pipeline] Ignoring {}: {}", name, outcome.reason);
            return outcome;
        case Stability::TimedOut:
            outcome.kind = CopyOutcome::Kind::Failed;
            outcome.reason = fmt::format("still changing after {}s", duration_cast<seconds>(options_.settle_timeout).count());
            log::Registry::stitchsync()->error("[Pipeline] {}: {}", name, outcome.reason);
            return outcome;
        case Stability::Cancelled:
            outcome.kind = CopyOutcome::Kind::Failed;
            outcome.reason = "cancelled";
            return outcome;
    }

    const auto classification = classify(path);
    log::Registry::watch()->debug("[Pipeline] {} classified as {}", name, to_string(classification));

    if (classification == Classification::NeedsConversion) {
        const auto target = convert::Gateway::conversionTarget(policy_.preferred);
        const auto result = gateway_->convert(path, target, cancel_);

        switch (result.status) {
            case convert::ConversionResult::Status::Converted:
                outcome.output = *result.output;
                outcome.converted = outcome.output != path;
                if (outcome.converted) rememberOutput(outcome.output);
                log::Registry::stitchsync()->info("[Pipeline] Converted {} to {}", name, outcome.output.filename().string());
                break;

            case convert::ConversionResult::Status::NotAvailable:
                if (!conversionWarned_) {
                    conversionWarned_ = true;
                    log::Registry::stitchsync()->warn(
                        "[Pipeline] Conversion unavailable ({}). Files will be copied unconverted; "
                        "install Inkscape with the ink/stitch extension to enable conversion.", result.diagnostic);
                }
                break;

            case convert::ConversionResult::Status::Failed:
                outcome.kind = CopyOutcome::Kind::Failed;
                outcome.reason = result.diagnostic;
                log::Registry::stitchsync()->error("[Pipeline] Failed to convert {}: {}", name, result.diagnostic);
                return outcome;
        }
    }

    if (cancelled()) {
        outcome.kind = CopyOutcome::Kind::Failed;
        outcome.reason = "cancelled";
        return outcome;
    }

    return deliver(std::move(outcome));
}

CopyOutcome Pipeline::deliver(CopyOutcome outcome) {
    const auto destName = util::sanitize(outcome.output.filename().string(), policy_.sanitizeNames());

    const auto candidates = locator_->listCandidates();
    const auto destDir = volume::locateDestination(candidates, policy_.destinationSubpath());

    if (!destDir) {
        outcome.kind = CopyOutcome::Kind::CopiedLocal;
        log::Registry::stitchsync()->info("[Pipeline] {} ready in {} (no {} found)",
                                          outcome.output.filename().string(),
                                          outcome.output.parent_path().string(),
                                          policy_.destinationSubpath() ? "volume with " + *policy_.destinationSubpath()
                                                                        : std::string("removable volume"));
        return outcome;
    }

    const auto dest = *destDir / destName;
    std::error_code ec;

    // Watching the volume (or its machine folder) directly leaves nothing to copy
    if (fs::exists(dest, ec) && fs::equivalent(outcome.output, dest, ec)) {
        outcome.kind = CopyOutcome::Kind::CopiedRemote;
        outcome.destination = dest;
        log::Registry::stitchsync()->info("[Pipeline] {} is already on the volume", dest.string());
        return outcome;
    }
    ec.clear();

    fs::copy_file(outcome.output, dest, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        outcome.kind = CopyOutcome::Kind::Failed;
        outcome.reason = fmt::format("copy to {} failed: {}", dest.string(), ec.message());
        log::Registry::stitchsync()->error("[Pipeline] {}: {}", outcome.output.filename().string(), outcome.reason);
        return outcome;
    }

    // A renamed copy next to the source must not come back as a new arrival
    if (fs::equivalent(dest.parent_path(), outcome.source.parent_path(), ec)) rememberOutput(dest);

    outcome.kind = CopyOutcome::Kind::CopiedRemote;
    outcome.destination = dest;
    log::Registry::stitchsync()->info("[Pipeline] Copied {} to {}", outcome.output.filename().string(), dest.string());
    return outcome;
}

Pipeline::Stability Pipeline::waitUntilStable(const fs::path& path) const {
    const auto start = steady_clock::now();
    auto last = util::stampOf(path);
    if (!last) return Stability::Vanished;

    auto quietSince = start;
    while (true) {
        if (cancelled()) return Stability::Cancelled;

        const auto now = steady_clock::now();
        if (now - quietSince >= options_.stabilize_window) return Stability::Stable;
        if (now - start >= options_.settle_timeout) return Stability::TimedOut;

        std::this_thread::sleep_for(options_.poll_interval);

        const auto current = util::stampOf(path);
        if (!current) return Stability::Vanished;
        if (!(*current == *last)) {
            last = current;
            quietSince = steady_clock::now();
        }
    }
}

bool Pipeline::isOwnOutput(const fs::path& path) {
    return produced_.matches(path, util::stampOf(path));
}

void Pipeline::rememberOutput(const fs::path& path) {
    if (const auto s = util::stampOf(path)) produced_.remember(path, *s);
}

}
