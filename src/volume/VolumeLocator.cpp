#include "volume/VolumeLocator.hpp"
#include "log/Registry.hpp"

#if defined(_WIN32)
#include "volume/WindowsVolumeLocator.hpp"
#elif defined(__APPLE__)
#include "volume/MacVolumeLocator.hpp"
#else
#include "volume/LinuxVolumeLocator.hpp"
#endif

namespace fs = std::filesystem;

namespace ss::volume {

std::unique_ptr<VolumeLocator> makeDefaultLocator() {
#if defined(_WIN32)
    return std::make_unique<WindowsVolumeLocator>();
#elif defined(__APPLE__)
    return std::make_unique<MacVolumeLocator>();
#else
    return std::make_unique<LinuxVolumeLocator>();
#endif
}

std::optional<fs::path> locateDestination(const std::vector<VolumeCandidate>& candidates,
                                          const std::optional<std::string>& subpath) {
    if (candidates.empty()) return std::nullopt;

    if (!subpath || subpath->empty()) return candidates.front().mount_root;

    for (const auto& c : candidates) {
        const auto dest = c.mount_root / *subpath;
        std::error_code ec;
        if (fs::is_directory(dest, ec)) {
            log::Registry::volume()->debug("[VolumeLocator] Destination {} on {}", dest.string(), c.label);
            return dest;
        }
    }

    log::Registry::volume()->debug("[VolumeLocator] No candidate carries '{}' ({} checked)", *subpath, candidates.size());
    return std::nullopt;
}

}
