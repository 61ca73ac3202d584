#pragma once

#include "volume/VolumeLocator.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ss::volume {

struct LinuxLocatorPaths {
    std::vector<std::filesystem::path> media_roots;             // defaults: /media/$USER, /run/media/$USER
    std::filesystem::path mounts_file = "/proc/self/mounts";
    std::filesystem::path sysfs_block = "/sys/class/block";
};

class LinuxVolumeLocator final : public VolumeLocator {
public:
    LinuxVolumeLocator();
    explicit LinuxVolumeLocator(LinuxLocatorPaths paths);

    [[nodiscard]] std::vector<VolumeCandidate> listCandidates() const override;
    [[nodiscard]] std::string backendName() const override { return "linux-sysfs"; }

    // Device basename ("sdb1") mounted at mountRoot per the mount table.
    [[nodiscard]] std::optional<std::string> deviceFor(const std::filesystem::path& mountRoot) const;

    // True when some ancestor of the device in sysfs belongs to the usb subsystem.
    [[nodiscard]] bool isUsbDevice(const std::string& device) const;

    static LinuxLocatorPaths defaultPaths();

private:
    LinuxLocatorPaths paths_;
};

}
