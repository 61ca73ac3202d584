#pragma once

#include "volume/VolumeLocator.hpp"

#include <filesystem>
#include <string>

namespace ss::volume {

struct DiskInfo {
    bool removable = false;
    bool usb = false;
    std::string volume_name;
};

// Parses the text printed by `diskutil info <mount>`.
DiskInfo parseDiskutilInfo(const std::string& output);

class MacVolumeLocator final : public VolumeLocator {
public:
    explicit MacVolumeLocator(std::filesystem::path volumesRoot = "/Volumes");

    [[nodiscard]] std::vector<VolumeCandidate> listCandidates() const override;
    [[nodiscard]] std::string backendName() const override { return "macos-diskutil"; }

private:
    std::filesystem::path volumesRoot_;
};

}
