#pragma once

#include "volume/VolumeLocator.hpp"

namespace ss::volume {

class WindowsVolumeLocator final : public VolumeLocator {
public:
    [[nodiscard]] std::vector<VolumeCandidate> listCandidates() const override;
    [[nodiscard]] std::string backendName() const override { return "windows-drivetype"; }
};

}
