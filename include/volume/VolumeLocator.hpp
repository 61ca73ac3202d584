#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ss::volume {

struct VolumeCandidate {
    std::filesystem::path mount_root;
    std::string label;
    bool removable = true;
};

class VolumeLocator {
public:
    virtual ~VolumeLocator() = default;

    // Fresh query of the OS every call. Candidates that cannot be inspected are
    // logged and skipped; the result is sorted by mount root.
    [[nodiscard]] virtual std::vector<VolumeCandidate> listCandidates() const = 0;

    [[nodiscard]] virtual std::string backendName() const = 0;
};

// Backend for the platform this binary was built for.
std::unique_ptr<VolumeLocator> makeDefaultLocator();

// First candidate whose mount_root/subpath is an existing directory, or the first
// candidate's root when no subpath is given.
std::optional<std::filesystem::path> locateDestination(const std::vector<VolumeCandidate>& candidates,
                                                       const std::optional<std::string>& subpath);

}
