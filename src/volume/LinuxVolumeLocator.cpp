#include "volume/LinuxVolumeLocator.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

using namespace ss::volume;

namespace {

// /proc/mounts escapes whitespace in paths as octal (\040 for space)
std::string unescapeMountField(const std::string& field) {
    std::string out;
    out.reserve(field.size());
    for (size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size()) {
            const auto oct = field.substr(i + 1, 3);
            if (std::all_of(oct.begin(), oct.end(), [](char c) { return c >= '0' && c <= '7'; })) {
                out.push_back(static_cast<char>(std::stoi(oct, nullptr, 8)));
                i += 3;
                continue;
            }
        }
        out.push_back(field[i]);
    }
    return out;
}

}

LinuxVolumeLocator::LinuxVolumeLocator() : paths_(defaultPaths()) {}

LinuxVolumeLocator::LinuxVolumeLocator(LinuxLocatorPaths paths) : paths_(std::move(paths)) {}

LinuxLocatorPaths LinuxVolumeLocator::defaultPaths() {
    LinuxLocatorPaths p;
    if (const char* user = std::getenv("USER"); user && *user) {
        p.media_roots.emplace_back(fs::path("/media") / user);
        p.media_roots.emplace_back(fs::path("/run/media") / user);
    }
    return p;
}

std::vector<VolumeCandidate> LinuxVolumeLocator::listCandidates() const {
    std::vector<VolumeCandidate> out;

    for (const auto& root : paths_.media_roots) {
        std::error_code ec;
        if (!fs::is_directory(root, ec)) continue;

        for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
            const auto& entry = *it;
            std::error_code dirEc;
            if (!entry.is_directory(dirEc)) continue;

            const auto mount = entry.path();
            const auto device = deviceFor(mount);
            if (!device) {
                ss::log::Registry::volume()->debug("[LinuxVolumeLocator] {} is not a mount point, skipping", mount.string());
                continue;
            }

            if (!isUsbDevice(*device)) {
                ss::log::Registry::volume()->debug("[LinuxVolumeLocator] {} ({}) is not on a USB bus", mount.string(), *device);
                continue;
            }

            out.push_back({mount, mount.filename().string(), true});
        }

        if (ec) ss::log::Registry::volume()->warn("[LinuxVolumeLocator] Failed to list {}: {}", root.string(), ec.message());
    }

    std::ranges::sort(out, [](const VolumeCandidate& a, const VolumeCandidate& b) { return a.mount_root < b.mount_root; });
    return out;
}

std::optional<std::string> LinuxVolumeLocator::deviceFor(const fs::path& mountRoot) const {
    std::ifstream in(paths_.mounts_file);
    if (!in) {
        ss::log::Registry::volume()->warn("[LinuxVolumeLocator] Cannot read mount table {}", paths_.mounts_file.string());
        return std::nullopt;
    }

    const auto wanted = mountRoot.lexically_normal();
    std::optional<std::string> found;

    // Later entries shadow earlier ones on the same mount point
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string source, target;
        if (!(fields >> source >> target)) continue;
        if (fs::path(unescapeMountField(target)).lexically_normal() != wanted) continue;
        if (source.rfind("/dev/", 0) != 0) continue;

        auto dev = fs::path(unescapeMountField(source));
        std::error_code ec;
        if (fs::is_symlink(dev, ec)) {
            if (const auto resolved = fs::canonical(dev, ec); !ec) dev = resolved;
        }
        found = dev.filename().string();
    }
    return found;
}

bool LinuxVolumeLocator::isUsbDevice(const std::string& device) const {
    std::error_code ec;
    const auto link = paths_.sysfs_block / device;
    auto node = fs::canonical(link, ec);
    if (ec) {
        ss::log::Registry::volume()->warn("[LinuxVolumeLocator] No sysfs entry for {}: {}", device, ec.message());
        return false;
    }

    while (!node.empty() && node != node.root_path()) {
        const auto subsystem = node / "subsystem";
        std::error_code subEc;
        if (fs::exists(subsystem, subEc)) {
            const auto target = fs::canonical(subsystem, subEc);
            if (!subEc && target.filename() == "usb") return true;
        }
        node = node.parent_path();
    }
    return false;
}
