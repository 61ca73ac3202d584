#include "volume/MacVolumeLocator.hpp"
#include "util/Subprocess.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <regex>
#include <sstream>
#include <fmt/core.h>

namespace fs = std::filesystem;

using namespace ss::volume;

DiskInfo ss::volume::parseDiskutilInfo(const std::string& output) {
    static const std::regex removableRe(R"(^\s*Removable Media:\s+(Yes|Removable)\s*$)");
    static const std::regex protocolRe(R"(^\s*Protocol:\s+USB\s*$)");
    static const std::regex nameRe(R"(^\s*Volume Name:\s+(.*?)\s*$)");

    DiskInfo info;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        std::smatch m;
        if (std::regex_match(line, removableRe)) info.removable = true;
        else if (std::regex_match(line, protocolRe)) info.usb = true;
        else if (std::regex_match(line, m, nameRe)) info.volume_name = m[1].str();
    }
    return info;
}

MacVolumeLocator::MacVolumeLocator(fs::path volumesRoot) : volumesRoot_(std::move(volumesRoot)) {}

std::vector<VolumeCandidate> MacVolumeLocator::listCandidates() const {
    std::vector<VolumeCandidate> out;

    std::error_code ec;
    if (!fs::is_directory(volumesRoot_, ec)) return out;

    for (fs::directory_iterator it(volumesRoot_, ec), end; !ec && it != end; it.increment(ec)) {
        const auto mount = it->path();

        ss::util::ProcessOptions opts;
        opts.timeout = std::chrono::seconds(10);
        const auto res = ss::util::Subprocess::run({"diskutil", "info", mount.string()}, opts);
        if (!res.ok()) {
            ss::log::Registry::volume()->warn("[MacVolumeLocator] diskutil info {} failed: {}", mount.string(),
                                          res.spawn_error.value_or(fmt::format("exit code {}", res.exit_code)));
            continue;
        }

        const auto info = parseDiskutilInfo(res.stdout_text);
        if (!info.removable || !info.usb) continue;

        out.push_back({mount, info.volume_name.empty() ? mount.filename().string() : info.volume_name, true});
    }

    if (ec) ss::log::Registry::volume()->warn("[MacVolumeLocator] Failed to list {}: {}", volumesRoot_.string(), ec.message());

    std::ranges::sort(out, [](const VolumeCandidate& a, const VolumeCandidate& b) { return a.mount_root < b.mount_root; });
    return out;
}
