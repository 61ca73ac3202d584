#include "volume/WindowsVolumeLocator.hpp"
#include "log/Registry.hpp"

#include <windows.h>
#include <fmt/core.h>

using namespace ss::volume;

std::vector<VolumeCandidate> WindowsVolumeLocator::listCandidates() const {
    std::vector<VolumeCandidate> out;

    const DWORD mask = GetLogicalDrives();
    if (mask == 0) {
        ss::log::Registry::volume()->warn("[WindowsVolumeLocator] GetLogicalDrives failed: error {}", GetLastError());
        return out;
    }

    for (wchar_t letter = L'A'; letter <= L'Z'; ++letter) {
        if (!(mask & (1u << (letter - L'A')))) continue;

        const wchar_t root[] = {letter, L':', L'\\', L'\0'};
        if (GetDriveTypeW(root) != DRIVE_REMOVABLE) continue;

        const auto ascii = static_cast<char>(letter);
        out.push_back({std::filesystem::path(root), fmt::format("Drive ({}:)", ascii), true});
    }

    return out;
}
