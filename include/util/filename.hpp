#pragma once

#include <filesystem>
#include <string>

namespace ss::util {

// Collapses every run of non-alphanumeric ASCII in the stem to a single '-' and trims
// leading/trailing '-'. Bytes >= 0x80 pass through, the extension is kept as-is and an
// empty stem becomes "output". Idempotent. Returns name unchanged when disabled.
std::string sanitize(const std::string& name, bool enabled = true);

// Lowercased extension without the dot, empty when the name has none.
std::string extensionOf(const std::filesystem::path& path);

bool isHidden(const std::filesystem::path& path);

}
