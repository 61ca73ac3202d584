#pragma once

#include <filesystem>

namespace ss::paths {

inline bool testMode = false;

std::filesystem::path getHomePath();

// $XDG_CONFIG_HOME/stitch-sync/config.yaml, falling back to ~/.config
std::filesystem::path getConfigPath();

// $XDG_STATE_HOME/stitch-sync/logs, falling back to ~/.local/state
std::filesystem::path getLogPath();

// Compiled-in location of the format/machine catalog resource
std::filesystem::path getCatalogPath();

std::filesystem::path getDefaultWatchDir();

// Replaces a leading "~" with the home directory.
std::filesystem::path expandHome(const std::filesystem::path& p);

void setLogPathForTesting();

}
