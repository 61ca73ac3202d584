#include "util/paths.hpp"

#include <cstdlib>

#if defined(_WIN32)
#include <process.h>
#else
#include <unistd.h>
#endif

#ifndef STITCHSYNC_CATALOG_PATH
#define STITCHSYNC_CATALOG_PATH "/usr/share/stitch-sync/catalog.yaml"
#endif

namespace fs = std::filesystem;

namespace ss::paths {

namespace {

fs::path testLogPath_;

fs::path fromEnv(const char* var) {
    const char* v = std::getenv(var);
    if (v && *v) return {v};
    return {};
}

int currentPid() {
#if defined(_WIN32)
    return ::_getpid();
#else
    return static_cast<int>(::getpid());
#endif
}

}

fs::path getHomePath() {
    if (auto home = fromEnv("HOME"); !home.empty()) return home;
    if (auto profile = fromEnv("USERPROFILE"); !profile.empty()) return profile;
    return fs::temp_directory_path();
}

fs::path getConfigPath() {
    auto base = fromEnv("XDG_CONFIG_HOME");
    if (base.empty()) base = getHomePath() / ".config";
    return base / "stitch-sync" / "config.yaml";
}

fs::path getLogPath() {
    if (testMode && !testLogPath_.empty()) return testLogPath_;
    auto base = fromEnv("XDG_STATE_HOME");
    if (base.empty()) base = getHomePath() / ".local" / "state";
    return base / "stitch-sync" / "logs";
}

fs::path getCatalogPath() {
    if (auto override = fromEnv("STITCHSYNC_CATALOG"); !override.empty()) return override;
    return {STITCHSYNC_CATALOG_PATH};
}

fs::path getDefaultWatchDir() {
    return getHomePath() / "Downloads";
}

fs::path expandHome(const fs::path& p) {
    const auto s = p.string();
    if (s == "~") return getHomePath();
    if (s.rfind("~/", 0) == 0) return getHomePath() / s.substr(2);
    return p;
}

void setLogPathForTesting() {
    testMode = true;
    testLogPath_ = fs::temp_directory_path() / ("stitch-sync-test-logs-" + std::to_string(currentPid()));
}

}
