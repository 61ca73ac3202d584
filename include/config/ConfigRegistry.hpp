#pragma once

#include "config/Config.hpp"
#include "util/paths.hpp"

#include <filesystem>

namespace ss::config {

class ConfigRegistry {
public:
    static void init(const std::filesystem::path& path = paths::getConfigPath());
    static void init(Config config);
    static const Config& get();

    [[nodiscard]] static bool isInitialized() { return initialized_; }

    [[nodiscard]] static const std::filesystem::path& sourcePath() { return source_; }

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline std::filesystem::path source_;
    static inline bool initialized_ = false;
};

}
