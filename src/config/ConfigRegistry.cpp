#include "config/ConfigRegistry.hpp"

#include <stdexcept>

namespace ss::config {

void ConfigRegistry::init(const std::filesystem::path& path) {
    if (initialized_) return;
    config_ = loadConfig(path);
    source_ = path;
    initialized_ = true;
}

void ConfigRegistry::init(Config config) {
    if (initialized_) return;
    config_ = std::move(config);
    initialized_ = true;
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

}
