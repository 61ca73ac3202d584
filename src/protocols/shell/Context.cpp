#include "protocols/shell/Context.hpp"
#include "catalog/Registry.hpp"
#include "util/paths.hpp"

namespace ss::shell {

Context::Context(config::Config config, std::filesystem::path configPath)
    : config_(std::move(config)), configPath_(std::move(configPath)) {}

std::filesystem::path Context::catalogPath() const {
    return config_.catalog.path.empty() ? paths::getCatalogPath() : config_.catalog.path;
}

std::shared_ptr<const catalog::Registry> Context::catalog() {
    if (!catalog_) catalog_ = catalog::Registry::loadFile(catalogPath());
    return catalog_;
}

}
