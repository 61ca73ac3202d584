#pragma once

#include "config/Config.hpp"

#include <atomic>
#include <filesystem>
#include <memory>

namespace ss::catalog { class Registry; }

namespace ss::shell {

// What command handlers need from the process: configuration, the catalog and the
// session cancel flag.
class Context {
public:
    Context(config::Config config, std::filesystem::path configPath);

    [[nodiscard]] const config::Config& config() const { return config_; }
    [[nodiscard]] const std::filesystem::path& configPath() const { return configPath_; }

    // Loaded on first use from config.catalog.path or the installed resource. Throws on load errors.
    std::shared_ptr<const catalog::Registry> catalog();
    void setCatalog(std::shared_ptr<const catalog::Registry> registry) { catalog_ = std::move(registry); }

    [[nodiscard]] std::filesystem::path catalogPath() const;

    [[nodiscard]] const std::shared_ptr<std::atomic<bool>>& cancelFlag() const { return cancel_; }

    bool interactive = true;

private:
    config::Config config_;
    std::filesystem::path configPath_;
    std::shared_ptr<const catalog::Registry> catalog_;
    std::shared_ptr<std::atomic<bool>> cancel_ = std::make_shared<std::atomic<bool>>(false);
};

}
