#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

namespace ss::config {

struct WatchConfig {
    std::optional<std::filesystem::path> dir;
    std::chrono::milliseconds stabilize_window{500};
    std::chrono::milliseconds poll_interval{100};
    std::chrono::seconds settle_timeout{60};
};

struct ConverterConfig {
    std::optional<std::filesystem::path> path;   // explicit inkscape binary, skips discovery
    std::chrono::seconds timeout{120};
    std::chrono::seconds shutdown_grace{5};
};

struct CatalogConfig {
    std::filesystem::path path;                  // empty = compiled-in resource path
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum stitchsync = spdlog::level::info;   // Session lifecycle, per-file results
    spdlog::level::level_enum watch      = spdlog::level::info;   // Watch source and pipeline stages
    spdlog::level::level_enum convert    = spdlog::level::info;   // Converter discovery and runs
    spdlog::level::level_enum volume     = spdlog::level::warn;   // Device queries are noisy, surface failures
    spdlog::level::level_enum catalog    = spdlog::level::warn;   // Load errors only
    spdlog::level::level_enum shell      = spdlog::level::warn;   // Argument parsing edge cases
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;               // empty = paths::getLogPath()
    LogLevelsConfig levels;
};

struct Config {
    WatchConfig watch;
    std::optional<std::string> machine;
    std::optional<std::string> output_format;
    ConverterConfig converter;
    CatalogConfig catalog;
    LoggingConfig logging;

    [[nodiscard]] std::string dump() const;
};

// Missing file yields defaults; malformed YAML throws.
Config loadConfig(const std::filesystem::path& path);
Config parseConfig(const std::string& yaml);

}
