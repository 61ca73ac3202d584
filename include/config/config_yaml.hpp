#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace ss::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<std::filesystem::path> {
    static Node encode(const std::filesystem::path& rhs) {
        return Node(rhs.string());
    }

    static bool decode(const Node& node, std::filesystem::path& rhs) {
        if (!node.IsScalar()) return false;
        rhs = std::filesystem::path(node.as<std::string>());
        return true;
    }
};

template<>
struct convert<WatchConfig> {
    static Node encode(const WatchConfig& rhs) {
        Node node;
        if (rhs.dir) node["dir"] = rhs.dir->string();
        node["stabilize_window_ms"] = rhs.stabilize_window.count();
        node["poll_interval_ms"] = rhs.poll_interval.count();
        node["settle_timeout_s"] = rhs.settle_timeout.count();
        return node;
    }

    static bool decode(const Node& node, WatchConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["dir"] && !node["dir"].IsNull()) rhs.dir = node["dir"].as<std::filesystem::path>();
        rhs.stabilize_window = std::chrono::milliseconds(node["stabilize_window_ms"].as<long>(500));
        rhs.poll_interval = std::chrono::milliseconds(node["poll_interval_ms"].as<long>(100));
        rhs.settle_timeout = std::chrono::seconds(node["settle_timeout_s"].as<long>(60));
        return true;
    }
};

template<>
struct convert<ConverterConfig> {
    static Node encode(const ConverterConfig& rhs) {
        Node node;
        if (rhs.path) node["path"] = rhs.path->string();
        node["timeout_s"] = rhs.timeout.count();
        node["shutdown_grace_s"] = rhs.shutdown_grace.count();
        return node;
    }

    static bool decode(const Node& node, ConverterConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["path"] && !node["path"].IsNull()) rhs.path = node["path"].as<std::filesystem::path>();
        rhs.timeout = std::chrono::seconds(node["timeout_s"].as<long>(120));
        rhs.shutdown_grace = std::chrono::seconds(node["shutdown_grace_s"].as<long>(5));
        return true;
    }
};

template<>
struct convert<CatalogConfig> {
    static Node encode(const CatalogConfig& rhs) {
        Node node;
        node["path"] = rhs.path.string();
        return node;
    }

    static bool decode(const Node& node, CatalogConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.path = node["path"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["stitchsync"] = to_std_string(spdlog::level::to_string_view(rhs.stitchsync));
        node["watch"]      = to_std_string(spdlog::level::to_string_view(rhs.watch));
        node["convert"]    = to_std_string(spdlog::level::to_string_view(rhs.convert));
        node["volume"]     = to_std_string(spdlog::level::to_string_view(rhs.volume));
        node["catalog"]    = to_std_string(spdlog::level::to_string_view(rhs.catalog));
        node["shell"]      = to_std_string(spdlog::level::to_string_view(rhs.shell));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.stitchsync = spdlog::level::from_str(node["stitchsync"].as<std::string>("info"));
        rhs.watch = spdlog::level::from_str(node["watch"].as<std::string>("info"));
        rhs.convert = spdlog::level::from_str(node["convert"].as<std::string>("info"));
        rhs.volume = spdlog::level::from_str(node["volume"].as<std::string>("warn"));
        rhs.catalog = spdlog::level::from_str(node["catalog"].as<std::string>("warn"));
        rhs.shell = spdlog::level::from_str(node["shell"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.levels.console_log_level));
        node["file_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.levels.file_log_level));
        node["subsystem_levels"] = rhs.levels.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        rhs.levels.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.levels.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (const auto sub = node["subsystem_levels"])
            rhs.levels.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

}
