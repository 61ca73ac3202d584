#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <stdexcept>

namespace ss::config {

namespace {

template <typename T>
void decodeSection(const YAML::Node& root, const std::string& key, T& out) {
    if (const auto node = root[key]) {
        if (!YAML::convert<T>::decode(node, out))
            throw std::runtime_error("Invalid config section '" + key + "': expected a mapping");
    }
}

std::optional<std::string> optionalString(const YAML::Node& root, const std::string& key) {
    const auto node = root[key];
    if (!node || node.IsNull()) return std::nullopt;
    auto value = node.as<std::string>();
    if (value.empty()) return std::nullopt;
    return value;
}

Config fromNode(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("Config root must be a mapping");

    decodeSection(root, "watch", cfg.watch);
    decodeSection(root, "converter", cfg.converter);
    decodeSection(root, "catalog", cfg.catalog);
    decodeSection(root, "logging", cfg.logging);

    cfg.machine = optionalString(root, "machine");
    cfg.output_format = optionalString(root, "output_format");

    return cfg;
}

}

Config loadConfig(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) return {};
    return fromNode(YAML::LoadFile(path.string()));
}

Config parseConfig(const std::string& yaml) {
    return fromNode(YAML::Load(yaml));
}

std::string Config::dump() const {
    YAML::Node root;
    root["watch"] = watch;
    if (machine) root["machine"] = *machine;
    if (output_format) root["output_format"] = *output_format;
    root["converter"] = converter;
    root["catalog"] = catalog;
    root["logging"] = logging;

    YAML::Emitter out;
    out << root;
    return {out.c_str()};
}

}
