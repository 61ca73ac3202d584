#include "catalog/Registry.hpp"
#include "log/Registry.hpp"

#include <yaml-cpp/yaml.h>
#include <fmt/core.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

using namespace ss::catalog;

namespace YAML {

template<>
struct convert<Format> {
    static bool decode(const Node& node, Format& rhs) {
        if (!node.IsMap() || !node["code"]) return false;
        rhs.code = Registry::normalizeCode(node["code"].as<std::string>());
        rhs.label = node["label"].as<std::string>(rhs.code);
        rhs.manufacturer = node["manufacturer"].as<std::string>("");
        if (node["note"] && !node["note"].IsNull()) rhs.note = node["note"].as<std::string>();
        return true;
    }
};

template<>
struct convert<MachineProfile> {
    static bool decode(const Node& node, MachineProfile& rhs) {
        if (!node.IsMap() || !node["name"]) return false;
        rhs.name = node["name"].as<std::string>();
        if (node["synonyms"]) rhs.synonyms = node["synonyms"].as<std::vector<std::string>>();
        if (node["formats"]) {
            for (const auto& f : node["formats"].as<std::vector<std::string>>())
                rhs.formats.push_back(Registry::normalizeCode(f));
        }
        if (node["usb_path"] && !node["usb_path"].IsNull()) {
            auto p = node["usb_path"].as<std::string>();
            if (!p.empty()) rhs.destination_subpath = std::move(p);
        }
        rhs.sanitize_names = node["sanitize_names"].as<bool>(true);
        if (node["notes"] && !node["notes"].IsNull()) rhs.notes = node["notes"].as<std::string>();
        if (node["design_size"] && !node["design_size"].IsNull()) rhs.design_size = node["design_size"].as<std::string>();
        return true;
    }
};

}

Registry::Registry(std::vector<Format> formats, std::vector<MachineProfile> machines)
    : formats_(std::move(formats)), machines_(std::move(machines)) {
    for (size_t i = 0; i < formats_.size(); ++i) {
        auto& f = formats_[i];
        f.code = normalizeCode(f.code);
        if (f.code.empty()) throw std::runtime_error("Catalog format with empty code");
        if (!formatIndex_.emplace(f.code, i).second)
            throw std::runtime_error(fmt::format("Duplicate format code in catalog: {}", f.code));
    }

    for (size_t i = 0; i < machines_.size(); ++i) {
        auto& m = machines_[i];
        for (auto& code : m.formats) {
            code = normalizeCode(code);
            if (!formatIndex_.contains(code))
                throw std::runtime_error(fmt::format("Machine '{}' references unknown format '{}'", m.name, code));
        }

        auto keys = m.synonyms;
        keys.push_back(m.name);
        for (const auto& key : keys) {
            const auto norm = normalizeName(key);
            if (norm.empty()) continue;
            const auto [it, inserted] = machineIndex_.emplace(norm, i);
            if (!inserted && it->second != i)
                throw std::runtime_error(fmt::format("Equivalent machine names in catalog: '{}' and '{}'",
                                                     machines_[it->second].name, m.name));
        }
    }
}

namespace {

std::shared_ptr<const Registry> fromNode(const YAML::Node& root) {
    if (!root.IsMap()) throw std::runtime_error("Catalog root must be a mapping with 'formats' and 'machines'");

    std::vector<Format> formats;
    if (const auto node = root["formats"]) {
        for (const auto& item : node) {
            Format f;
            if (!YAML::convert<Format>::decode(item, f))
                throw std::runtime_error("Invalid format entry in catalog");
            formats.push_back(std::move(f));
        }
    }

    std::vector<MachineProfile> machines;
    if (const auto node = root["machines"]) {
        for (const auto& item : node) {
            MachineProfile m;
            if (!YAML::convert<MachineProfile>::decode(item, m))
                throw std::runtime_error("Invalid machine entry in catalog");
            machines.push_back(std::move(m));
        }
    }

    auto registry = std::make_shared<const Registry>(std::move(formats), std::move(machines));
    ss::log::Registry::catalog()->debug("[Catalog] {} formats, {} machines",
                                    registry->formats().size(), registry->machines().size());
    return registry;
}

}

std::shared_ptr<const Registry> Registry::parse(const std::string& yaml) {
    return fromNode(YAML::Load(yaml));
}

std::shared_ptr<const Registry> Registry::loadFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path))
        throw std::runtime_error("Catalog file not found: " + path.string());

    ss::log::Registry::catalog()->debug("[Catalog] Loading {}", path.string());
    try {
        return fromNode(YAML::LoadFile(path.string()));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(fmt::format("Failed to parse catalog {}: {}", path.string(), e.what()));
    }
}

const Format* Registry::findFormat(const std::string& code) const {
    const auto it = formatIndex_.find(normalizeCode(code));
    if (it == formatIndex_.end()) return nullptr;
    return &formats_[it->second];
}

const MachineProfile* Registry::findMachine(const std::string& name) const {
    const auto it = machineIndex_.find(normalizeName(name));
    if (it == machineIndex_.end()) return nullptr;
    return &machines_[it->second];
}

std::vector<const MachineProfile*> Registry::machinesSupporting(const std::string& code) const {
    const auto norm = normalizeCode(code);
    std::vector<const MachineProfile*> out;
    for (const auto& m : machines_)
        if (m.supports(norm)) out.push_back(&m);
    return out;
}

std::vector<std::pair<std::string, const MachineProfile*>> Registry::machineNames() const {
    std::vector<std::pair<std::string, const MachineProfile*>> out;
    for (const auto& m : machines_) {
        out.emplace_back(m.name, &m);
        for (const auto& s : m.synonyms)
            if (!s.empty()) out.emplace_back(s, &m);
    }
    return out;
}

std::string Registry::normalizeName(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (const unsigned char c : name)
        if (std::isalnum(c)) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string Registry::normalizeCode(const std::string& code) {
    std::string out;
    out.reserve(code.size());
    for (const unsigned char c : code) {
        if (std::isspace(c)) continue;
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    if (!out.empty() && out.front() == '.') out.erase(out.begin());
    return out;
}
