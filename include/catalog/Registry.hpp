#pragma once

#include "catalog/Format.hpp"
#include "catalog/MachineProfile.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ss::catalog {

// Read-only format catalog and machine registry. Built once at startup and shared
// by const reference; there is no mutating API after construction.
class Registry {
public:
    Registry(std::vector<Format> formats, std::vector<MachineProfile> machines);

    static std::shared_ptr<const Registry> loadFile(const std::filesystem::path& path);
    static std::shared_ptr<const Registry> parse(const std::string& yaml);

    [[nodiscard]] const std::vector<Format>& formats() const { return formats_; }
    [[nodiscard]] const std::vector<MachineProfile>& machines() const { return machines_; }

    [[nodiscard]] const Format* findFormat(const std::string& code) const;
    [[nodiscard]] bool hasFormat(const std::string& code) const { return findFormat(code) != nullptr; }

    // Exact lookup on name or synonym, ignoring case and punctuation.
    [[nodiscard]] const MachineProfile* findMachine(const std::string& name) const;

    [[nodiscard]] std::vector<const MachineProfile*> machinesSupporting(const std::string& code) const;

    // Names and synonyms paired with the profile they belong to, for fuzzy matching.
    [[nodiscard]] std::vector<std::pair<std::string, const MachineProfile*>> machineNames() const;

    static std::string normalizeName(const std::string& name);
    static std::string normalizeCode(const std::string& code);

private:
    std::vector<Format> formats_;
    std::vector<MachineProfile> machines_;
    std::unordered_map<std::string, size_t> formatIndex_;
    std::unordered_map<std::string, size_t> machineIndex_;
};

}
