#pragma once

#include "catalog/MachineProfile.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ss::policy {

struct ResolvedPolicy {
    std::vector<std::string> accepted;      // never empty, machine order preserved
    std::string preferred;
    std::optional<catalog::MachineProfile> machine;

    [[nodiscard]] bool accepts(const std::string& code) const;
    [[nodiscard]] bool sanitizeNames() const { return !machine || machine->sanitize_names; }
    [[nodiscard]] std::optional<std::string> destinationSubpath() const {
        return machine ? machine->destination_subpath : std::nullopt;
    }
};

}
