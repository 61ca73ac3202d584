#pragma once

#include <optional>
#include <string>
#include <vector>

namespace ss::catalog {

struct MachineProfile {
    std::string name;
    std::vector<std::string> synonyms;
    std::vector<std::string> formats;                // ordered, first = preferred
    std::optional<std::string> destination_subpath;  // relative to the volume root, e.g. "EMB/Embf"
    bool sanitize_names = true;
    std::optional<std::string> notes;
    std::optional<std::string> design_size;

    [[nodiscard]] bool supports(const std::string& code) const;
};

std::string to_string(const MachineProfile& m, bool verbose = false);

}
