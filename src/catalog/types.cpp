#include "catalog/Format.hpp"
#include "catalog/MachineProfile.hpp"

#include <fmt/core.h>
#include <fmt/format.h>
#include <algorithm>

namespace ss::catalog {

std::string to_string(const Format& f) {
    std::string out = fmt::format("{}: {}", f.code, f.manufacturer.empty() ? f.label : f.manufacturer);
    if (f.note) out += fmt::format(" -- {}", *f.note);
    return out;
}

bool MachineProfile::supports(const std::string& code) const {
    return std::ranges::find(formats, code) != formats.end();
}

std::string to_string(const MachineProfile& m, const bool verbose) {
    if (!verbose) return fmt::format("{} ({})", m.name, fmt::join(m.formats, ", "));

    std::string out = m.name + "\n";
    if (!m.synonyms.empty()) out += fmt::format("  Synonyms: {}\n", fmt::join(m.synonyms, ", "));
    if (!m.formats.empty()) out += fmt::format("  Formats: {}\n", fmt::join(m.formats, ", "));
    if (m.notes) out += fmt::format("  Notes: {}\n", *m.notes);
    if (m.design_size) out += fmt::format("  Design size: {}\n", *m.design_size);
    if (m.destination_subpath) out += fmt::format("  USB path: {}\n", *m.destination_subpath);
    if (!m.sanitize_names) out += "  Keeps original file names\n";
    out.pop_back();
    return out;
}

}
