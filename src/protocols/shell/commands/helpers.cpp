#include "protocols/shell/commands/helpers.hpp"
#include "protocols/shell/util/argsHelpers.hpp"
#include "catalog/Format.hpp"
#include "catalog/MachineProfile.hpp"
#include "convert/Gateway.hpp"
#include "util/paths.hpp"

namespace ss::shell {

policy::Settings resolveSettings(const CommandCall& call, const config::Config& config) {
    policy::Settings s;

    if (const auto dir = optVal(call, std::vector<std::string>{"dir", "d"}); dir && !dir->empty()) s.watch_dir = paths::expandHome(*dir);
    else if (config.watch.dir) s.watch_dir = paths::expandHome(*config.watch.dir);
    else s.watch_dir = paths::getDefaultWatchDir();

    if (const auto m = optVal(call, std::vector<std::string>{"machine", "m"}); m && !m->empty()) s.machine = *m;
    else s.machine = config.machine;

    if (const auto f = optVal(call, std::vector<std::string>{"output-format", "o"}); f && !f->empty()) s.output_format = *f;
    else s.output_format = config.output_format;

    return s;
}

nlohmann::json to_json(const catalog::MachineProfile& m) {
    nlohmann::json j = {
        {"name", m.name},
        {"synonyms", m.synonyms},
        {"formats", m.formats},
        {"sanitize_names", m.sanitize_names},
    };
    j["usb_path"] = m.destination_subpath ? nlohmann::json(*m.destination_subpath) : nlohmann::json(nullptr);
    j["notes"] = m.notes ? nlohmann::json(*m.notes) : nlohmann::json(nullptr);
    j["design_size"] = m.design_size ? nlohmann::json(*m.design_size) : nlohmann::json(nullptr);
    return j;
}

nlohmann::json to_json(const catalog::Format& f) {
    return {
        {"code", f.code},
        {"label", f.label},
        {"manufacturer", f.manufacturer},
        {"note", f.note ? nlohmann::json(*f.note) : nlohmann::json(nullptr)},
        {"inkstitch_read", convert::Gateway::canRead(f.code)},
        {"inkstitch_write", convert::Gateway::canWrite(f.code)},
    };
}

}
