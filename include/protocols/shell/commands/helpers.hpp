#pragma once

#include "protocols/shell/types.hpp"
#include "config/Config.hpp"
#include "policy/Settings.hpp"

#include <nlohmann/json.hpp>

namespace ss::catalog {
struct Format;
struct MachineProfile;
}

namespace ss::shell {

// CLI option > config file > built-in default, for each watch setting.
policy::Settings resolveSettings(const CommandCall& call, const config::Config& config);

nlohmann::json to_json(const catalog::MachineProfile& m);
nlohmann::json to_json(const catalog::Format& f);

}
