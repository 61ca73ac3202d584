#pragma once

#include "protocols/shell/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ss::shell {

CommandResult invalid(std::string msg);
CommandResult failure(std::string msg);
CommandResult ok(std::string out);
CommandResult okJson(nlohmann::json data);

std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys);
std::optional<std::string> optVal(const CommandCall& c, const std::string& key);

[[nodiscard]] bool hasFlag(const CommandCall& c, const std::string& key);
[[nodiscard]] bool hasFlag(const CommandCall& c, const std::vector<std::string>& keys);

[[nodiscard]] bool hasKey(const CommandCall& c, const std::string& key);

// Options not in `known`, for "unknown option" errors.
std::vector<std::string> unknownOptions(const CommandCall& c, const std::vector<std::string>& known);

// Splits off the first positional as a subcommand.
std::pair<std::string_view, CommandCall> descend(const CommandCall& call);

}
