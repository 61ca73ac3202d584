#pragma once

#include <functional>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>

namespace ss::shell {

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;
    std::vector<std::string> positionals;

    [[nodiscard]] inline std::vector<std::string> constructFullArgs() const {
        std::vector<std::string> args;
        args.reserve(1 + positionals.size());
        args.push_back(name);
        for (const auto& pos : positionals) args.push_back(pos);
        return args;
    }
};

struct CommandResult {
    int exit_code = 0;                 // 0 = success, 1 = runtime error, 2 = usage error
    std::string stdout_text;
    std::string stderr_text;
    nlohmann::json data;               // optional machine-readable payload
    bool has_data = false;
};

using CommandHandler = std::function<CommandResult(const CommandCall&)>;

struct CommandSpec {
    std::string name;
    std::vector<std::string> aliases;
    std::string synopsis;                    // e.g. "watch [--dir D] [--machine M]"
    std::string description;
    bool pluralAliasImpliesList = false;     // "machines" -> "machine list"
};

struct CommandInfo {
    CommandSpec spec;
    CommandHandler handler;
    std::unordered_set<std::string> aliases; // own normalized aliases (no dashes)
};

}
