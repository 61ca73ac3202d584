#pragma once

#include "protocols/shell/types.hpp"

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace ss::shell {

class Router {
public:
    void registerCommand(CommandSpec spec, CommandHandler handler);

    // argv without the program name. An empty argv runs "help".
    CommandResult execute(const std::vector<std::string>& args) const;

    [[nodiscard]] bool hasCommand(const std::string& nameOrAlias) const;

    // Registered commands in registration order, for help output.
    [[nodiscard]] std::vector<const CommandSpec*> commands() const;

    [[nodiscard]] std::string helpText() const;

    // Flags that never take a value, whichever command they appear on.
    static const std::unordered_set<std::string>& switches();

private:
    std::unordered_map<std::string, CommandInfo> commands_;
    std::unordered_map<std::string, std::string> aliasMap_;   // alias -> canonical
    std::unordered_map<std::string, std::string> pluralMap_;  // "machines" -> "machine"
    std::vector<std::string> order_;

    [[nodiscard]] std::string canonicalFor(const std::string& nameOrAlias) const;

    static std::string normalize(const std::string& s);
    static std::string normalize_alias(const std::string& s);
    static std::string strip_leading_dashes(const std::string& s);
};

}
