#include "protocols/shell/Router.hpp"
#include "protocols/shell/Token.hpp"
#include "protocols/shell/Parser.hpp"
#include "protocols/shell/util/argsHelpers.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <algorithm>
#include <cctype>

using namespace ss::shell;

void Router::registerCommand(CommandSpec spec, CommandHandler handler) {
    const std::string key = normalize(spec.name);

    CommandInfo info{std::move(spec), std::move(handler), {}};
    if (info.spec.description.empty()) info.spec.description = "No description provided.";

    for (const std::string& alias : info.spec.aliases) {
        const auto a = normalize_alias(alias);
        if (aliasMap_.contains(a) && aliasMap_.at(a) != key) {
            ss::log::Registry::shell()->warn("[Router] Alias '{}' already mapped to '{}'; skipping duplicate for '{}'",
                                             a, aliasMap_.at(a), key);
            continue;
        }
        info.aliases.insert(a);
        aliasMap_[a] = key;
    }

    if (info.spec.pluralAliasImpliesList) pluralMap_[key + "s"] = key;

    if (!commands_.contains(key)) order_.push_back(key);
    commands_[key] = std::move(info);
}

std::string Router::canonicalFor(const std::string& nameOrAlias) const {
    const std::string n = normalize_alias(nameOrAlias);
    if (commands_.contains(n)) return n;
    if (aliasMap_.contains(n)) return aliasMap_.at(n);
    if (pluralMap_.contains(n)) return pluralMap_.at(n);
    return n; // unknown; let caller error
}

bool Router::hasCommand(const std::string& nameOrAlias) const {
    return commands_.contains(canonicalFor(nameOrAlias));
}

const std::unordered_set<std::string>& Router::switches() {
    static const std::unordered_set<std::string> s = {"json", "verbose", "v", "help", "h"};
    return s;
}

CommandResult Router::execute(const std::vector<std::string>& args) const {
    auto toks = tokenize(args);
    ss::log::Registry::shell()->debug("[Router] Tokens: {}", to_string(toks));
    auto call = parseTokens(toks, switches());

    // "--help" / "-h" with no command, or nothing at all
    if (call.name.empty()) {
        if (call.options.empty() || hasFlag(call, "help") || hasFlag(call, "h")) call.name = "help";
        else return invalid(fmt::format("No command provided.\n\n{}", helpText()));
    }

    const auto canonical = canonicalFor(call.name);
    if (!commands_.contains(canonical))
        return invalid(fmt::format("Unknown command: {}\nRun 'stitch-sync help' for a list of commands.", call.name));

    if (pluralMap_.contains(normalize(call.name)) && (call.positionals.empty() || call.positionals.front() != "list"))
        call.positionals.insert(call.positionals.begin(), "list");
    call.name = canonical;

    const auto& info = commands_.at(canonical);
    if (canonical != "help" && (hasFlag(call, "help") || hasFlag(call, "h")))
        return ok(fmt::format("Usage: stitch-sync {}\n\n{}", info.spec.synopsis, info.spec.description));

    ss::log::Registry::shell()->debug("[Router] Executing command: '{}'", canonical);

    try {
        return info.handler(call);
    } catch (const std::exception& e) {
        ss::log::Registry::shell()->debug("[Router] {} failed: {}", canonical, e.what());
        return {1, "", e.what()};
    }
}

std::vector<const CommandSpec*> Router::commands() const {
    std::vector<const CommandSpec*> out;
    out.reserve(order_.size());
    for (const auto& key : order_) out.push_back(&commands_.at(key).spec);
    return out;
}

std::string Router::helpText() const {
    size_t width = 0;
    for (const auto* c : commands()) width = std::max(width, c->synopsis.size());

    std::string out = "Usage: stitch-sync <command> [options]\n\nCommands:\n";
    for (const auto* c : commands())
        out += fmt::format("  {:<{}}  {}\n", c->synopsis, width, c->description);

    out += "\nQuick start:\n"
           "  stitch-sync machines              list supported machines\n"
           "  stitch-sync watch --machine NAME  watch ~/Downloads for designs for NAME\n";
    return out;
}

std::string Router::normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string Router::strip_leading_dashes(const std::string& s) {
    size_t i = 0; while (i < s.size() && s[i] == '-') ++i;
    return std::string{s.substr(i)};
}

std::string Router::normalize_alias(const std::string& s) {
    return normalize(strip_leading_dashes(s));
}
