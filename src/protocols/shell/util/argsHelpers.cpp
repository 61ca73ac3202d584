#include "protocols/shell/util/argsHelpers.hpp"

#include <algorithm>

using namespace ss::shell;

CommandResult ss::shell::invalid(std::string msg) { return {2, "", std::move(msg)}; }
CommandResult ss::shell::failure(std::string msg) { return {1, "", std::move(msg)}; }
CommandResult ss::shell::ok(std::string out) { return {0, std::move(out), ""}; }

CommandResult ss::shell::okJson(nlohmann::json data) {
    CommandResult res{0, data.dump(2), ""};
    res.data = std::move(data);
    res.has_data = true;
    return res;
}

std::optional<std::string> ss::shell::optVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return v.value_or(std::string{});
    return std::nullopt;
}

std::optional<std::string> ss::shell::optVal(const CommandCall& c, const std::vector<std::string>& keys) {
    for (const auto& key : keys)
        if (auto v = optVal(c, key)) return v;
    return std::nullopt;
}

bool ss::shell::hasFlag(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return !v.has_value();
    return false;
}

bool ss::shell::hasFlag(const CommandCall& c, const std::vector<std::string>& keys) {
    return std::ranges::any_of(keys, [&c](const auto& k) { return hasFlag(c, k); });
}

bool ss::shell::hasKey(const CommandCall& c, const std::string& key) {
    return std::ranges::any_of(c.options, [&key](const auto& kv) { return kv.key == key; });
}

std::vector<std::string> ss::shell::unknownOptions(const CommandCall& c, const std::vector<std::string>& known) {
    std::vector<std::string> out;
    for (const auto& [k, v] : c.options)
        if (std::ranges::find(known, k) == known.end()) out.push_back(k);
    return out;
}

std::pair<std::string_view, CommandCall> ss::shell::descend(const CommandCall& call) {
    if (call.positionals.empty()) return {"", call};
    std::string_view sub = call.positionals[0];
    CommandCall subcall = call;
    subcall.positionals.erase(subcall.positionals.begin());
    return {sub, subcall};
}
