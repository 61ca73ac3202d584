#include "protocols/shell/commands/all.hpp"
#include "protocols/shell/commands/helpers.hpp"
#include "protocols/shell/Context.hpp"
#include "protocols/shell/Router.hpp"
#include "protocols/shell/util/argsHelpers.hpp"
#include "catalog/Registry.hpp"
#include "policy/Resolver.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

using namespace ss::shell;
using namespace ss::catalog;

namespace {

bool wantsJson(const CommandCall& call) { return hasFlag(call, "json"); }

CommandResult handle_machine_list(const CommandCall& call, const std::shared_ptr<Context>& ctx) {
    if (!call.positionals.empty()) return invalid("machine list: unexpected argument '" + call.positionals.front() + "'");

    const auto registry = ctx->catalog();
    const bool verbose = hasFlag(call, std::vector<std::string>{"verbose", "v"});

    std::vector<const MachineProfile*> machines;
    if (const auto format = optVal(call, std::vector<std::string>{"format", "f"})) {
        if (format->empty()) return invalid("machine list: --format requires a value");
        if (!registry->hasFormat(*format))
            return failure(fmt::format("machine list: unknown format '{}'. Run 'stitch-sync formats' for the list.", *format));
        machines = registry->machinesSupporting(*format);
    } else {
        for (const auto& m : registry->machines()) machines.push_back(&m);
    }

    if (wantsJson(call)) {
        auto arr = nlohmann::json::array();
        for (const auto* m : machines) arr.push_back(to_json(*m));
        return okJson(std::move(arr));
    }

    std::vector<std::string> lines;
    lines.reserve(machines.size());
    for (const auto* m : machines) lines.push_back(to_string(*m, verbose));
    return ok(fmt::format("{}", fmt::join(lines, verbose ? "\n\n" : "\n")));
}

CommandResult handle_machine_info(const CommandCall& call, const std::shared_ptr<Context>& ctx) {
    if (call.positionals.empty()) return invalid("machine info: missing <name>");

    // Unquoted names arrive split across positionals
    const auto name = fmt::format("{}", fmt::join(call.positionals, " "));
    const auto registry = ctx->catalog();
    const ss::policy::Resolver resolver(registry);

    const auto match = resolver.matchMachine(name);
    if (!match.profile) return failure(ss::policy::UnknownMachineError(name, match.suggestions).what());

    if (wantsJson(call)) {
        auto j = to_json(*match.profile);
        j["match_score"] = match.score;
        return okJson(std::move(j));
    }

    return ok(to_string(*match.profile, true));
}

CommandResult handle_machine(const CommandCall& call, const std::shared_ptr<Context>& ctx) {
    const auto [sub, subcall] = descend(call);
    if (sub.empty() || sub == "list" || sub == "ls") return handle_machine_list(subcall, ctx);
    if (sub == "info" || sub == "show") return handle_machine_info(subcall, ctx);
    return invalid(fmt::format("machine: unknown subcommand '{}'. Use 'list' or 'info <name>'.", sub));
}

}

void ss::shell::registerMachineCommands(const std::shared_ptr<Router>& r, const std::shared_ptr<Context>& ctx) {
    r->registerCommand({"machine", {}, "machine list|info [NAME] [--format F] [--verbose] [--json]",
                        "List supported machines or show one machine's details", true},
                       [ctx](const CommandCall& call) { return handle_machine(call, ctx); });
}
