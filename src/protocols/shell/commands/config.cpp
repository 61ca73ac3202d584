#include "protocols/shell/commands/all.hpp"
#include "protocols/shell/Context.hpp"
#include "protocols/shell/Router.hpp"
#include "protocols/shell/util/argsHelpers.hpp"

#include <filesystem>
#include <fmt/core.h>

using namespace ss::shell;

namespace {

CommandResult handle_config_show(const CommandCall& call, const std::shared_ptr<Context>& ctx) {
    if (!call.positionals.empty()) return invalid("config show: unexpected argument '" + call.positionals.front() + "'");

    std::error_code ec;
    const bool exists = std::filesystem::exists(ctx->configPath(), ec);
    return ok(fmt::format("# {}{}\n# catalog: {}\n{}",
                          ctx->configPath().string(), exists ? "" : " (not found, showing defaults)",
                          ctx->catalogPath().string(), ctx->config().dump()));
}

CommandResult handle_config(const CommandCall& call, const std::shared_ptr<Context>& ctx) {
    const auto [sub, subcall] = descend(call);
    if (sub.empty() || sub == "show") return handle_config_show(subcall, ctx);
    return invalid(fmt::format("config: unknown subcommand '{}'. Only 'show' is supported; edit {} to change settings.",
                               sub, ctx->configPath().string()));
}

}

void ss::shell::registerConfigCommands(const std::shared_ptr<Router>& r, const std::shared_ptr<Context>& ctx) {
    r->registerCommand({"config", {}, "config show", "Show the effective configuration"},
                       [ctx](const CommandCall& call) { return handle_config(call, ctx); });
}
