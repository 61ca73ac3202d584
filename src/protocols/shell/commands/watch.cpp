#include "protocols/shell/commands/all.hpp"
#include "protocols/shell/commands/helpers.hpp"
#include "protocols/shell/Context.hpp"
#include "protocols/shell/Router.hpp"
#include "protocols/shell/util/argsHelpers.hpp"
#include "session/Session.hpp"
#include "policy/errors.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

using namespace ss::shell;

namespace {

const std::vector<std::string> WATCH_OPTIONS = {"dir", "d", "machine", "m", "output-format", "o"};

CommandResult handle_watch(const CommandCall& call, const std::shared_ptr<Context>& ctx) {
    if (!call.positionals.empty()) return invalid("watch: unexpected argument '" + call.positionals.front() + "'");
    if (const auto unknown = unknownOptions(call, WATCH_OPTIONS); !unknown.empty())
        return invalid(fmt::format("watch: unknown option '{}'", unknown.front()));

    for (const auto& key : WATCH_OPTIONS)
        if (hasKey(call, key) && optVal(call, key)->empty())
            return invalid(fmt::format("watch: option '{}' requires a value", key));

    const auto settings = resolveSettings(call, ctx->config());

    try {
        auto session = ss::session::Session::create(settings, ctx->config(), ctx->catalog(), ctx->cancelFlag());
        const auto summary = session->run(ctx->interactive);

        CommandResult res = ok("");
        res.data = {{"copied_remote", summary.copied_remote},
                    {"copied_local", summary.copied_local},
                    {"converted", summary.converted},
                    {"ignored", summary.ignored},
                    {"failed", summary.failed}};
        res.has_data = true;
        return res;
    } catch (const ss::policy::UnknownMachineError& e) {
        return failure(fmt::format("{}\nRun 'stitch-sync machines' to see supported machines.", e.what()));
    } catch (const ss::policy::UnknownFormatError& e) {
        return failure(e.what());
    }
}

}

void ss::shell::registerWatchCommands(const std::shared_ptr<Router>& r, const std::shared_ptr<Context>& ctx) {
    r->registerCommand({"watch", {}, "watch [--dir D] [--machine M] [--output-format F]",
                        "Watch a directory and send new designs to the machine's USB drive"},
                       [ctx](const CommandCall& call) { return handle_watch(call, ctx); });
}
