#include "protocols/shell/commands/all.hpp"
#include "protocols/shell/Router.hpp"
#include "protocols/shell/util/argsHelpers.hpp"

#ifndef STITCHSYNC_VERSION
#define STITCHSYNC_VERSION "0.0.0"
#endif

namespace ss::shell {

static CommandResult handle_help(const Router& r) {
    return ok(r.helpText());
}

static CommandResult handle_version() {
    return {0, "stitch-sync v" + std::string(STITCHSYNC_VERSION), ""};
}

void registerSystemCommands(const std::shared_ptr<Router>& r) {
    const Router* router = r.get();
    r->registerCommand({"help", {"h", "?"}, "help", "Show this help"},
                       [router](const CommandCall&) { return handle_help(*router); });
    r->registerCommand({"version", {}, "version", "Print the version"},
                       [](const CommandCall&) { return handle_version(); });
}

}
