#include "protocols/shell/commands/all.hpp"
#include "protocols/shell/Router.hpp"

using namespace ss::shell;

void ss::shell::commands::registerAllCommands(const std::shared_ptr<Router>& r, const std::shared_ptr<Context>& ctx) {
    registerWatchCommands(r, ctx);
    registerMachineCommands(r, ctx);
    registerFormatCommands(r, ctx);
    registerConfigCommands(r, ctx);
    registerSystemCommands(r);
}
