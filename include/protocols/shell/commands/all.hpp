#pragma once

#include <memory>

namespace ss::shell {

class Router;
class Context;

void registerWatchCommands(const std::shared_ptr<Router>& r, const std::shared_ptr<Context>& ctx);
void registerMachineCommands(const std::shared_ptr<Router>& r, const std::shared_ptr<Context>& ctx);
void registerFormatCommands(const std::shared_ptr<Router>& r, const std::shared_ptr<Context>& ctx);
void registerConfigCommands(const std::shared_ptr<Router>& r, const std::shared_ptr<Context>& ctx);
void registerSystemCommands(const std::shared_ptr<Router>& r);

namespace commands {
void registerAllCommands(const std::shared_ptr<Router>& r, const std::shared_ptr<Context>& ctx);
}

}
