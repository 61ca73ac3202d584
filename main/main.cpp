#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "protocols/shell/Context.hpp"
#include "protocols/shell/Router.hpp"
#include "protocols/shell/commands/all.hpp"
#include "util/paths.hpp"

#include <cstdlib>
#include <string>
#include <vector>
#include <fmt/core.h>

#if defined(_WIN32)
#include <cstdio>
#include <io.h>
#else
#include <unistd.h>
#endif

using namespace ss::config;
using namespace ss::shell;

namespace {

bool stdinIsTerminal() {
#if defined(_WIN32)
    return ::_isatty(::_fileno(stdin)) != 0;
#else
    return ::isatty(STDIN_FILENO) != 0;
#endif
}

}

int main(const int argc, char** argv) {
    try {
        ConfigRegistry::init();
        ss::log::Registry::init();
    } catch (const std::exception& e) {
        fmt::print(stderr, "stitch-sync: failed to load configuration from {}: {}\n",
                   ss::paths::getConfigPath().string(), e.what());
        return EXIT_FAILURE;
    }

    try {
        const auto ctx = std::make_shared<Context>(ConfigRegistry::get(), ConfigRegistry::sourcePath());
        ctx->interactive = stdinIsTerminal();

        const auto router = std::make_shared<Router>();
        commands::registerAllCommands(router, ctx);

        const std::vector<std::string> args(argv + 1, argv + argc);
        const auto res = router->execute(args);

        if (!res.stdout_text.empty()) fmt::print("{}\n", res.stdout_text);
        if (!res.stderr_text.empty()) {
            ss::log::Registry::shell()->debug("[main] exit {}: {}", res.exit_code, res.stderr_text);
            fmt::print(stderr, "{}\n", res.stderr_text);
        }

        ss::log::Registry::shutdown();
        return res.exit_code;
    } catch (const std::exception& e) {
        ss::log::Registry::stitchsync()->error("[-] {}", e.what());
        ss::log::Registry::shutdown();
        return EXIT_FAILURE;
    }
}
