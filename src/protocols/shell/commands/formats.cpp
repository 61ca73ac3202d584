#include "protocols/shell/commands/all.hpp"
#include "protocols/shell/commands/helpers.hpp"
#include "protocols/shell/Context.hpp"
#include "protocols/shell/Router.hpp"
#include "protocols/shell/util/argsHelpers.hpp"
#include "catalog/Registry.hpp"

#include <algorithm>
#include <fmt/core.h>
#include <fmt/format.h>

using namespace ss::shell;

namespace {

CommandResult handle_formats(const CommandCall& call, const std::shared_ptr<Context>& ctx) {
    if (!call.positionals.empty()) return invalid("formats: unexpected argument '" + call.positionals.front() + "'");

    auto formats = ctx->catalog()->formats();
    std::ranges::sort(formats, {}, &ss::catalog::Format::code);

    if (hasFlag(call, "json")) {
        auto arr = nlohmann::json::array();
        for (const auto& f : formats) arr.push_back(to_json(f));
        return okJson(std::move(arr));
    }

    std::vector<std::string> lines;
    lines.reserve(formats.size());
    for (const auto& f : formats) lines.push_back(to_string(f));
    return ok(fmt::format("{}", fmt::join(lines, "\n")));
}

}

void ss::shell::registerFormatCommands(const std::shared_ptr<Router>& r, const std::shared_ptr<Context>& ctx) {
    r->registerCommand({"formats", {"format"}, "formats [--json]", "List known embroidery file formats"},
                       [ctx](const CommandCall& call) { return handle_formats(call, ctx); });
}
