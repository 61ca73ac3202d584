#include "convert/Gateway.hpp"
#include "util/Subprocess.hpp"
#include "util/filename.hpp"
#include "util/paths.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cstdlib>
#include <fmt/core.h>

namespace fs = std::filesystem;

namespace ss::convert {

namespace {

constexpr const char* INKSTITCH_INSTALL_URL = "https://inkstitch.org/docs/install/";

#if defined(_WIN32)
constexpr const char* CONVERTER_BINARY = "inkscape.exe";
#else
constexpr const char* CONVERTER_BINARY = "inkscape";
#endif

bool pathExists(const fs::path& p) {
    std::error_code ec;
    return fs::exists(p, ec);
}

std::string tail(const std::string& s, const size_t n) {
    return s.size() <= n ? s : s.substr(s.size() - n);
}

bool mentionsMissingExtension(const std::string& stderrText) {
    return stderrText.find("extension not found") != std::string::npos ||
           stderrText.find("unknown extension") != std::string::npos ||
           stderrText.find("Could not detect file format") != std::string::npos;
}

ConversionResult failed(std::string diagnostic) {
    return {ConversionResult::Status::Failed, std::nullopt, std::move(diagnostic)};
}

}

std::string to_string(const ConversionResult::Status status) {
    switch (status) {
        case ConversionResult::Status::Converted: return "converted";
        case ConversionResult::Status::NotAvailable: return "not available";
        case ConversionResult::Status::Failed: return "failed";
    }
    return "unknown";
}

Gateway::Gateway(ConverterInfo info, config::ConverterConfig config)
    : info_(std::move(info)), config_(std::move(config)) {}

std::shared_ptr<Gateway> Gateway::probe(const config::ConverterConfig& config) {
    auto gateway = std::make_shared<Gateway>(discover(config), config);
    const auto a = gateway->available();
    log::Registry::convert()->debug("[Gateway] converter={} extension={}",
                                    gateway->info_.executable ? gateway->info_.executable->string() : "missing",
                                    gateway->info_.extension_dir ? gateway->info_.extension_dir->string() : "missing");
    if (!a.usable())
        log::Registry::convert()->debug("[Gateway] Conversion disabled for this session");
    return gateway;
}

ConverterInfo Gateway::discover(const config::ConverterConfig& config) {
    ConverterInfo info;

    if (config.path) {
        if (pathExists(*config.path)) info.executable = *config.path;
        else log::Registry::convert()->warn("[Gateway] Configured converter {} does not exist", config.path->string());
    }

    if (!info.executable) {
        if (const auto onPath = util::Subprocess::which(CONVERTER_BINARY)) info.executable = fs::path(*onPath);
    }

    if (!info.executable) {
        for (const auto& dir : converterSearchPaths()) {
            const auto candidate = dir / CONVERTER_BINARY;
            if (pathExists(candidate)) {
                info.executable = candidate;
                break;
            }
        }
    }

    for (const auto& dir : extensionSearchPaths(info.executable)) {
        if (pathExists(dir)) {
            info.extension_dir = dir;
            break;
        }
    }

    return info;
}

Availability Gateway::available() const {
    return {info_.executable.has_value(), info_.extension_dir.has_value()};
}

ConversionResult Gateway::convert(const fs::path& input,
                                  const std::string& target,
                                  const std::shared_ptr<std::atomic<bool>>& cancel) const {
    if (!available().usable())
        return {ConversionResult::Status::NotAvailable, std::nullopt,
                info_.executable ? "ink/stitch extension not found" : "Inkscape not found"};

    const auto source = util::extensionOf(input);
    if (!canRead(source)) return failed(fmt::format("ink/stitch cannot read .{} files", source));
    if (!canWrite(target)) return failed(fmt::format("ink/stitch cannot write .{} files", target));

    if (source == target) return {ConversionResult::Status::Converted, input, "already in target format"};

    if (cancel && cancel->load()) return failed("cancelled");

    const auto output = input.parent_path() / fmt::format("{}.{}", input.stem().string(), target);

    std::error_code ec;
    fs::remove(output, ec);

    util::ProcessOptions opts;
    opts.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config_.timeout);
    opts.grace = std::chrono::duration_cast<std::chrono::milliseconds>(config_.shutdown_grace);
    opts.cancel = cancel;

    log::Registry::convert()->info("[Gateway] Converting {} -> {}", input.filename().string(), output.filename().string());

    const auto res = util::Subprocess::run(
        {info_.executable->string(), input.string(), "--export-filename=" + output.string()}, opts);

    if (!res.stdout_text.empty())
        log::Registry::convert()->debug("[Gateway] converter stdout: {}", tail(res.stdout_text, DIAGNOSTIC_TAIL));

    if (res.spawn_error) return failed(*res.spawn_error);
    if (res.cancelled) return failed("cancelled");
    if (res.timed_out) return failed(fmt::format("converter timed out after {}s", config_.timeout.count()));

    if (mentionsMissingExtension(res.stderr_text))
        return failed(fmt::format("ink/stitch extension not installed or not working properly, see {}",
                                  INKSTITCH_INSTALL_URL));

    if (res.exit_code != 0)
        return failed(fmt::format("converter exited with code {}: {}", res.exit_code,
                                  tail(res.stderr_text, DIAGNOSTIC_TAIL)));

    if (!pathExists(output))
        return failed(fmt::format("converter produced no output: {}", tail(res.stderr_text, DIAGNOSTIC_TAIL)));

    return {ConversionResult::Status::Converted, output, {}};
}

std::string Gateway::conversionTarget(const std::string& preferred) {
    if (preferred == "jef+") return "jef";
    return preferred;
}

const std::vector<std::string>& Gateway::readableFormats() {
    static const std::vector<std::string> formats = {
        "100", "10o", "bro", "dat", "dsb", "dst", "dsz", "emd", "exp", "exy",
        "fxy", "gt",  "inb", "jef", "jpx", "ksm", "max", "mit", "new", "pcd",
        "pcm", "pcq", "pcs", "pec", "pes", "phb", "phc", "sew", "shv", "stc",
        "stx", "tap", "tbf", "txt", "u01", "vp3", "xxx", "zxy"
    };
    return formats;
}

const std::vector<std::string>& Gateway::writableFormats() {
    static const std::vector<std::string> formats = {
        "csv", "dst", "exp", "jef", "pec", "pes", "svg", "txt", "u01", "vp3"
    };
    return formats;
}

bool Gateway::canRead(const std::string& code) {
    return std::ranges::find(readableFormats(), code) != readableFormats().end();
}

bool Gateway::canWrite(const std::string& code) {
    return std::ranges::find(writableFormats(), code) != writableFormats().end();
}

std::vector<fs::path> Gateway::converterSearchPaths() {
    std::vector<fs::path> dirs;
#if defined(_WIN32)
    for (const auto* var : {"ProgramFiles", "ProgramFiles(x86)"})
        if (const char* pf = std::getenv(var); pf && *pf) dirs.emplace_back(fs::path(pf) / "Inkscape" / "bin");
#elif defined(__APPLE__)
    dirs.emplace_back("/Applications/Inkscape.app/Contents/MacOS");
#else
    dirs.emplace_back("/usr/bin");
    dirs.emplace_back("/usr/local/bin");
    dirs.emplace_back("/opt/inkscape/bin");
#endif
    return dirs;
}

std::vector<fs::path> Gateway::extensionSearchPaths(const std::optional<fs::path>& executable) {
    std::vector<fs::path> dirs;
    const auto home = paths::getHomePath();
#if defined(_WIN32)
    if (const char* appdata = std::getenv("APPDATA"); appdata && *appdata)
        dirs.emplace_back(fs::path(appdata) / "inkscape" / "extensions" / "inkstitch");
    if (executable) dirs.emplace_back(executable->parent_path().parent_path() / "share" / "inkscape" / "extensions" / "inkstitch");
#elif defined(__APPLE__)
    dirs.emplace_back(home / "Library" / "Application Support" / "org.inkscape.Inkscape" / "config" / "inkscape" / "extensions" / "inkstitch");
    if (executable) dirs.emplace_back(executable->parent_path().parent_path() / "Resources" / "share" / "inkscape" / "extensions" / "inkstitch");
#else
    (void)executable;
    dirs.emplace_back(home / ".config" / "inkscape" / "extensions" / "inkstitch");
    dirs.emplace_back("/usr/share/inkscape/extensions/inkstitch");
    dirs.emplace_back("/usr/local/share/inkscape/extensions/inkstitch");
#endif
    return dirs;
}

}
