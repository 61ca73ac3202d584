#include "log/Registry.hpp"
#include "config/ConfigRegistry.hpp"
#include "util/paths.hpp"

#include <filesystem>
#include <stdexcept>

namespace ss::log {

void Registry::init() {
    const auto& cnf = config::ConfigRegistry::get().logging;
    init(cnf.log_dir.empty() ? paths::getLogPath() : paths::expandHome(cnf.log_dir));
}

void Registry::init(const std::filesystem::path& logDir) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    log_dir_ = logDir;
    main_log_path_ = log_dir_ / "stitch-sync.log";

    namespace fs = std::filesystem;
    if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

    // Fall back to compiled-in levels when the config has not been loaded (tests, early errors)
    const auto cnf = config::ConfigRegistry::isInitialized()
                         ? config::ConfigRegistry::get().logging
                         : config::LoggingConfig{};

    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(CONSOLE_FORMAT);

    main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        main_log_path_.string(), main_max_bytes_, main_max_files_);
    main_file_sink_->set_level(cnf.levels.file_log_level);
    main_file_sink_->set_pattern(LOG_FORMAT);

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console_sink_, main_file_sink_});
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("stitchsync", sub_levels.stitchsync);
    makeLogger("watch",      sub_levels.watch);
    makeLogger("convert",    sub_levels.convert);
    makeLogger("volume",     sub_levels.volume);
    makeLogger("catalog",    sub_levels.catalog);
    makeLogger("shell",      sub_levels.shell);

    initialized_ = true;
    get("stitchsync")->debug("[LogRegistry] Initialized, writing to {}", main_log_path_.string());
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

void Registry::shutdown() {
    if (!initialized_) return;
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& lg) { lg->flush(); });
    spdlog::drop_all();
    console_sink_.reset();
    main_file_sink_.reset();
    initialized_ = false;
}

}
