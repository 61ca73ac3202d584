#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace ss::policy {

// Session inputs after CLI > config file > default precedence has been applied.
struct Settings {
    std::filesystem::path watch_dir;
    std::optional<std::string> machine;
    std::optional<std::string> output_format;
};

}
