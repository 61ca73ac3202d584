#pragma once

#include <optional>
#include <string>

namespace ss::catalog {

inline constexpr auto DEFAULT_FORMAT = "dst";

struct Format {
    std::string code;          // lower-case extension without dot, e.g. "dst", "jef+"
    std::string label;
    std::string manufacturer;
    std::optional<std::string> note;
};

std::string to_string(const Format& f);

}
