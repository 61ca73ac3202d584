#pragma once

#include <string>
#include <string_view>

namespace ss::util {

// Jaro similarity in [0, 1].
double jaro(std::string_view a, std::string_view b);

// Jaro-Winkler similarity in [0, 1], prefix bonus capped at four characters.
double jaroWinkler(std::string_view a, std::string_view b, double prefixScale = 0.1);

std::string toLower(std::string_view s);

}
