#pragma once

#include <string>
#include <vector>

namespace ss::util {

// Quotes one argument so that CommandLineToArgvW (and the MSVC runtime) hands it back unchanged.
std::string quoteWindowsArgument(const std::string& arg);

// argv joined into the single command line CreateProcessW takes.
std::string buildWindowsCommandLine(const std::vector<std::string>& argv);

}
