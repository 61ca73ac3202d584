#include "util/commandLine.hpp"

namespace ss::util {

std::string quoteWindowsArgument(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\n\v\"") == std::string::npos) return arg;

    std::string out = "\"";
    for (auto it = arg.begin();; ++it) {
        size_t backslashes = 0;
        while (it != arg.end() && *it == '\\') {
            ++it;
            ++backslashes;
        }

        if (it == arg.end()) {
            // Doubled so the closing quote stays a quote
            out.append(backslashes * 2, '\\');
            break;
        }

        if (*it == '"') {
            out.append(backslashes * 2 + 1, '\\');
            out.push_back('"');
        } else {
            out.append(backslashes, '\\');
            out.push_back(*it);
        }
    }
    out.push_back('"');
    return out;
}

std::string buildWindowsCommandLine(const std::vector<std::string>& argv) {
    std::string line;
    for (const auto& a : argv) {
        if (!line.empty()) line.push_back(' ');
        line += quoteWindowsArgument(a);
    }
    return line;
}

}
