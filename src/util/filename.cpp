#include "util/filename.hpp"

#include <cctype>

namespace ss::util {

namespace {

bool isAsciiAlnum(const unsigned char c) {
    return c < 0x80 && std::isalnum(c);
}

}

std::string sanitize(const std::string& name, const bool enabled) {
    if (!enabled) return name;

    const auto dot = name.rfind('.');
    const bool hasExt = dot != std::string::npos && dot != 0;
    const std::string stem = hasExt ? name.substr(0, dot) : name;
    const std::string ext = hasExt ? name.substr(dot) : std::string{};

    std::string out;
    out.reserve(stem.size());
    bool pendingDash = false;
    for (const unsigned char c : stem) {
        if (isAsciiAlnum(c) || c >= 0x80) {
            if (pendingDash && !out.empty()) out.push_back('-');
            pendingDash = false;
            out.push_back(static_cast<char>(c));
        } else {
            pendingDash = true;
        }
    }

    if (out.empty()) out = "output";
    return out + ext;
}

std::string extensionOf(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    if (!ext.empty() && ext.front() == '.') ext.erase(ext.begin());
    for (auto& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return ext;
}

bool isHidden(const std::filesystem::path& path) {
    const auto name = path.filename().string();
    return !name.empty() && name.front() == '.';
}

}
