#include "util/similarity.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace ss::util {

double jaro(const std::string_view a, const std::string_view b) {
    if (a.empty() && b.empty()) return 1.0;
    if (a.empty() || b.empty()) return 0.0;

    const auto window = std::max<size_t>(std::max(a.size(), b.size()) / 2, 1) - 1;

    std::vector<bool> aMatched(a.size(), false), bMatched(b.size(), false);
    size_t matches = 0;

    for (size_t i = 0; i < a.size(); ++i) {
        const size_t lo = i > window ? i - window : 0;
        const size_t hi = std::min(i + window + 1, b.size());
        for (size_t j = lo; j < hi; ++j) {
            if (bMatched[j] || a[i] != b[j]) continue;
            aMatched[i] = bMatched[j] = true;
            ++matches;
            break;
        }
    }

    if (matches == 0) return 0.0;

    size_t transpositions = 0;
    for (size_t i = 0, j = 0; i < a.size(); ++i) {
        if (!aMatched[i]) continue;
        while (!bMatched[j]) ++j;
        if (a[i] != b[j]) ++transpositions;
        ++j;
    }

    const auto m = static_cast<double>(matches);
    return (m / static_cast<double>(a.size()) +
            m / static_cast<double>(b.size()) +
            (m - static_cast<double>(transpositions) / 2.0) / m) / 3.0;
}

double jaroWinkler(const std::string_view a, const std::string_view b, const double prefixScale) {
    const double j = jaro(a, b);

    size_t prefix = 0;
    const size_t limit = std::min<size_t>({a.size(), b.size(), 4});
    while (prefix < limit && a[prefix] == b[prefix]) ++prefix;

    return j + static_cast<double>(prefix) * prefixScale * (1.0 - j);
}

std::string toLower(const std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

}
