#pragma once

#include "policy/Settings.hpp"
#include "policy/ResolvedPolicy.hpp"
#include "policy/errors.hpp"

#include <memory>
#include <string>
#include <vector>

namespace ss::catalog {
class Registry;
struct MachineProfile;
}

namespace ss::policy {

struct MachineMatch {
    const catalog::MachineProfile* profile = nullptr;
    double score = 0.0;
    std::vector<std::string> suggestions;   // nearest names, best first
};

class Resolver {
public:
    static constexpr double MATCH_THRESHOLD = 0.85;
    static constexpr double SUGGESTION_THRESHOLD = 0.6;
    static constexpr size_t MAX_SUGGESTIONS = 3;

    explicit Resolver(std::shared_ptr<const catalog::Registry> registry);

    // Throws UnknownMachineError / UnknownFormatError.
    [[nodiscard]] ResolvedPolicy resolve(const Settings& settings) const;

    // Case-insensitive, typo-tolerant lookup. profile is null when nothing clears the threshold.
    [[nodiscard]] MachineMatch matchMachine(const std::string& name) const;

    [[nodiscard]] const catalog::MachineProfile& findMachine(const std::string& name) const;

private:
    std::shared_ptr<const catalog::Registry> registry_;
};

}
