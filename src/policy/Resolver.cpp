#include "policy/Resolver.hpp"
#include "catalog/Registry.hpp"
#include "util/similarity.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <fmt/format.h>
#include <algorithm>
#include <map>

namespace ss::policy {

UnknownMachineError::UnknownMachineError(std::string requested, std::vector<std::string> suggestions)
    : std::runtime_error(suggestions.empty()
          ? fmt::format("Machine '{}' not found", requested)
          : fmt::format("Machine '{}' not found. Did you mean: {}?", requested, fmt::join(suggestions, ", "))),
      requested_(std::move(requested)),
      suggestions_(std::move(suggestions)) {}

UnknownFormatError::UnknownFormatError(std::string requested)
    : std::runtime_error(fmt::format("Unknown output format '{}'. Run 'stitch-sync formats' for the list.", requested)),
      requested_(std::move(requested)) {}

bool ResolvedPolicy::accepts(const std::string& code) const {
    return std::ranges::find(accepted, code) != accepted.end();
}

Resolver::Resolver(std::shared_ptr<const catalog::Registry> registry)
    : registry_(std::move(registry)) {
    if (!registry_) throw std::invalid_argument("Resolver requires a catalog registry");
}

MachineMatch Resolver::matchMachine(const std::string& name) const {
    MachineMatch match;

    if (const auto* exact = registry_->findMachine(name)) {
        match.profile = exact;
        match.score = 1.0;
        return match;
    }

    const auto query = catalog::Registry::normalizeName(name);
    if (query.empty()) return match;

    // best score per profile, keyed by display name so suggestions stay unique
    std::map<std::string, std::pair<double, const catalog::MachineProfile*>> best;
    for (const auto& [candidate, profile] : registry_->machineNames()) {
        const double score = util::jaroWinkler(query, catalog::Registry::normalizeName(candidate));
        auto& slot = best[profile->name];
        if (score > slot.first) slot = {score, profile};
    }

    std::vector<std::pair<double, const catalog::MachineProfile*>> ranked;
    ranked.reserve(best.size());
    for (const auto& [_, entry] : best) ranked.push_back(entry);
    std::ranges::stable_sort(ranked, [](const auto& a, const auto& b) { return a.first > b.first; });

    if (!ranked.empty() && ranked.front().first >= MATCH_THRESHOLD) {
        match.profile = ranked.front().second;
        match.score = ranked.front().first;
        log::Registry::stitchsync()->debug("[Resolver] '{}' matched '{}' (score {:.2f})",
                                           name, match.profile->name, match.score);
        return match;
    }

    for (const auto& [score, profile] : ranked) {
        if (score < SUGGESTION_THRESHOLD || match.suggestions.size() >= MAX_SUGGESTIONS) break;
        match.suggestions.push_back(profile->name);
    }
    return match;
}

const catalog::MachineProfile& Resolver::findMachine(const std::string& name) const {
    auto match = matchMachine(name);
    if (!match.profile) throw UnknownMachineError(name, std::move(match.suggestions));
    return *match.profile;
}

ResolvedPolicy Resolver::resolve(const Settings& settings) const {
    ResolvedPolicy policy;

    std::optional<std::string> explicitFormat;
    if (settings.output_format && !settings.output_format->empty()) {
        const auto* format = registry_->findFormat(*settings.output_format);
        if (!format) throw UnknownFormatError(*settings.output_format);
        explicitFormat = format->code;
    }

    if (settings.machine && !settings.machine->empty()) {
        const auto& profile = findMachine(*settings.machine);
        policy.machine = profile;
        policy.accepted = profile.formats;
    }

    if (policy.accepted.empty())
        policy.accepted = {explicitFormat && !policy.machine ? *explicitFormat : std::string(catalog::DEFAULT_FORMAT)};

    policy.preferred = explicitFormat.value_or(policy.accepted.front());

    log::Registry::stitchsync()->debug("[Resolver] accepted=[{}] preferred={} machine={}",
                                       fmt::join(policy.accepted, ", "), policy.preferred,
                                       policy.machine ? policy.machine->name : "none");
    return policy;
}

}
