#include "PrerequisiteGate.hpp"
#include <spdlog/spdlog.h>

PrerequisiteGate::PrerequisiteGate(const SchedulerConfig& config)
    : mastery_threshold(config.mastery_threshold)
{
}

double PrerequisiteGate::energyOf(const std::string& id, const EnergyMap& energies) {
    auto it = energies.find(id);
    if (it == energies.end()) return 0.0;
    return clampUnit(it->second);
}

std::vector<std::string> PrerequisiteGate::unsatisfiedParents(
    const std::vector<std::string>& parentIds, const EnergyMap& parentEnergies) const
{
    std::vector<std::string> out;
    for (const auto& pid : parentIds) {
        if (energyOf(pid, parentEnergies) < mastery_threshold) {
            out.push_back(pid);
        }
    }
    return out;
}

double PrerequisiteGate::readiness(const std::vector<std::string>& parentIds,
                                   const EnergyMap& parentEnergies)
{
    if (parentIds.empty()) return 1.0;

    double sum = 0.0;
    for (const auto& pid : parentIds) {
        sum += energyOf(pid, parentEnergies);
    }
    return sum / static_cast<double>(parentIds.size());
}

std::vector<GatedItem> PrerequisiteGate::apply(const std::vector<EnrichedItem>& items,
                                               const EnergyMap& parentEnergies) const
{
    std::vector<GatedItem> eligible;
    eligible.reserve(items.size());

    std::size_t blocked = 0;
    for (const auto& node : items) {
        auto missing = unsatisfiedParents(node.parent_ids, parentEnergies);
        if (!missing.empty()) {
            ++blocked;
            spdlog::debug("Gate blocked '{}': {} unsatisfied parent(s), first='{}'",
                node.item.id, missing.size(), missing.front());
            continue;
        }

        GatedItem g;
        g.node = node;
        g.readiness = readiness(node.parent_ids, parentEnergies);
        eligible.push_back(std::move(g));
    }

    spdlog::debug("Gate: {} eligible, {} blocked (threshold={:.2f})",
        eligible.size(), blocked, mastery_threshold);
    return eligible;
}

std::vector<EnrichedItem> enrichCandidates(const std::vector<CandidateItem>& candidates,
                                           const ParentMap& parents)
{
    std::vector<EnrichedItem> out;
    out.reserve(candidates.size());

    for (const auto& c : candidates) {
        EnrichedItem e;
        e.item = c;
        auto it = parents.find(c.id);
        if (it != parents.end()) e.parent_ids = it->second;
        out.push_back(std::move(e));
    }
    return out;
}
