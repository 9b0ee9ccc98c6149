#pragma once
#include <vector>
#include <string>
#include "Item.hpp"
#include "SchedulerConfig.hpp"

struct GatedItem {
    EnrichedItem node;
    double readiness = 1.0;
};

/*
  Prerequisite mastery gate.

  An item is eligible only when every prerequisite parent has energy >=
  mastery_threshold. Parents missing from the energy map count as 0.0.
  The gate is evaluated once per scheduling pass against the energies that
  were fetched; items picked in the same pass never unlock their children.
*/
class PrerequisiteGate {
public:
    explicit PrerequisiteGate(const SchedulerConfig& config = SchedulerConfig{});

    std::vector<GatedItem> apply(const std::vector<EnrichedItem>& items,
                                 const EnergyMap& parentEnergies) const;

    std::vector<std::string> unsatisfiedParents(const std::vector<std::string>& parentIds,
                                                const EnergyMap& parentEnergies) const;

    // 1.0 with no parents, otherwise mean parent energy
    static double readiness(const std::vector<std::string>& parentIds,
                            const EnergyMap& parentEnergies);

    double threshold() const { return mastery_threshold; }

private:
    double mastery_threshold;

    static double energyOf(const std::string& id, const EnergyMap& energies);
};

// Join candidates with their prerequisite parents; items without an entry get none.
std::vector<EnrichedItem> enrichCandidates(const std::vector<CandidateItem>& candidates,
                                           const ParentMap& parents);
