#pragma once
#include <vector>
#include <ctime>
#include "Item.hpp"
#include "Profile.hpp"
#include "PrerequisiteGate.hpp"

struct ScoreBreakdown {
    double days_overdue = 0.0;
    double urgency_factor = 1.0;
    double learning_potential = 0.0;
    double final_score = 0.0;
};

struct ScoredItem {
    GatedItem gated;
    ScoreBreakdown score;

    const CandidateItem& item() const { return gated.node.item; }
};

/*
  Priority scoring:

    urgency_factor     = 1 + w.urgency * ln(1 + days_overdue)
    learning_potential = w.readiness * readiness
                       + w.foundation * foundational_score
                       + w.influence  * influence_score
    final_score        = urgency_factor * learning_potential

  rank() orders by final_score descending, then canonical_order ascending,
  then id. The order is fully deterministic for identical inputs.
*/
class ScoringEngine {
public:
    explicit ScoringEngine(const Profile& profile);

    // Whole days past due; 0 when not scheduled or not yet due.
    static double daysOverdue(std::time_t nextDue, std::time_t now);

    ScoreBreakdown score(const CandidateItem& item, double readiness, double daysOverdue) const;

    std::vector<ScoredItem> rank(const std::vector<GatedItem>& eligible, std::time_t now) const;

    static bool ranksBefore(const ScoredItem& a, const ScoredItem& b);

    const Profile& weights() const { return profile; }

private:
    Profile profile;
};
