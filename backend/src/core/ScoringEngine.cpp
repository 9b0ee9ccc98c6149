#include "ScoringEngine.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

static constexpr double SECONDS_PER_DAY = 86400.0;

static double nonNegative(double w) {
    if (!std::isfinite(w) || w < 0.0) return 0.0;
    return w;
}

ScoringEngine::ScoringEngine(const Profile& p)
{
    profile.urgency = nonNegative(p.urgency);
    profile.readiness = nonNegative(p.readiness);
    profile.foundation = nonNegative(p.foundation);
    profile.influence = nonNegative(p.influence);

    spdlog::debug("ScoringEngine weights u={:.3f} r={:.3f} f={:.3f} i={:.3f}",
        profile.urgency, profile.readiness, profile.foundation, profile.influence);
}

double ScoringEngine::daysOverdue(std::time_t nextDue, std::time_t now) {
    if (nextDue <= 0 || nextDue >= now) return 0.0;

    double overdueSeconds = static_cast<double>(now - nextDue);
    return std::max(0.0, std::floor(overdueSeconds / SECONDS_PER_DAY));
}

ScoreBreakdown ScoringEngine::score(const CandidateItem& item, double readiness,
                                    double daysOverdue) const
{
    ScoreBreakdown s;
    s.days_overdue = std::max(0.0, daysOverdue);
    s.urgency_factor = 1.0 + profile.urgency * std::log(1.0 + s.days_overdue);
    s.learning_potential = profile.readiness * readiness
        + profile.foundation * item.foundational_score
        + profile.influence * item.influence_score;
    s.final_score = s.urgency_factor * s.learning_potential;
    // infinite urgency times zero potential
    if (std::isnan(s.final_score)) s.final_score = 0.0;
    return s;
}

bool ScoringEngine::ranksBefore(const ScoredItem& a, const ScoredItem& b) {
    if (a.score.final_score != b.score.final_score) {
        return a.score.final_score > b.score.final_score;
    }
    if (a.item().canonical_order != b.item().canonical_order) {
        return a.item().canonical_order < b.item().canonical_order;
    }
    return a.item().id < b.item().id;
}

std::vector<ScoredItem> ScoringEngine::rank(const std::vector<GatedItem>& eligible,
                                            std::time_t now) const
{
    std::vector<ScoredItem> ranked;
    ranked.reserve(eligible.size());

    for (const auto& g : eligible) {
        ScoredItem s;
        s.gated = g;
        s.score = score(g.node.item, g.readiness, daysOverdue(g.node.item.next_due, now));
        spdlog::debug("Score '{}': overdue={}d urgency={:.3f} potential={:.3f} final={:.4f}",
            g.node.item.id, s.score.days_overdue, s.score.urgency_factor,
            s.score.learning_potential, s.score.final_score);
        ranked.push_back(std::move(s));
    }

    std::sort(ranked.begin(), ranked.end(), &ScoringEngine::ranksBefore);
    return ranked;
}
