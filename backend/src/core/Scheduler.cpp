#include "Scheduler.hpp"
#include <algorithm>
#include <unordered_set>
#include <spdlog/spdlog.h>
#include "ScoringEngine.hpp"

static const char* DEFAULT_GOAL_GROUP = "default";

Scheduler::Scheduler(SchedulerStore& s, const SchedulerConfig& config)
    : store(s), cfg(config), gate(config), composer(config)
{
    cfg.validate();
    spdlog::info("Scheduler initialized (threshold={:.2f}, head slice x{})",
        cfg.mastery_threshold, cfg.head_slice_factor);
}

/*
  Parent energies are fetched once per pass. Nothing selected during the
  pass changes them, so an item and its dependent child are never unlocked
  together.
*/
std::vector<std::string> Scheduler::generateSession(const std::string& userId,
                                                    const std::string& goalId,
                                                    const Profile& profile,
                                                    std::size_t sessionSize,
                                                    std::time_t now,
                                                    SessionMode mode) const
{
    if (sessionSize == 0) return {};

    std::vector<CandidateItem> fetched = store.fetchCandidates(goalId, userId, now);

    std::vector<CandidateItem> candidates;
    candidates.reserve(fetched.size());
    std::unordered_set<std::string> fetchedIds;
    for (auto& c : fetched) {
        if (!fetchedIds.insert(c.id).second) {
            spdlog::debug("Duplicate candidate '{}' dropped", c.id);
            continue;
        }
        c.sanitize();
        if (SessionComposer::admits(c, mode, now)) candidates.push_back(c);
    }

    if (candidates.empty()) {
        spdlog::info("No {} candidates for user '{}' goal '{}'", toString(mode), userId, goalId);
        return {};
    }

    std::vector<std::string> ids;
    ids.reserve(candidates.size());
    for (const auto& c : candidates) ids.push_back(c.id);

    ParentMap parents = store.fetchPrerequisiteParents(ids);

    std::vector<std::string> parentIds;
    std::unordered_set<std::string> seen;
    for (const auto& p : parents) {
        for (const auto& parent : p.second) {
            if (seen.insert(parent).second) parentIds.push_back(parent);
        }
    }
    std::sort(parentIds.begin(), parentIds.end());

    EnergyMap parentEnergies;
    if (!parentIds.empty()) parentEnergies = store.fetchEnergies(userId, parentIds);

    std::vector<GatedItem> eligible = gate.apply(enrichCandidates(candidates, parents), parentEnergies);

    ScoringEngine engine(profile);
    std::vector<ScoredItem> ranked = engine.rank(eligible, now);

    Composition composition = composer.compose(ranked, sessionSize, mode);

    spdlog::info("Session for '{}' goal '{}' ({}): {} candidates, {} eligible, {} selected, {} backfilled",
        userId, goalId, toString(mode), candidates.size(), eligible.size(),
        composition.item_ids.size(), composition.backfilled);
    return composition.item_ids;
}

std::string Scheduler::goalGroupOf(const std::string& goalId) const {
    std::optional<Goal> goal = store.fetchGoal(goalId);
    if (!goal || goal->goal_group.empty()) return DEFAULT_GOAL_GROUP;
    return goal->goal_group;
}

PersonalizedSession Scheduler::generatePersonalizedSession(const std::string& userId,
                                                           const std::string& goalId,
                                                           BanditOptimizer& optimizer,
                                                           std::size_t sessionSize,
                                                           std::time_t now,
                                                           SessionMode mode) const
{
    PersonalizedSession session;
    session.goal_group = goalGroupOf(goalId);

    ProfileChoice choice = optimizer.selectProfile(userId, session.goal_group);
    session.chosen = choice.chosen;
    session.weights = choice.weights;
    session.personalized = choice.personalized;

    session.item_ids = generateSession(userId, goalId, choice.weights, sessionSize, now, mode);
    return session;
}

double Scheduler::rewardSession(const SessionResult& result) {
    return BanditOptimizer::reward(result);
}
