#pragma once
#include <vector>
#include <string>
#include <cstddef>
#include <ctime>
#include "Item.hpp"
#include "Profile.hpp"
#include "SchedulerConfig.hpp"
#include "PrerequisiteGate.hpp"
#include "SessionComposer.hpp"
#include "BanditOptimizer.hpp"
#include "../storage/SchedulerStore.hpp"

struct PersonalizedSession {
    std::vector<std::string> item_ids;
    std::string goal_group;
    ProfileName chosen = ProfileName::Balanced;
    Profile weights;
    bool personalized = false;
};

/*
  Session generation pipeline:

    fetchCandidates -> mode filter -> fetch parents -> fetch parent energies
    -> prerequisite gate -> score and rank -> compose

  Holds no mutable state; one Scheduler may serve any number of concurrent
  requests as long as the store is thread safe. BackendError from the store
  propagates to the caller. A goal with no candidates yields an empty session.
*/
class Scheduler {
public:
    explicit Scheduler(SchedulerStore& store, const SchedulerConfig& config = SchedulerConfig{});

    std::vector<std::string> generateSession(const std::string& userId, const std::string& goalId,
                                             const Profile& profile, std::size_t sessionSize,
                                             std::time_t now, SessionMode mode) const;

    // Same pipeline with the profile picked by the optimizer for the goal's group.
    PersonalizedSession generatePersonalizedSession(const std::string& userId,
                                                    const std::string& goalId,
                                                    BanditOptimizer& optimizer,
                                                    std::size_t sessionSize,
                                                    std::time_t now, SessionMode mode) const;

    static double rewardSession(const SessionResult& result);

    // "default" when the goal is unknown
    std::string goalGroupOf(const std::string& goalId) const;

    const SchedulerConfig& config() const { return cfg; }

private:
    SchedulerStore& store;
    SchedulerConfig cfg;
    PrerequisiteGate gate;
    SessionComposer composer;
};
