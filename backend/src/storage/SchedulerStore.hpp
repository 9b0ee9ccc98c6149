#pragma once
#include <string>
#include <vector>
#include <ctime>
#include <optional>
#include <stdexcept>
#include "../core/Item.hpp"

// Retrieval or persistence failed. Fatal for the scheduling request that hit it.
class BackendError : public std::runtime_error {
public:
    explicit BackendError(const std::string& what) : std::runtime_error(what) {}
};

/*
  Data access used by the scheduling core. Implementations report failures by
  throwing BackendError; they do not retry. Returned maps are keyed by item id,
  so callers never depend on the order results were produced in.
*/
class SchedulerStore {
public:
    virtual ~SchedulerStore() = default;

    // Items of the goal that are due or new for this user, with memory merged in.
    virtual std::vector<CandidateItem> fetchCandidates(const std::string& goalId,
                                                       const std::string& userId,
                                                       std::time_t now) = 0;

    // child id -> prerequisite parent ids; other edge kinds are excluded.
    virtual ParentMap fetchPrerequisiteParents(const std::vector<std::string>& itemIds) = 0;

    // Ids without a memory entry are simply absent (energy 0.0).
    virtual EnergyMap fetchEnergies(const std::string& userId,
                                    const std::vector<std::string>& itemIds) = 0;

    virtual std::optional<Goal> fetchGoal(const std::string& goalId) = 0;

    virtual std::vector<BanditArmState> fetchBanditArms(const std::string& userId,
                                                        const std::string& goalGroup) = 0;

    // Idempotent insert-or-replace keyed by (user, goal group, profile).
    virtual void upsertBanditArm(const std::string& userId, const std::string& goalGroup,
                                 ProfileName profile, double successes, double failures) = 0;
};
