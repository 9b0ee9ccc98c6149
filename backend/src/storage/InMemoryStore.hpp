#pragma once
#include <map>
#include <mutex>
#include <tuple>
#include <string>
#include <vector>
#include <unordered_map>
#include "SchedulerStore.hpp"

struct MemoryRecord {
    std::string item_id;
    double energy = 0.0;
    std::time_t next_due = 0;
};

struct ArmRecord {
    std::string goal_group;
    BanditArmState arm;
};

// Everything persisted per learner.
struct LearnerState {
    std::vector<MemoryRecord> memory;
    std::vector<ArmRecord> arms;
};

/*
  Map-backed SchedulerStore. All operations lock a single mutex, so one
  instance can serve concurrent scheduling passes and arm upserts.
*/
class InMemoryStore : public SchedulerStore {
public:
    InMemoryStore() = default;

    // Catalog
    void addItem(const CandidateItem& item);
    void addEdge(const PrerequisiteEdge& edge);
    void addGoal(const Goal& goal);
    std::size_t itemCount() const;

    // Learner memory
    void setMemory(const std::string& userId, const std::string& itemId,
                   double energy, std::time_t nextDue);
    LearnerState exportLearner(const std::string& userId) const;
    void importLearner(const std::string& userId, const LearnerState& state);

    std::vector<CandidateItem> fetchCandidates(const std::string& goalId,
                                               const std::string& userId,
                                               std::time_t now) override;
    ParentMap fetchPrerequisiteParents(const std::vector<std::string>& itemIds) override;
    EnergyMap fetchEnergies(const std::string& userId,
                            const std::vector<std::string>& itemIds) override;
    std::optional<Goal> fetchGoal(const std::string& goalId) override;
    std::vector<BanditArmState> fetchBanditArms(const std::string& userId,
                                                const std::string& goalGroup) override;
    void upsertBanditArm(const std::string& userId, const std::string& goalGroup,
                         ProfileName profile, double successes, double failures) override;

private:
    struct MemoryState {
        double energy = 0.0;
        std::time_t next_due = 0;
    };
    using ArmKey = std::tuple<std::string, std::string, std::string>;

    mutable std::mutex mtx;
    std::unordered_map<std::string, CandidateItem> items;
    std::unordered_map<std::string, std::vector<std::string>> parents_by_child;
    std::unordered_map<std::string, Goal> goals;
    std::unordered_map<std::string, std::unordered_map<std::string, MemoryState>> memory;
    std::map<ArmKey, BanditArmState> arms;
};
