#include "InMemoryStore.hpp"
#include <algorithm>
#include <unordered_set>
#include <spdlog/spdlog.h>

void InMemoryStore::addItem(const CandidateItem& item) {
    std::lock_guard<std::mutex> lock(mtx);
    CandidateItem copy = item;
    copy.sanitize();
    items[copy.id] = copy;
}

void InMemoryStore::addEdge(const PrerequisiteEdge& edge) {
    if (edge.kind != EdgeKind::Prerequisite) {
        spdlog::debug("Edge {} -> {} is not a prerequisite; ignored", edge.parent, edge.child);
        return;
    }
    if (edge.parent == edge.child) {
        spdlog::warn("Self edge on '{}' ignored", edge.child);
        return;
    }

    std::lock_guard<std::mutex> lock(mtx);
    auto& ps = parents_by_child[edge.child];
    if (std::find(ps.begin(), ps.end(), edge.parent) == ps.end()) {
        ps.push_back(edge.parent);
    }
}

void InMemoryStore::addGoal(const Goal& goal) {
    std::lock_guard<std::mutex> lock(mtx);
    goals[goal.id] = goal;
}

std::size_t InMemoryStore::itemCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return items.size();
}

void InMemoryStore::setMemory(const std::string& userId, const std::string& itemId,
                              double energy, std::time_t nextDue)
{
    std::lock_guard<std::mutex> lock(mtx);
    MemoryState& m = memory[userId][itemId];
    m.energy = clampUnit(energy);
    m.next_due = std::max<std::time_t>(0, nextDue);
}

LearnerState InMemoryStore::exportLearner(const std::string& userId) const {
    std::lock_guard<std::mutex> lock(mtx);
    LearnerState state;

    auto mit = memory.find(userId);
    if (mit != memory.end()) {
        for (const auto& p : mit->second) {
            state.memory.push_back(MemoryRecord{ p.first, p.second.energy, p.second.next_due });
        }
        std::sort(state.memory.begin(), state.memory.end(),
            [](const MemoryRecord& a, const MemoryRecord& b) { return a.item_id < b.item_id; });
    }

    for (const auto& p : arms) {
        if (std::get<0>(p.first) != userId) continue;
        state.arms.push_back(ArmRecord{ std::get<1>(p.first), p.second });
    }
    return state;
}

void InMemoryStore::importLearner(const std::string& userId, const LearnerState& state) {
    std::lock_guard<std::mutex> lock(mtx);

    auto& mem = memory[userId];
    for (const auto& r : state.memory) {
        mem[r.item_id] = MemoryState{ clampUnit(r.energy), std::max<std::time_t>(0, r.next_due) };
    }
    for (const auto& a : state.arms) {
        arms[ArmKey(userId, a.goal_group, toString(a.arm.profile))] = a.arm;
    }
    spdlog::info("Imported learner '{}': {} memory rows, {} arms",
        userId, state.memory.size(), state.arms.size());
}

std::vector<CandidateItem> InMemoryStore::fetchCandidates(const std::string& goalId,
                                                          const std::string& userId,
                                                          std::time_t now)
{
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<CandidateItem> out;

    auto git = goals.find(goalId);
    if (git == goals.end()) {
        spdlog::info("Goal '{}' not found; no candidates", goalId);
        return out;
    }

    const std::unordered_map<std::string, MemoryState>* userMem = nullptr;
    auto uit = memory.find(userId);
    if (uit != memory.end()) userMem = &uit->second;

    std::unordered_set<std::string> seen;
    const auto& ids = git->second.item_ids;
    for (std::size_t i = 0; i < ids.size(); ++i) {
        const std::string& id = ids[i];
        if (!seen.insert(id).second) continue;

        CandidateItem c;
        auto it = items.find(id);
        if (it != items.end()) {
            c = it->second;
        }
        else {
            // no metadata: scores stay 0.0, order falls back to goal position
            spdlog::warn("Item '{}' of goal '{}' has no catalog metadata", id, goalId);
            c.id = id;
            c.canonical_order = static_cast<long long>(i);
        }

        if (userMem) {
            auto m = userMem->find(id);
            if (m != userMem->end()) {
                c.mastery_energy = m->second.energy;
                c.next_due = m->second.next_due;
            }
        }
        c.sanitize();

        if (c.isDue(now) || c.isNew()) out.push_back(c);
    }

    spdlog::debug("fetchCandidates goal='{}' user='{}': {} of {} due or new",
        goalId, userId, out.size(), ids.size());
    return out;
}

ParentMap InMemoryStore::fetchPrerequisiteParents(const std::vector<std::string>& itemIds) {
    std::lock_guard<std::mutex> lock(mtx);
    ParentMap out;
    for (const auto& id : itemIds) {
        auto it = parents_by_child.find(id);
        if (it != parents_by_child.end()) out[id] = it->second;
    }
    return out;
}

EnergyMap InMemoryStore::fetchEnergies(const std::string& userId,
                                       const std::vector<std::string>& itemIds)
{
    std::lock_guard<std::mutex> lock(mtx);
    EnergyMap out;

    auto uit = memory.find(userId);
    if (uit == memory.end()) return out;

    for (const auto& id : itemIds) {
        auto m = uit->second.find(id);
        if (m != uit->second.end()) out[id] = m->second.energy;
    }
    return out;
}

std::optional<Goal> InMemoryStore::fetchGoal(const std::string& goalId) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = goals.find(goalId);
    if (it == goals.end()) return std::nullopt;
    return it->second;
}

std::vector<BanditArmState> InMemoryStore::fetchBanditArms(const std::string& userId,
                                                           const std::string& goalGroup)
{
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<BanditArmState> out;
    for (const auto& p : arms) {
        if (std::get<0>(p.first) == userId && std::get<1>(p.first) == goalGroup) {
            out.push_back(p.second);
        }
    }
    return out;
}

void InMemoryStore::upsertBanditArm(const std::string& userId, const std::string& goalGroup,
                                    ProfileName profile, double successes, double failures)
{
    std::lock_guard<std::mutex> lock(mtx);
    BanditArmState& arm = arms[ArmKey(userId, goalGroup, toString(profile))];
    arm.profile = profile;
    arm.successes = successes;
    arm.failures = failures;
}
