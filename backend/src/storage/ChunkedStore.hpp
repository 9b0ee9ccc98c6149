#pragma once
#include <cstddef>
#include "SchedulerStore.hpp"

// Split ids into consecutive batches of at most chunkSize (chunkSize 0 is treated as 1).
std::vector<std::vector<std::string>> chunkIds(const std::vector<std::string>& ids,
                                               std::size_t chunkSize);

/*
  Decorator that respects backend parameter limits: id-list lookups are split
  into batches of chunk_size and merged by item id, so the order batches
  complete in does not matter. At most max_inflight batches run at once, each
  worker taking the next unclaimed batch. The wrapped store must be safe to
  call from several threads. A failing batch fails the whole lookup.
*/
class ChunkedStore : public SchedulerStore {
public:
    ChunkedStore(SchedulerStore& inner, std::size_t chunkSize, std::size_t maxInflight = 8);

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

    std::size_t chunkSize() const { return chunk_size; }
    std::size_t maxInflight() const { return max_inflight; }

private:
    SchedulerStore& inner;
    std::size_t chunk_size;
    std::size_t max_inflight;
};
