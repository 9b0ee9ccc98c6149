#include "ChunkedStore.hpp"
#include <algorithm>
#include <atomic>
#include <future>
#include <system_error>
#include <spdlog/spdlog.h>

std::vector<std::vector<std::string>> chunkIds(const std::vector<std::string>& ids,
                                               std::size_t chunkSize)
{
    std::size_t size = std::max<std::size_t>(1, chunkSize);
    std::vector<std::vector<std::string>> chunks;
    for (std::size_t i = 0; i < ids.size(); i += size) {
        auto end = std::min(ids.size(), i + size);
        chunks.emplace_back(ids.begin() + static_cast<std::ptrdiff_t>(i),
                            ids.begin() + static_cast<std::ptrdiff_t>(end));
    }
    return chunks;
}

/*
  Runs fetch over every chunk with at most maxInflight workers. Results are
  stored by chunk index. If no worker thread can be started the chunks are
  fetched on the calling thread.
*/
template <typename Result, typename Fetch>
static std::vector<Result> fetchBounded(const std::vector<std::vector<std::string>>& chunks,
                                        std::size_t maxInflight, Fetch fetch)
{
    std::vector<Result> results(chunks.size());
    std::atomic<std::size_t> next{ 0 };
    std::atomic<bool> failed{ false };

    auto worker = [&]() {
        for (std::size_t i = next++; i < chunks.size() && !failed; i = next++) {
            try {
                results[i] = fetch(chunks[i]);
            }
            catch (const std::exception&) {
                failed = true;
                throw;
            }
        }
    };

    // Declared last: destroying it joins every worker before the state above goes away.
    std::vector<std::future<void>> pending;
    std::size_t workers = std::min(maxInflight, chunks.size());
    for (std::size_t w = 0; w < workers; ++w) {
        try {
            pending.push_back(std::async(std::launch::async, worker));
        }
        catch (const std::system_error& e) {
            spdlog::warn("Started {} of {} lookup workers: {}", pending.size(), workers, e.what());
            break;
        }
    }

    if (pending.empty()) worker();
    for (auto& f : pending) f.get();
    return results;
}

ChunkedStore::ChunkedStore(SchedulerStore& innerStore, std::size_t chunkSize, std::size_t maxInflight)
    : inner(innerStore),
      chunk_size(std::max<std::size_t>(1, chunkSize)),
      max_inflight(std::max<std::size_t>(1, maxInflight))
{
}

std::vector<CandidateItem> ChunkedStore::fetchCandidates(const std::string& goalId,
                                                         const std::string& userId,
                                                         std::time_t now)
{
    return inner.fetchCandidates(goalId, userId, now);
}

ParentMap ChunkedStore::fetchPrerequisiteParents(const std::vector<std::string>& itemIds) {
    auto chunks = chunkIds(itemIds, chunk_size);
    if (chunks.size() <= 1) return inner.fetchPrerequisiteParents(itemIds);

    auto parts = fetchBounded<ParentMap>(chunks, max_inflight,
        [this](const std::vector<std::string>& chunk) { return inner.fetchPrerequisiteParents(chunk); });

    ParentMap merged;
    for (auto& part : parts) {
        for (auto& p : part) merged[p.first] = std::move(p.second);
    }

    spdlog::debug("Parent lookup: {} ids in {} chunks, {} with parents",
        itemIds.size(), chunks.size(), merged.size());
    return merged;
}

EnergyMap ChunkedStore::fetchEnergies(const std::string& userId,
                                      const std::vector<std::string>& itemIds)
{
    auto chunks = chunkIds(itemIds, chunk_size);
    if (chunks.size() <= 1) return inner.fetchEnergies(userId, itemIds);

    auto parts = fetchBounded<EnergyMap>(chunks, max_inflight,
        [this, &userId](const std::vector<std::string>& chunk) { return inner.fetchEnergies(userId, chunk); });

    EnergyMap merged;
    for (const auto& part : parts) merged.insert(part.begin(), part.end());

    spdlog::debug("Energy lookup: {} ids in {} chunks, {} found",
        itemIds.size(), chunks.size(), merged.size());
    return merged;
}

std::optional<Goal> ChunkedStore::fetchGoal(const std::string& goalId) {
    return inner.fetchGoal(goalId);
}

std::vector<BanditArmState> ChunkedStore::fetchBanditArms(const std::string& userId,
                                                          const std::string& goalGroup)
{
    return inner.fetchBanditArms(userId, goalGroup);
}

void ChunkedStore::upsertBanditArm(const std::string& userId, const std::string& goalGroup,
                                   ProfileName profile, double successes, double failures)
{
    inner.upsertBanditArm(userId, goalGroup, profile, successes, failures);
}
