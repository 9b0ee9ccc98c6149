#include "TestSupport.hpp"
#include "../src/storage/ChunkedStore.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

namespace {

// Later chunks answer first; the chunk containing "bad" fails.
class SlowStore : public InMemoryStore {
public:
    std::mutex calls_mtx;
    std::vector<std::size_t> call_sizes;

    ParentMap fetchPrerequisiteParents(const std::vector<std::string>& itemIds) override {
        record(itemIds);
        delayFor(itemIds);
        return InMemoryStore::fetchPrerequisiteParents(itemIds);
    }

    EnergyMap fetchEnergies(const std::string& userId,
                            const std::vector<std::string>& itemIds) override
    {
        record(itemIds);
        delayFor(itemIds);
        return InMemoryStore::fetchEnergies(userId, itemIds);
    }

private:
    void record(const std::vector<std::string>& ids) {
        std::lock_guard<std::mutex> lock(calls_mtx);
        call_sizes.push_back(ids.size());
    }

    static void delayFor(const std::vector<std::string>& ids) {
        for (const auto& id : ids) {
            if (id == "bad") throw BackendError("parameter limit exceeded");
        }
        // ids are "p<n>"; smaller n sleeps longer
        int n = ids.empty() ? 0 : std::stoi(ids.front().substr(1));
        std::this_thread::sleep_for(std::chrono::milliseconds(std::max(0, 40 - n)));
    }
};

// Holds every call open briefly and records how many overlap.
class CountingStore : public InMemoryStore {
public:
    std::atomic<int> active{ 0 };
    std::atomic<int> peak{ 0 };
    std::atomic<int> calls{ 0 };

    EnergyMap fetchEnergies(const std::string& userId,
                            const std::vector<std::string>& itemIds) override
    {
        int now = ++active;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
        ++calls;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        EnergyMap result = InMemoryStore::fetchEnergies(userId, itemIds);
        --active;
        return result;
    }
};

void chunkIdsSplitsInOrder(TestSuite& suite) {
    std::vector<std::string> ids = { "a", "b", "c", "d", "e" };

    auto chunks = chunkIds(ids, 2);
    suite.require(chunks.size() == 3, "Five ids in chunks of two make three chunks");
    suite.require(chunks[0] == std::vector<std::string>({ "a", "b" }), "First chunk");
    suite.require(chunks[2] == std::vector<std::string>({ "e" }), "Last chunk holds the remainder");

    suite.require(chunkIds({}, 3).empty(), "No ids, no chunks");
    suite.require(chunkIds(ids, 0).size() == 5, "Chunk size 0 behaves as 1");
    suite.require(chunkIds(ids, 500).size() == 1, "Large chunk size keeps one chunk");
}

void lookupsReassembleById(TestSuite& suite) {
    SlowStore inner;
    std::vector<std::string> ids;
    for (int i = 0; i < 40; ++i) {
        std::string id = "p" + std::to_string(i);
        ids.push_back(id);
        inner.setMemory("u1", id, 0.01 * i, NOW - DAY);
        if (i > 0) {
            PrerequisiteEdge e;
            e.parent = "p" + std::to_string(i - 1);
            e.child = id;
            inner.addEdge(e);
        }
    }

    ChunkedStore chunked(inner, 7);
    suite.require(chunked.chunkSize() == 7, "Chunk size is kept");

    EnergyMap energies = chunked.fetchEnergies("u1", ids);
    suite.require(energies.size() == 40, "Every energy arrives");
    bool allMatch = true;
    for (int i = 0; i < 40; ++i) {
        auto it = energies.find("p" + std::to_string(i));
        if (it == energies.end() || !near(it->second, 0.01 * i)) allMatch = false;
    }
    suite.require(allMatch, "Energies are keyed by id regardless of completion order");

    ParentMap parents = chunked.fetchPrerequisiteParents(ids);
    suite.require(parents.size() == 39, "Every child with a parent is present");
    suite.require(parents["p10"] == std::vector<std::string>({ "p9" }), "Parent lists survive the merge");

    std::size_t largest = 0;
    for (std::size_t n : inner.call_sizes) largest = std::max(largest, n);
    suite.require(largest <= 7, "No backend call exceeds the chunk size");
}

void inflightBatchesAreCapped(TestSuite& suite) {
    CountingStore inner;
    std::vector<std::string> ids;
    for (int i = 0; i < 200; ++i) {
        std::string id = "p" + std::to_string(i);
        ids.push_back(id);
        inner.setMemory("u1", id, 0.5, NOW);
    }

    ChunkedStore chunked(inner, 4, 3);
    suite.require(chunked.maxInflight() == 3, "In-flight cap is kept");

    EnergyMap energies = chunked.fetchEnergies("u1", ids);
    suite.require(energies.size() == 200, "Every energy arrives under the cap");
    suite.require(inner.calls == 50, "One backend call per chunk");
    suite.require(inner.peak >= 1 && inner.peak <= 3, "No more than three batches run at once");

    CountingStore serial;
    ChunkedStore single(serial, 2, 0);
    single.fetchEnergies("u1", { "a", "b", "c", "d", "e" });
    suite.require(single.maxInflight() == 1 && serial.peak == 1, "Cap 0 behaves as 1");
}

void failingChunkFailsLookup(TestSuite& suite) {
    SlowStore inner;
    ChunkedStore chunked(inner, 2);

    bool threw = false;
    try {
        chunked.fetchEnergies("u1", { "p1", "p2", "p3", "bad" });
    }
    catch (const BackendError&) {
        threw = true;
    }
    suite.require(threw, "A failing chunk fails the whole lookup");
}

void otherCallsPassThrough(TestSuite& suite) {
    InMemoryStore inner;
    Goal g;
    g.id = "goal";
    g.goal_group = "algebra";
    g.item_ids = { "x" };
    inner.addGoal(g);

    ChunkedStore chunked(inner, 3);
    auto goal = chunked.fetchGoal("goal");
    suite.require(goal && goal->goal_group == "algebra", "Goal lookup is forwarded");
    suite.require(chunked.fetchCandidates("goal", "u1", NOW).size() == 1, "Candidates are forwarded");

    chunked.upsertBanditArm("u1", "algebra", ProfileName::InfluenceHeavy, 4.0, 2.0);
    auto arms = inner.fetchBanditArms("u1", "algebra");
    suite.require(arms.size() == 1 && arms[0].successes == 4.0, "Upsert reaches the wrapped store");
    suite.require(chunked.fetchBanditArms("u1", "algebra").size() == 1, "Arm lookup is forwarded");
}

} // namespace

int main() {
    TestSuite suite;

    chunkIdsSplitsInOrder(suite);
    lookupsReassembleById(suite);
    inflightBatchesAreCapped(suite);
    failingChunkFailsLookup(suite);
    otherCallsPassThrough(suite);

    return finish(suite, "Chunked store");
}
