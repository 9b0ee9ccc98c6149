#pragma once
#include <vector>
#include <string>
#include <cstddef>
#include <ctime>
#include "Item.hpp"
#include "SchedulerConfig.hpp"
#include "ScoringEngine.hpp"

enum class DifficultyBucket {
    Easy,
    Medium,
    Hard
};

enum class MasteryBand {
    New,              // energy == 0
    ReallyStruggling, // (0, 0.2]
    Struggling,       // (0.2, 0.4]
    AlmostThere,      // (0.4, 0.7]
    AlmostMastered    // (0.7, 1.0]
};

std::string toString(DifficultyBucket bucket);
std::string toString(MasteryBand band);

struct BucketAllocation {
    std::string label;
    std::size_t target = 0;
    std::size_t available = 0;
    std::size_t taken = 0;
};

struct Composition {
    std::vector<std::string> item_ids;
    std::vector<BucketAllocation> buckets;
    std::size_t backfilled = 0;
};

/*
  Fills session slots from ranked, gated candidates.

  Revision:       buckets by content difficulty, shares easy/medium/hard.
  MixedLearning:  buckets by mastery band, populated in the order
                  New, AlmostMastered, AlmostThere, Struggling, ReallyStruggling.

  Targets are round(share * size); the last bucket takes
  max(0, size - sum(previous)). Only the first head_slice_factor * size ranked
  items are considered. Buckets never re-sort: each keeps the global rank
  order. Slots a bucket cannot fill are backfilled from all remaining items of
  the head slice in global rank order.
*/
class SessionComposer {
public:
    explicit SessionComposer(const SchedulerConfig& config = SchedulerConfig{});

    // Candidate filter of a mode: Revision takes due items with memory,
    // MixedLearning takes due or new items.
    static bool admits(const CandidateItem& item, SessionMode mode, std::time_t now);

    DifficultyBucket difficultyBucket(double difficulty) const;
    static MasteryBand masteryBand(double energy);

    // Easy, Medium, Hard
    std::vector<std::size_t> revisionTargets(std::size_t sessionSize) const;
    // New, AlmostMastered, AlmostThere, Struggling, ReallyStruggling
    std::vector<std::size_t> mixedTargets(std::size_t sessionSize, std::size_t availableNew) const;

    Composition compose(const std::vector<ScoredItem>& ranked, std::size_t sessionSize,
                        SessionMode mode) const;

private:
    SchedulerConfig config;

    static std::vector<std::size_t> splitTargets(std::size_t sessionSize,
                                                 const std::vector<double>& shares,
                                                 std::size_t firstFloor);
};
