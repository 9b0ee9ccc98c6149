#include "SessionComposer.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

std::string toString(DifficultyBucket bucket) {
    switch (bucket) {
    case DifficultyBucket::Easy:   return "easy";
    case DifficultyBucket::Medium: return "medium";
    case DifficultyBucket::Hard:   return "hard";
    }
    return "easy";
}

std::string toString(MasteryBand band) {
    switch (band) {
    case MasteryBand::New:              return "new";
    case MasteryBand::ReallyStruggling: return "really-struggling";
    case MasteryBand::Struggling:       return "struggling";
    case MasteryBand::AlmostThere:      return "almost-there";
    case MasteryBand::AlmostMastered:   return "almost-mastered";
    }
    return "new";
}

SessionComposer::SessionComposer(const SchedulerConfig& cfg)
    : config(cfg)
{
}

bool SessionComposer::admits(const CandidateItem& item, SessionMode mode, std::time_t now) {
    switch (mode) {
    case SessionMode::Revision:
        return item.hasMemory() && item.isDue(now);
    case SessionMode::MixedLearning:
        return item.isDue(now) || item.isNew();
    }
    return false;
}

DifficultyBucket SessionComposer::difficultyBucket(double difficulty) const {
    if (difficulty < config.easy_upper) return DifficultyBucket::Easy;
    if (difficulty < config.medium_upper) return DifficultyBucket::Medium;
    return DifficultyBucket::Hard;
}

MasteryBand SessionComposer::masteryBand(double energy) {
    if (energy <= 0.0) return MasteryBand::New;
    if (energy <= 0.2) return MasteryBand::ReallyStruggling;
    if (energy <= 0.4) return MasteryBand::Struggling;
    if (energy <= 0.7) return MasteryBand::AlmostThere;
    return MasteryBand::AlmostMastered;
}

std::vector<std::size_t> SessionComposer::splitTargets(std::size_t sessionSize,
                                                       const std::vector<double>& shares,
                                                       std::size_t firstFloor)
{
    std::vector<std::size_t> targets;
    if (shares.empty()) return targets;

    std::size_t assigned = 0;
    for (std::size_t i = 0; i + 1 < shares.size(); ++i) {
        auto t = static_cast<std::size_t>(std::lround(static_cast<double>(sessionSize) * shares[i]));
        if (i == 0) t = std::max(t, firstFloor);
        targets.push_back(t);
        assigned += t;
    }

    // rounding may overshoot; the last bucket absorbs the difference but never goes negative
    targets.push_back(assigned >= sessionSize ? 0 : sessionSize - assigned);
    return targets;
}

std::vector<std::size_t> SessionComposer::revisionTargets(std::size_t sessionSize) const {
    return splitTargets(sessionSize,
        { config.revision_easy, config.revision_medium, config.revision_hard }, 0);
}

std::vector<std::size_t> SessionComposer::mixedTargets(std::size_t sessionSize,
                                                       std::size_t availableNew) const
{
    std::size_t floorNew = availableNew > 0 ? config.min_new_per_session : 0;
    return splitTargets(sessionSize,
        { config.mix_new, config.mix_almost_mastered, config.mix_almost_there,
          config.mix_struggling, config.mix_really_struggling },
        floorNew);
}

Composition SessionComposer::compose(const std::vector<ScoredItem>& ranked,
                                     std::size_t sessionSize, SessionMode mode) const
{
    Composition out;
    if (ranked.empty() || sessionSize == 0) return out;

    std::size_t headSize = std::min(ranked.size(), config.head_slice_factor * sessionSize);

    // bucket index -> positions in the head slice, in global rank order
    std::vector<std::vector<std::size_t>> buckets;
    std::vector<std::string> labels;
    std::vector<std::size_t> targets;

    if (mode == SessionMode::Revision) {
        buckets.resize(3);
        labels = { toString(DifficultyBucket::Easy), toString(DifficultyBucket::Medium),
                   toString(DifficultyBucket::Hard) };
        for (std::size_t i = 0; i < headSize; ++i) {
            auto b = difficultyBucket(ranked[i].item().difficulty_score);
            buckets[static_cast<std::size_t>(b)].push_back(i);
        }
        targets = revisionTargets(sessionSize);
    }
    else {
        // population order differs from band order
        const MasteryBand order[] = { MasteryBand::New, MasteryBand::AlmostMastered,
                                      MasteryBand::AlmostThere, MasteryBand::Struggling,
                                      MasteryBand::ReallyStruggling };
        buckets.resize(5);
        for (auto band : order) labels.push_back(toString(band));

        for (std::size_t i = 0; i < headSize; ++i) {
            auto band = masteryBand(ranked[i].item().mastery_energy);
            for (std::size_t slot = 0; slot < 5; ++slot) {
                if (order[slot] == band) {
                    buckets[slot].push_back(i);
                    break;
                }
            }
        }
        targets = mixedTargets(sessionSize, buckets[0].size());
    }

    std::vector<bool> selected(headSize, false);
    out.item_ids.reserve(sessionSize);

    for (std::size_t b = 0; b < buckets.size(); ++b) {
        BucketAllocation alloc;
        alloc.label = labels[b];
        alloc.target = targets[b];
        alloc.available = buckets[b].size();

        for (std::size_t pos : buckets[b]) {
            if (alloc.taken >= alloc.target || out.item_ids.size() >= sessionSize) break;
            selected[pos] = true;
            out.item_ids.push_back(ranked[pos].item().id);
            ++alloc.taken;
        }
        out.buckets.push_back(alloc);
    }

    // Backfill from every bucket, strictly in global rank order
    for (std::size_t i = 0; i < headSize && out.item_ids.size() < sessionSize; ++i) {
        if (selected[i]) continue;
        selected[i] = true;
        out.item_ids.push_back(ranked[i].item().id);
        ++out.backfilled;
    }

    for (const auto& a : out.buckets) {
        spdlog::debug("Compose {}: bucket={} target={} available={} taken={}",
            toString(mode), a.label, a.target, a.available, a.taken);
    }
    spdlog::debug("Compose {}: {} item(s), {} backfilled, head slice {}",
        toString(mode), out.item_ids.size(), out.backfilled, headSize);

    return out;
}
