#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "Item.hpp"
#include "Profile.hpp"
#include "RandomSource.hpp"
#include "SchedulerConfig.hpp"
#include "../storage/SchedulerStore.hpp"

struct ProfileChoice {
    ProfileName chosen = ProfileName::Balanced;
    Profile weights;            // chosen blended with the safe default
    bool personalized = false;  // false when arm state could not be read
};

/*
  Thompson Sampling over profile presets, one Beta(successes, failures) arm
  per (user, goal group, profile).

  Personalization is best effort: if arm state cannot be read, the safe
  default profile is used and session generation continues.

  chooseArm() draws from the injected RandomSource and is meant to be called
  from one thread per optimizer. updateArm() may be called concurrently from
  any number of optimizers; the read-modify-write of one arm key is
  serialized process-wide.
*/
class BanditOptimizer {
public:
    BanditOptimizer(SchedulerStore& store, RandomSource& rng,
                    const SchedulerConfig& config = SchedulerConfig{});

    // One draw per known preset; presets absent from arms use Beta(1, 1).
    ProfileName chooseArm(const std::vector<BanditArmState>& arms);

    // Loads arms for (user, goal group), creating Beta(1, 1) arms when none exist.
    ProfileName chooseArm(const std::string& userId, const std::string& goalGroup);

    Profile blend(ProfileName chosen) const;

    ProfileChoice selectProfile(const std::string& userId, const std::string& goalGroup);

    // clamp(0.6 * accuracy + 0.4 * completion, 0, 1)
    static double reward(const SessionResult& result);

    // successes += reward, failures += 1 - reward; persisted with an upsert.
    BanditArmState updateArm(const std::string& userId, const std::string& goalGroup,
                             ProfileName profile, double reward);

    static std::vector<BanditArmState> initialArms();

    // Arm keys with an update in progress.
    static std::size_t heldLockCount();

private:
    SchedulerStore& store;
    RandomSource& rng;
    double blend_ratio;
};
