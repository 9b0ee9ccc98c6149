#include "BanditOptimizer.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>

BanditOptimizer::BanditOptimizer(SchedulerStore& s, RandomSource& r, const SchedulerConfig& config)
    : store(s), rng(r), blend_ratio(std::clamp(config.blend_ratio, 0.0, 1.0))
{
}

std::vector<BanditArmState> BanditOptimizer::initialArms() {
    std::vector<BanditArmState> arms;
    for (ProfileName name : allProfileNames()) {
        BanditArmState arm;
        arm.profile = name;
        arms.push_back(arm);
    }
    return arms;
}

static double usableParam(double v) {
    return (std::isfinite(v) && v > 0.0) ? v : 1.0;
}

ProfileName BanditOptimizer::chooseArm(const std::vector<BanditArmState>& arms) {
    ProfileName best = safeDefaultProfile();
    double bestSample = -1.0;

    for (ProfileName name : allProfileNames()) {
        BanditArmState arm;
        arm.profile = name;
        auto it = std::find_if(arms.begin(), arms.end(),
            [name](const BanditArmState& a) { return a.profile == name; });
        if (it != arms.end()) {
            arm.successes = usableParam(it->successes);
            arm.failures = usableParam(it->failures);
        }

        double sample = rng.sampleBeta(arm.successes, arm.failures);
        spdlog::debug("Arm {} Beta({:.3f}, {:.3f}) sample={:.4f}",
            toString(name), arm.successes, arm.failures, sample);

        if (sample > bestSample) {
            bestSample = sample;
            best = name;
        }
    }
    return best;
}

ProfileName BanditOptimizer::chooseArm(const std::string& userId, const std::string& goalGroup) {
    return selectProfile(userId, goalGroup).chosen;
}

Profile BanditOptimizer::blend(ProfileName chosen) const {
    return Profile::forName(chosen).blend(Profile::forName(safeDefaultProfile()), blend_ratio);
}

ProfileChoice BanditOptimizer::selectProfile(const std::string& userId,
                                             const std::string& goalGroup)
{
    ProfileChoice choice;
    std::vector<BanditArmState> arms;
    try {
        arms = store.fetchBanditArms(userId, goalGroup);
    }
    catch (const BackendError& e) {
        spdlog::warn("Bandit state for '{}'/'{}' unavailable ({}); using {}",
            userId, goalGroup, e.what(), toString(safeDefaultProfile()));
        choice.chosen = safeDefaultProfile();
        choice.weights = blend(choice.chosen);
        return choice;
    }

    if (arms.empty()) {
        spdlog::info("No bandit state for '{}'/'{}'; initializing {} arms",
            userId, goalGroup, allProfileNames().size());
        arms = initialArms();
        try {
            for (const auto& arm : arms) {
                store.upsertBanditArm(userId, goalGroup, arm.profile, arm.successes, arm.failures);
            }
        }
        catch (const BackendError& e) {
            spdlog::warn("Could not persist initial arms for '{}'/'{}': {}",
                userId, goalGroup, e.what());
        }
    }

    choice.chosen = chooseArm(arms);
    choice.weights = blend(choice.chosen);
    choice.personalized = true;

    spdlog::info("Thompson Sampling chose {} for '{}'/'{}'",
        toString(choice.chosen), userId, goalGroup);
    return choice;
}

double BanditOptimizer::reward(const SessionResult& result) {
    double accuracy = static_cast<double>(result.correct) /
        static_cast<double>(std::max(result.total, 1u));
    double completion = static_cast<double>(result.completed) /
        static_cast<double>(std::max(result.presented, 1u));
    return std::clamp(0.6 * accuracy + 0.4 * completion, 0.0, 1.0);
}

namespace {

struct ArmLockRegistry {
    std::mutex mtx;
    std::map<std::string, std::shared_ptr<std::mutex>> locks;
};

ArmLockRegistry& armLocks() {
    static ArmLockRegistry registry;
    return registry;
}

// Holds the per-key mutex; the registry entry is dropped by its last holder.
class ArmKeyLock {
public:
    explicit ArmKeyLock(std::string k) : key(std::move(k)) {
        auto& reg = armLocks();
        {
            std::lock_guard<std::mutex> guard(reg.mtx);
            auto& slot = reg.locks[key];
            if (!slot) slot = std::make_shared<std::mutex>();
            held = slot;
        }
        held->lock();
    }

    ~ArmKeyLock() {
        held->unlock();
        auto& reg = armLocks();
        std::lock_guard<std::mutex> guard(reg.mtx);
        held.reset();
        auto it = reg.locks.find(key);
        if (it != reg.locks.end() && it->second.use_count() == 1) reg.locks.erase(it);
    }

    ArmKeyLock(const ArmKeyLock&) = delete;
    ArmKeyLock& operator=(const ArmKeyLock&) = delete;

private:
    std::string key;
    std::shared_ptr<std::mutex> held;
};

} // namespace

std::size_t BanditOptimizer::heldLockCount() {
    auto& reg = armLocks();
    std::lock_guard<std::mutex> guard(reg.mtx);
    return reg.locks.size();
}

BanditArmState BanditOptimizer::updateArm(const std::string& userId, const std::string& goalGroup,
                                          ProfileName profile, double reward)
{
    double r = clampUnit(reward);

    ArmKeyLock keyLock(userId + '\x1f' + goalGroup + '\x1f' + toString(profile));

    BanditArmState arm;
    arm.profile = profile;
    for (const auto& a : store.fetchBanditArms(userId, goalGroup)) {
        if (a.profile == profile) {
            arm.successes = usableParam(a.successes);
            arm.failures = usableParam(a.failures);
            break;
        }
    }

    arm.successes += r;
    arm.failures += 1.0 - r;
    store.upsertBanditArm(userId, goalGroup, profile, arm.successes, arm.failures);

    spdlog::info("Arm {} for '{}'/'{}' updated with reward {:.3f}: Beta({:.3f}, {:.3f})",
        toString(profile), userId, goalGroup, r, arm.successes, arm.failures);
    return arm;
}
