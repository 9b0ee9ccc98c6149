#include <iostream>
#include <vector>
#include <string>
#include <sodium.h>
#include <algorithm>
#include <limits>
#include <ctime>

#include "../utils/logging.hpp"
#include "../storage/Storage.hpp"
#include "../storage/InMemoryStore.hpp"
#include "../storage/ChunkedStore.hpp"
#include "../core/Scheduler.hpp"
#include "../core/BanditOptimizer.hpp"
#include "../core/RandomSource.hpp"

static const char* CONFIG_FILE = "scheduler.cfg";

std::string stateFileFor(const std::string& userId) {
    return "state_" + userId + ".dat";
}

void clearLine() {
    std::cin.clear();
    std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
}

bool askNumber(const std::string& prompt, long long& out) {
    std::cout << prompt;
    if (std::cin >> out) {
        clearLine();
        return true;
    }
    clearLine();
    std::cout << "Invalid number.\n";
    return false;
}

bool askDouble(const std::string& prompt, double& out) {
    std::cout << prompt;
    if (std::cin >> out) {
        clearLine();
        return true;
    }
    clearLine();
    std::cout << "Invalid number.\n";
    return false;
}

void printSession(const std::vector<std::string>& ids) {
    std::cout << "\n===== SESSION =====\n";
    if (ids.empty()) {
        std::cout << "Nothing to study right now.\n";
        return;
    }
    for (size_t i = 0; i < ids.size(); ++i) {
        std::cout << i + 1 << ". " << ids[i] << "\n";
    }
}

void printArms(const std::vector<BanditArmState>& arms) {
    if (arms.empty()) {
        std::cout << "No arms yet for this goal group.\n";
        return;
    }
    for (const auto& a : arms) {
        std::cout << "- " << toString(a.profile)
            << " | successes=" << a.successes
            << " | failures=" << a.failures
            << " | mean=" << a.expectedMean() << "\n";
    }
}

int main() {
    if (sodium_init() < 0) {
        std::cerr << "Failed to initialize libsodium\n";
        return 1;
    }

    Log::init();

    std::string userId, passphrase, catalogPath;
    std::cout << "User id: "; std::getline(std::cin, userId);
    std::cout << "Passphrase: "; std::getline(std::cin, passphrase);
    std::cout << "Catalog file: "; std::getline(std::cin, catalogPath);
    if (userId.empty() || passphrase.empty() || catalogPath.empty()) {
        std::cout << "Empty fields.\n";
        return 1;
    }
    if (userId.find_first_of(" \t/\\") != std::string::npos) {
        std::cout << "User id must not contain spaces or slashes.\n";
        return 1;
    }

    SchedulerConfig config;
    if (!Storage::loadConfig(config, CONFIG_FILE)) {
        std::cout << "Invalid " << CONFIG_FILE << "; see log.\n";
        return 1;
    }

    InMemoryStore memoryStore;
    CatalogSummary summary;
    if (!Storage::loadCatalog(memoryStore, catalogPath, &summary)) {
        std::cout << "Could not read catalog '" << catalogPath << "'.\n";
        return 1;
    }
    std::cout << "Catalog: " << summary.items << " items, " << summary.edges << " edges, "
        << summary.goals << " goals.\n";

    LearnerState state;
    if (!Storage::loadLearnerState(state, stateFileFor(userId), passphrase)) {
        std::cout << "Could not open learner state (wrong passphrase?).\n";
        return 1;
    }
    memoryStore.importLearner(userId, state);

    ChunkedStore store(memoryStore, config.fetch_chunk_size, config.max_inflight);
    Scheduler scheduler(store, config);
    StdRandomSource rng;
    BanditOptimizer optimizer(store, rng, config);

    // Arm chosen by the last personalized session; results are credited to it.
    bool hasPending = false;
    std::string pendingGroup;
    ProfileName pendingProfile = safeDefaultProfile();

    // MAIN LOOP
    while (true) {
        std::cout << "\n===== MAIN MENU =====\n"
            "User: " << userId << "\n"
            "1. Generate Session\n"
            "2. Record Session Result\n"
            "3. Update Item Memory\n"
            "4. Show Bandit Arms\n"
            "5. Save & Exit\n> ";

        int choice;
        if (!(std::cin >> choice)) {
            clearLine();
            continue;
        }
        std::cin.ignore();

        if (choice == 1) {
            std::string goalId, modeLine, personalize;
            std::cout << "Goal id: "; std::getline(std::cin, goalId);

            long long size = 0;
            if (!askNumber("Session size: ", size) || size <= 0) continue;

            std::cout << "Mode (revision / mixed): "; std::getline(std::cin, modeLine);
            auto mode = parseSessionMode(modeLine);
            if (!mode) { std::cout << "Unknown mode.\n"; continue; }

            std::cout << "Personalize? (y/n): "; std::getline(std::cin, personalize);
            std::time_t now = std::time(nullptr);

            try {
                if (!personalize.empty() && (personalize[0] == 'y' || personalize[0] == 'Y')) {
                    PersonalizedSession s = scheduler.generatePersonalizedSession(
                        userId, goalId, optimizer, static_cast<size_t>(size), now, *mode);
                    printSession(s.item_ids);
                    std::cout << "Profile: " << toString(s.chosen)
                        << (s.personalized ? "" : " (default, bandit state unavailable)") << "\n";

                    hasPending = s.personalized;
                    pendingGroup = s.goal_group;
                    pendingProfile = s.chosen;
                }
                else {
                    printSession(scheduler.generateSession(
                        userId, goalId, Profile::balanced(), static_cast<size_t>(size), now, *mode));
                }
            }
            catch (const BackendError& e) {
                spdlog::error("Session generation failed: {}", e.what());
                std::cout << "Session could not be generated: " << e.what() << "\n";
            }
        }

        else if (choice == 2) {
            if (!hasPending) {
                std::cout << "Generate a personalized session first.\n";
                continue;
            }

            long long correct = 0, total = 0, completed = 0, presented = 0;
            if (!askNumber("Correct answers: ", correct)) continue;
            if (!askNumber("Total answers: ", total)) continue;
            if (!askNumber("Items completed: ", completed)) continue;
            if (!askNumber("Items presented: ", presented)) continue;
            if (correct < 0 || total < 0 || completed < 0 || presented < 0) {
                std::cout << "Counts must not be negative.\n";
                continue;
            }

            SessionResult result;
            result.correct = static_cast<unsigned>(correct);
            result.total = static_cast<unsigned>(total);
            result.completed = static_cast<unsigned>(completed);
            result.presented = static_cast<unsigned>(presented);

            double reward = Scheduler::rewardSession(result);
            try {
                BanditArmState arm = optimizer.updateArm(userId, pendingGroup, pendingProfile, reward);
                std::cout << "Reward " << reward << " credited to " << toString(pendingProfile)
                    << " (mean now " << arm.expectedMean() << ").\n";
                hasPending = false;
            }
            catch (const BackendError& e) {
                spdlog::error("Arm update failed: {}", e.what());
                std::cout << "Could not record result: " << e.what() << "\n";
            }
        }

        else if (choice == 3) {
            std::string itemId;
            std::cout << "Item id: "; std::getline(std::cin, itemId);
            if (itemId.empty()) { std::cout << "Item id required.\n"; continue; }

            double energy = 0.0;
            if (!askDouble("Mastery energy (0..1): ", energy)) continue;

            long long days = 0;
            if (!askNumber("Next review in days (negative = overdue): ", days)) continue;
            auto due = dueAfterDays(std::time(nullptr), days);
            if (!due) {
                std::cout << "Days must be within +/-" << MAX_DUE_DAYS << ".\n";
                continue;
            }
            memoryStore.setMemory(userId, itemId, energy, *due);
            std::cout << "Updated.\n";
        }

        else if (choice == 4) {
            std::string goalId;
            std::cout << "Goal id: "; std::getline(std::cin, goalId);
            std::string group = scheduler.goalGroupOf(goalId);
            std::cout << "=== ARMS (" << group << ") ===\n";
            printArms(memoryStore.fetchBanditArms(userId, group));
        }

        else if (choice == 5) {
            if (!Storage::saveLearnerState(memoryStore.exportLearner(userId), stateFileFor(userId), passphrase))
                std::cout << "Error saving learner state.\n";

            sodium_memzero(&passphrase[0], passphrase.size());
            std::cout << "Goodbye!\n";
            break;
        }

        else std::cout << "Invalid.\n";
    }

    return 0;
}
