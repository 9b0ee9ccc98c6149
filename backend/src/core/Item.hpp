#pragma once
#include <string>
#include <ctime>
#include <vector>
#include <optional>
#include <unordered_map>
#include "Profile.hpp"

enum class SessionMode {
    Revision,      // due reviews only, composed by content difficulty
    MixedLearning  // due + new, composed by mastery band
};

std::string toString(SessionMode mode);
std::optional<SessionMode> parseSessionMode(const std::string& value);

// One schedulable content item as seen by a single scheduling pass.
class CandidateItem {
public:
    CandidateItem() = default;
    explicit CandidateItem(const std::string& id);

    std::string id;

    // Content metadata, each in [0..1]
    double foundational_score = 0.0;
    double influence_score = 0.0;
    double difficulty_score = 0.0;

    // Learner memory; 0 energy means "new", 0 next_due means never scheduled
    double mastery_energy = 0.0;
    std::time_t next_due = 0;     // Seconds since epoch

    long long canonical_order = 0;

    bool isNew() const;
    bool hasMemory() const;
    bool isDue(std::time_t now) const;

    // Replace non-finite or out-of-range numeric fields with safe values.
    void sanitize();
};

enum class EdgeKind {
    Prerequisite,
    Other
};

EdgeKind parseEdgeKind(const std::string& value);

struct PrerequisiteEdge {
    std::string parent;
    std::string child;
    EdgeKind kind = EdgeKind::Prerequisite;
};

struct EnrichedItem {
    CandidateItem item;
    std::vector<std::string> parent_ids;
};

struct Goal {
    std::string id;
    std::string goal_group;
    std::vector<std::string> item_ids;
};

struct BanditArmState {
    ProfileName profile = ProfileName::Balanced;
    double successes = 1.0;
    double failures = 1.0;

    // Mean of Beta(successes, failures)
    double expectedMean() const;
};

struct SessionResult {
    unsigned correct = 0;
    unsigned total = 0;
    unsigned completed = 0;
    unsigned presented = 0;
};

using EnergyMap = std::unordered_map<std::string, double>;
using ParentMap = std::unordered_map<std::string, std::vector<std::string>>;

double clampUnit(double value);

// Review offsets are limited to about a century either way.
constexpr long long MAX_DUE_DAYS = 36500;

// now + days, or nullopt when |days| exceeds MAX_DUE_DAYS.
std::optional<std::time_t> dueAfterDays(std::time_t now, long long days);
