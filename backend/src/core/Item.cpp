#include "Item.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <spdlog/spdlog.h>

CandidateItem::CandidateItem(const std::string& itemId)
    : id(itemId)
{
}

bool CandidateItem::isNew() const {
    return mastery_energy <= 0.0;
}

bool CandidateItem::hasMemory() const {
    return mastery_energy > 0.0 || next_due > 0;
}

bool CandidateItem::isDue(std::time_t now) const {
    return next_due > 0 && next_due <= now;
}

void CandidateItem::sanitize() {
    double before[4] = { foundational_score, influence_score, difficulty_score, mastery_energy };

    foundational_score = clampUnit(foundational_score);
    influence_score = clampUnit(influence_score);
    difficulty_score = clampUnit(difficulty_score);
    mastery_energy = clampUnit(mastery_energy);
    if (next_due < 0) next_due = 0;

    if (before[0] != foundational_score || before[1] != influence_score ||
        before[2] != difficulty_score || before[3] != mastery_energy) {
        spdlog::debug("Item {} had out-of-range metadata; sanitized", id);
    }
}

EdgeKind parseEdgeKind(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v.empty() || v == "prerequisite" || v == "prereq") return EdgeKind::Prerequisite;
    return EdgeKind::Other;
}

double BanditArmState::expectedMean() const {
    double total = successes + failures;
    if (total <= 0.0) return 0.5;
    return successes / total;
}

std::string toString(SessionMode mode) {
    switch (mode) {
    case SessionMode::Revision:      return "revision";
    case SessionMode::MixedLearning: return "mixed-learning";
    }
    return "revision";
}

std::optional<SessionMode> parseSessionMode(const std::string& value) {
    if (value == "revision") return SessionMode::Revision;
    if (value == "mixed-learning" || value == "mixed") return SessionMode::MixedLearning;
    return std::nullopt;
}

// NaN and infinities collapse to 0.0 (treated as missing metadata)
double clampUnit(double value) {
    if (!std::isfinite(value)) return 0.0;
    return std::clamp(value, 0.0, 1.0);
}

std::optional<std::time_t> dueAfterDays(std::time_t now, long long days) {
    if (days > MAX_DUE_DAYS || days < -MAX_DUE_DAYS) return std::nullopt;
    return now + static_cast<std::time_t>(days * 86400LL);
}
