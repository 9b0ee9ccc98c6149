#pragma once
#include <string>
#include <vector>
#include <optional>

// Weighting presets tracked as bandit arms. Balanced is the safe default.
enum class ProfileName {
    Balanced,
    FoundationHeavy,
    InfluenceHeavy,
    UrgencyHeavy,
    ReadinessFocused
};

/*
  Weights of the priority function:
    urgency   - scales ln(1 + days overdue)
    readiness - mean parent mastery
    foundation / influence - graph centrality scores of the item
  All weights are non-negative.
*/
struct Profile {
    double urgency = 1.0;
    double readiness = 1.0;
    double foundation = 1.0;
    double influence = 1.0;

    // ratio of *this, (1 - ratio) of other. ratio is clamped to [0, 1].
    Profile blend(const Profile& other, double ratio) const;

    static Profile balanced();
    static Profile forName(ProfileName name);
};

const std::vector<ProfileName>& allProfileNames();
ProfileName safeDefaultProfile();

std::string toString(ProfileName name);
std::optional<ProfileName> parseProfileName(const std::string& value);
