#include "Profile.hpp"
#include <algorithm>

Profile Profile::blend(const Profile& other, double ratio) const {
    double r = std::clamp(ratio, 0.0, 1.0);
    double o = 1.0 - r;

    Profile out;
    out.urgency = urgency * r + other.urgency * o;
    out.readiness = readiness * r + other.readiness * o;
    out.foundation = foundation * r + other.foundation * o;
    out.influence = influence * r + other.influence * o;
    return out;
}

Profile Profile::balanced() {
    return Profile{};
}

Profile Profile::forName(ProfileName name) {
    switch (name) {
    case ProfileName::Balanced:         return Profile{ 1.0, 1.0, 1.0, 1.0 };
    case ProfileName::FoundationHeavy:  return Profile{ 0.8, 1.0, 1.5, 0.8 };
    case ProfileName::InfluenceHeavy:   return Profile{ 0.8, 1.0, 0.8, 1.5 };
    case ProfileName::UrgencyHeavy:     return Profile{ 1.5, 0.8, 1.0, 1.0 };
    case ProfileName::ReadinessFocused: return Profile{ 0.8, 1.5, 1.0, 1.0 };
    }
    return Profile{};
}

const std::vector<ProfileName>& allProfileNames() {
    static const std::vector<ProfileName> names = {
        ProfileName::Balanced,
        ProfileName::FoundationHeavy,
        ProfileName::InfluenceHeavy,
        ProfileName::UrgencyHeavy,
        ProfileName::ReadinessFocused
    };
    return names;
}

ProfileName safeDefaultProfile() {
    return ProfileName::Balanced;
}

std::string toString(ProfileName name) {
    switch (name) {
    case ProfileName::Balanced:         return "Balanced";
    case ProfileName::FoundationHeavy:  return "FoundationHeavy";
    case ProfileName::InfluenceHeavy:   return "InfluenceHeavy";
    case ProfileName::UrgencyHeavy:     return "UrgencyHeavy";
    case ProfileName::ReadinessFocused: return "ReadinessFocused";
    }
    return "Balanced";
}

std::optional<ProfileName> parseProfileName(const std::string& value) {
    for (ProfileName name : allProfileNames()) {
        if (toString(name) == value) return name;
    }
    return std::nullopt;
}
