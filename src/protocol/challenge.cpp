// ZEUS - Challenge and Proof Types Implementation
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include "zeus/protocol/challenge.h"

#include <algorithm>
#include <cmath>

namespace zeus {
namespace protocol {

namespace {

const ClassProfile kProfiles[NUM_CHALLENGE_CLASSES] = {
    {ChallengeClass::Standard,       1.0,  12},
    {ChallengeClass::HighDifficulty, 0.25, 20},
    {ChallengeClass::TimePressure,   2.0,  6},
    {ChallengeClass::EfficiencyTest, 1.5,  12},
};

} // namespace

const char* ChallengeClassToString(ChallengeClass cls) {
    switch (cls) {
        case ChallengeClass::Standard:       return "standard";
        case ChallengeClass::HighDifficulty: return "high_difficulty";
        case ChallengeClass::TimePressure:   return "time_pressure";
        case ChallengeClass::EfficiencyTest: return "efficiency_test";
    }
    return "unknown";
}

std::optional<ChallengeClass> ChallengeClassFromString(const std::string& str) {
    for (ChallengeClass cls : ALL_CHALLENGE_CLASSES) {
        if (str == ChallengeClassToString(cls)) {
            return cls;
        }
    }
    return std::nullopt;
}

const ClassProfile& GetClassProfile(ChallengeClass cls) {
    return kProfiles[static_cast<size_t>(cls)];
}

uint32_t ApplyClassModifier(uint32_t minerTarget, ChallengeClass cls,
                            uint32_t minTarget, uint32_t maxTarget) {
    double scaled = std::floor(static_cast<double>(minerTarget) *
                               GetClassProfile(cls).targetModifier);
    double clamped = std::clamp(scaled, static_cast<double>(minTarget),
                                static_cast<double>(maxTarget));
    return static_cast<uint32_t>(clamped);
}

bool Challenge::IsWellFormed() const {
    if (difficultyTarget == 0 || timeoutSec == 0 || payload.empty()) {
        return false;
    }
    return id == ComputeChallengeId(payload, difficultyTarget, issuedAt);
}

} // namespace protocol
} // namespace zeus
