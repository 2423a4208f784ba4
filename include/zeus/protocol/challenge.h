// ZEUS - Challenge and Proof Types
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// Values exchanged between validator and miner. A Challenge is immutable
// once issued; a Proof references it by id.

#ifndef ZEUS_PROTOCOL_CHALLENGE_H
#define ZEUS_PROTOCOL_CHALLENGE_H

#include "zeus/core/types.h"
#include "zeus/protocol/pow.h"

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace zeus {
namespace protocol {

// ============================================================================
// Challenge Classes
// ============================================================================

enum class ChallengeClass {
    Standard = 0,
    HighDifficulty = 1,
    TimePressure = 2,
    EfficiencyTest = 3
};

constexpr size_t NUM_CHALLENGE_CLASSES = 4;

/// All classes in declaration order
constexpr std::array<ChallengeClass, NUM_CHALLENGE_CLASSES> ALL_CHALLENGE_CLASSES = {
    ChallengeClass::Standard,
    ChallengeClass::HighDifficulty,
    ChallengeClass::TimePressure,
    ChallengeClass::EfficiencyTest
};

/// Wire tag ("standard", "high_difficulty", ...)
const char* ChallengeClassToString(ChallengeClass cls);
std::optional<ChallengeClass> ChallengeClassFromString(const std::string& str);

/// Fixed per-class base parameters
struct ClassProfile {
    ChallengeClass challengeClass;
    /// Multiplier on the miner's target (< 1 is harder)
    double targetModifier;
    uint32_t timeoutSec;
};

const ClassProfile& GetClassProfile(ChallengeClass cls);

/// Apply the class modifier to a per-miner target and clamp to [minTarget, maxTarget]
uint32_t ApplyClassModifier(uint32_t minerTarget, ChallengeClass cls,
                            uint32_t minTarget, uint32_t maxTarget);

// ============================================================================
// Challenge
// ============================================================================

struct Challenge {
    std::string id;
    ChallengeClass challengeClass{ChallengeClass::Standard};
    /// A hash is valid iff its high word <= difficultyTarget
    uint32_t difficultyTarget{0};
    uint32_t timeoutSec{0};
    TimestampMs issuedAt{0};
    Bytes payload;
    PowAlgorithm algorithm{PowAlgorithm::Scrypt};
    
    /// issuedAt + timeout
    TimestampMs Deadline() const {
        return issuedAt + static_cast<TimestampMs>(timeoutSec) * 1000;
    }
    
    /// Positive target and timeout, non-empty payload, id matches content
    bool IsWellFormed() const;
};

// ============================================================================
// Proof
// ============================================================================

struct Proof {
    std::string challengeId;
    uint32_t nonce{0};
    int64_t elapsedMs{0};
    std::string deviceId;
    TimestampMs submittedAt{0};
};

} // namespace protocol
} // namespace zeus

#endif // ZEUS_PROTOCOL_CHALLENGE_H
