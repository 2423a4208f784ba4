// ZEUS - Miner Record
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// Long-lived per-miner statistics: success-rate trend, response time and
// its variance, error and accept rates, hashrate estimate, difficulty state and the
// consensus weight tracker. Checkpointed so restarts keep the trend.

#ifndef ZEUS_VALIDATOR_MINER_RECORD_H
#define ZEUS_VALIDATOR_MINER_RECORD_H

#include "zeus/core/serialize.h"
#include "zeus/core/types.h"
#include "zeus/validator/ewma.h"

#include <cstdint>
#include <string>

namespace zeus {
namespace validator {

/// Per-miner difficulty adaptation state
struct DifficultyState {
    uint32_t target{0};
    /// Consecutive outcomes with fast success rate above the high band
    uint32_t highStreak{0};
    /// Consecutive outcomes with fast success rate below the low band
    uint32_t lowStreak{0};
    /// Challenges since the last adjustment (or since first seen)
    uint32_t sinceAdjust{0};
    uint32_t adjustments{0};
};

struct MinerRecord {
    MinerId minerId;
    TimestampMs firstSeenAt{0};
    TimestampMs lastSeenAt{0};
    
    /// Success (1) / failure (0) per challenge
    DualRateEwma successRate;
    
    /// EWMA(alpha_low) of elapsed_ms for accepted proofs
    double responseTimeMs{0.0};
    /// EWMA(alpha_low) variance of elapsed_ms for accepted proofs
    double responseVarianceMs2{0.0};
    uint64_t responseSamples{0};
    
    /// EWMA(alpha_low) of rejected-or-expired per received event
    double errorRate{0.0};
    /// EWMA(alpha_low) of accepted per submitted proof
    double acceptRate{0.0};
    
    /// EWMA(alpha_low) of ExpectedHashes(target) / elapsed seconds
    double hashrateEstimate{0.0};
    
    uint64_t challengeCount{0};
    uint64_t acceptedCount{0};
    /// Proofs received, whatever their verdict
    uint64_t submittedCount{0};
    
    DifficultyState difficulty;
    
    // Consensus weight
    DualRateEwma weightTracker;
    double consensusWeight{0.0};
    
    // Scores recorded since the last aggregation pass
    double epochScoreSum{0.0};
    uint32_t epochScoreCount{0};
    
    /// A fresh record starting at the given target
    static MinerRecord Create(const MinerId& id, uint32_t baseTarget, TimestampMs now);
    
    /// Accepted / challenges; 0 before the first challenge
    double ObservedSuccessRate() const {
        return challengeCount == 0 ? 0.0
            : static_cast<double>(acceptedCount) / static_cast<double>(challengeCount);
    }
    
    bool operator==(const MinerRecord& other) const;
    bool operator!=(const MinerRecord& other) const { return !(*this == other); }
};

// ============================================================================
// Serialization
// ============================================================================

/// Current on-disk record version
constexpr uint8_t MINER_RECORD_VERSION = 2;

template<typename Stream>
void Serialize(Stream& s, const DualRateEwma& e) {
    zeus::Serialize(s, e.Fast());
    zeus::Serialize(s, e.Slow());
    zeus::Serialize(s, e.IsSeeded());
}

template<typename Stream>
void Unserialize(Stream& s, DualRateEwma& e) {
    double fast = 0.0, slow = 0.0;
    bool seeded = false;
    zeus::Unserialize(s, fast);
    zeus::Unserialize(s, slow);
    zeus::Unserialize(s, seeded);
    e = DualRateEwma(fast, slow, seeded);
}

template<typename Stream>
void Serialize(Stream& s, const MinerRecord& r) {
    zeus::Serialize(s, MINER_RECORD_VERSION);
    zeus::Serialize(s, r.minerId);
    zeus::Serialize(s, r.firstSeenAt);
    zeus::Serialize(s, r.lastSeenAt);
    Serialize(s, r.successRate);
    zeus::Serialize(s, r.responseTimeMs);
    zeus::Serialize(s, r.responseVarianceMs2);
    zeus::Serialize(s, r.responseSamples);
    zeus::Serialize(s, r.errorRate);
    zeus::Serialize(s, r.acceptRate);
    zeus::Serialize(s, r.hashrateEstimate);
    zeus::Serialize(s, r.challengeCount);
    zeus::Serialize(s, r.acceptedCount);
    zeus::Serialize(s, r.submittedCount);
    zeus::Serialize(s, r.difficulty.target);
    zeus::Serialize(s, r.difficulty.highStreak);
    zeus::Serialize(s, r.difficulty.lowStreak);
    zeus::Serialize(s, r.difficulty.sinceAdjust);
    zeus::Serialize(s, r.difficulty.adjustments);
    Serialize(s, r.weightTracker);
    zeus::Serialize(s, r.consensusWeight);
    zeus::Serialize(s, r.epochScoreSum);
    zeus::Serialize(s, r.epochScoreCount);
}

template<typename Stream>
void Unserialize(Stream& s, MinerRecord& r) {
    uint8_t version = 0;
    zeus::Unserialize(s, version);
    if (version != MINER_RECORD_VERSION) {
        throw std::ios_base::failure("MinerRecord: unsupported version " + std::to_string(version));
    }
    zeus::Unserialize(s, r.minerId);
    zeus::Unserialize(s, r.firstSeenAt);
    zeus::Unserialize(s, r.lastSeenAt);
    Unserialize(s, r.successRate);
    zeus::Unserialize(s, r.responseTimeMs);
    zeus::Unserialize(s, r.responseVarianceMs2);
    zeus::Unserialize(s, r.responseSamples);
    zeus::Unserialize(s, r.errorRate);
    zeus::Unserialize(s, r.acceptRate);
    zeus::Unserialize(s, r.hashrateEstimate);
    zeus::Unserialize(s, r.challengeCount);
    zeus::Unserialize(s, r.acceptedCount);
    zeus::Unserialize(s, r.submittedCount);
    zeus::Unserialize(s, r.difficulty.target);
    zeus::Unserialize(s, r.difficulty.highStreak);
    zeus::Unserialize(s, r.difficulty.lowStreak);
    zeus::Unserialize(s, r.difficulty.sinceAdjust);
    zeus::Unserialize(s, r.difficulty.adjustments);
    Unserialize(s, r.weightTracker);
    zeus::Unserialize(s, r.consensusWeight);
    zeus::Unserialize(s, r.epochScoreSum);
    zeus::Unserialize(s, r.epochScoreCount);
}

} // namespace validator
} // namespace zeus

#endif // ZEUS_VALIDATOR_MINER_RECORD_H
