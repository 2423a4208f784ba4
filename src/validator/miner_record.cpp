// ZEUS - Miner Record Implementation
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include "zeus/validator/miner_record.h"

namespace zeus {
namespace validator {

MinerRecord MinerRecord::Create(const MinerId& id, uint32_t baseTarget, TimestampMs now) {
    MinerRecord r;
    r.minerId = id;
    r.firstSeenAt = now;
    r.lastSeenAt = now;
    r.difficulty.target = baseTarget;
    return r;
}

bool MinerRecord::operator==(const MinerRecord& other) const {
    return minerId == other.minerId &&
           firstSeenAt == other.firstSeenAt &&
           lastSeenAt == other.lastSeenAt &&
           successRate.Fast() == other.successRate.Fast() &&
           successRate.Slow() == other.successRate.Slow() &&
           successRate.IsSeeded() == other.successRate.IsSeeded() &&
           responseTimeMs == other.responseTimeMs &&
           responseVarianceMs2 == other.responseVarianceMs2 &&
           responseSamples == other.responseSamples &&
           errorRate == other.errorRate &&
           acceptRate == other.acceptRate &&
           hashrateEstimate == other.hashrateEstimate &&
           challengeCount == other.challengeCount &&
           acceptedCount == other.acceptedCount &&
           submittedCount == other.submittedCount &&
           difficulty.target == other.difficulty.target &&
           difficulty.highStreak == other.difficulty.highStreak &&
           difficulty.lowStreak == other.difficulty.lowStreak &&
           difficulty.sinceAdjust == other.difficulty.sinceAdjust &&
           difficulty.adjustments == other.difficulty.adjustments &&
           weightTracker.Fast() == other.weightTracker.Fast() &&
           weightTracker.Slow() == other.weightTracker.Slow() &&
           weightTracker.IsSeeded() == other.weightTracker.IsSeeded() &&
           consensusWeight == other.consensusWeight &&
           epochScoreSum == other.epochScoreSum &&
           epochScoreCount == other.epochScoreCount;
}

} // namespace validator
} // namespace zeus
