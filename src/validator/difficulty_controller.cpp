// ZEUS - Difficulty Controller Implementation
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include "zeus/validator/difficulty_controller.h"
#include "zeus/protocol/pow.h"
#include "zeus/util/logging.h"

#include <algorithm>
#include <cmath>

namespace zeus {
namespace validator {

MinerRecord DifficultyController::NewRecord(const MinerId& id, TimestampMs now) const {
    return MinerRecord::Create(id, Clamp(config_.baseDifficulty), now);
}

uint32_t DifficultyController::TargetFor(const MinerRecord& record,
                                         protocol::ChallengeClass cls) const {
    return protocol::ApplyClassModifier(record.difficulty.target, cls,
                                        config_.minDifficulty, config_.maxDifficulty);
}

uint32_t DifficultyController::Clamp(double target) const {
    double clamped = std::clamp(std::floor(target),
                                static_cast<double>(config_.minDifficulty),
                                static_cast<double>(config_.maxDifficulty));
    return static_cast<uint32_t>(clamped);
}

AdjustmentResult DifficultyController::RecordOutcome(MinerRecord& record,
                                                     const ChallengeOutcome& outcome) const {
    UpdateStatistics(record, outcome);
    if (!outcome.CountsAsChallenge()) {
        AdjustmentResult none;
        none.oldTarget = none.newTarget = record.difficulty.target;
        return none;
    }
    return ApplyPolicy(record);
}

void DifficultyController::UpdateStatistics(MinerRecord& record,
                                            const ChallengeOutcome& outcome) const {
    const bool accepted = outcome.IsAccepted();
    record.lastSeenAt = std::max(record.lastSeenAt, outcome.at);
    
    if (outcome.WasSubmitted()) {
        record.acceptRate = EwmaStep(record.acceptRate, accepted ? 1.0 : 0.0, config_.alphaLow,
                                     record.submittedCount > 0);
        ++record.submittedCount;
    }
    record.errorRate = EwmaStep(record.errorRate, accepted ? 0.0 : 1.0, config_.alphaLow, true);
    
    if (!outcome.CountsAsChallenge()) {
        return;
    }
    
    ++record.challengeCount;
    if (accepted) {
        ++record.acceptedCount;
    }
    record.successRate.Update(accepted ? 1.0 : 0.0, config_.alphaHigh, config_.alphaLow);
    
    if (!accepted) {
        return;
    }
    
    // Response time mean/variance (West's incremental EWMA form)
    const double elapsed = static_cast<double>(std::max<int64_t>(outcome.elapsedMs, 1));
    const double alpha = config_.alphaLow;
    const bool seeded = record.responseSamples > 0;
    if (seeded) {
        double diff = elapsed - record.responseTimeMs;
        record.responseTimeMs += alpha * diff;
        record.responseVarianceMs2 = (1.0 - alpha) * (record.responseVarianceMs2 + alpha * diff * diff);
    } else {
        record.responseTimeMs = elapsed;
        record.responseVarianceMs2 = 0.0;
    }
    
    double hashrate = protocol::ExpectedHashes(outcome.difficultyTarget) / (elapsed / 1000.0);
    record.hashrateEstimate = EwmaStep(record.hashrateEstimate, hashrate, alpha, seeded);
    ++record.responseSamples;
}

AdjustmentResult DifficultyController::ApplyPolicy(MinerRecord& record) const {
    DifficultyState& d = record.difficulty;
    AdjustmentResult result;
    result.oldTarget = result.newTarget = d.target;
    
    ++d.sinceAdjust;
    const double fast = record.successRate.Fast();
    if (fast > config_.highBand) {
        ++d.highStreak;
        d.lowStreak = 0;
    } else if (fast < config_.lowBand) {
        ++d.lowStreak;
        d.highStreak = 0;
    } else {
        d.highStreak = 0;
        d.lowStreak = 0;
    }
    
    if (d.sinceAdjust < config_.trackingPeriod) {
        return result;
    }
    
    uint32_t next = d.target;
    AdjustmentResult::Direction dir = AdjustmentResult::Direction::None;
    if (d.highStreak >= config_.trackingPeriod) {
        double lowered = std::min(std::floor(d.target / config_.adjustmentFactor),
                                  static_cast<double>(d.target) - 1.0);
        next = Clamp(lowered);
        dir = AdjustmentResult::Direction::Tighten;
    } else if (d.lowStreak >= config_.trackingPeriod) {
        double raised = std::max(std::floor(d.target * config_.adjustmentFactor),
                                 static_cast<double>(d.target) + 1.0);
        next = Clamp(raised);
        dir = AdjustmentResult::Direction::Loosen;
    }
    
    if (dir == AdjustmentResult::Direction::None || next == d.target) {
        return result;
    }
    
    d.target = next;
    d.highStreak = 0;
    d.lowStreak = 0;
    d.sinceAdjust = 0;
    ++d.adjustments;
    
    result.direction = dir;
    result.newTarget = next;
    
    LOG_INFO(util::LogCategory::DIFFICULTY)
        << (dir == AdjustmentResult::Direction::Tighten ? "Tightened" : "Loosened")
        << " target for " << record.minerId << ": 0x" << std::hex << result.oldTarget
        << " -> 0x" << result.newTarget << std::dec
        << " (fast=" << record.successRate.Fast() << ", slow=" << record.successRate.Slow() << ")";
    return result;
}

} // namespace validator
} // namespace zeus
