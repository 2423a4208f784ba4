// ZEUS - Difficulty Controller
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// Per-miner trend tracking and difficulty adaptation with hysteresis.

#ifndef ZEUS_VALIDATOR_DIFFICULTY_CONTROLLER_H
#define ZEUS_VALIDATOR_DIFFICULTY_CONTROLLER_H

#include "zeus/validator/miner_record.h"
#include "zeus/validator/outcome.h"
#include "zeus/validator/params.h"

namespace zeus {
namespace validator {

/// What RecordOutcome did to the miner's target
struct AdjustmentResult {
    enum class Direction { None, Tighten, Loosen };
    
    Direction direction{Direction::None};
    uint32_t oldTarget{0};
    uint32_t newTarget{0};
    
    bool Adjusted() const { return direction != Direction::None; }
};

/**
 * Stateless policy over MinerRecord.
 *
 * Every outcome updates the fast/slow success trackers, response-time
 * statistics, error rate and hashrate estimate. The target tightens (lower,
 * harder) after trackingPeriod consecutive outcomes with the fast rate above
 * highBand, and loosens after trackingPeriod consecutive outcomes below
 * lowBand. At most one adjustment happens per trackingPeriod challenges and
 * the target always stays within [minDifficulty, maxDifficulty].
 *
 * Callers serialize access to a record; the controller itself holds no
 * mutable state.
 */
class DifficultyController {
public:
    explicit DifficultyController(const ValidatorConfig& config) : config_(config) {}
    
    /// Starting record for a miner seen for the first time
    MinerRecord NewRecord(const MinerId& id, TimestampMs now) const;
    
    /// Per-miner target with the class modifier applied
    uint32_t TargetFor(const MinerRecord& record, protocol::ChallengeClass cls) const;
    
    /// Fold one outcome into the record and apply the adjustment policy
    AdjustmentResult RecordOutcome(MinerRecord& record, const ChallengeOutcome& outcome) const;
    
    /// Clamp into [minDifficulty, maxDifficulty]
    uint32_t Clamp(double target) const;
    
    const ValidatorConfig& Config() const { return config_; }

private:
    void UpdateStatistics(MinerRecord& record, const ChallengeOutcome& outcome) const;
    AdjustmentResult ApplyPolicy(MinerRecord& record) const;
    
    ValidatorConfig config_;
};

} // namespace validator
} // namespace zeus

#endif // ZEUS_VALIDATOR_DIFFICULTY_CONTROLLER_H
