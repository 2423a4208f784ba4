// ZEUS - Validator Parameters
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// Tunables shared by the challenge generator, difficulty controller,
// verifier, scoring engine and weight aggregator. Every component reads
// the same ValidatorConfig so that a score can be replayed from
// (outcome, record snapshot, config) alone.

#ifndef ZEUS_VALIDATOR_PARAMS_H
#define ZEUS_VALIDATOR_PARAMS_H

#include "zeus/protocol/challenge.h"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace zeus {

namespace util {
class ConfigManager;
}

namespace validator {

// ============================================================================
// Validator Configuration
// ============================================================================

struct ValidatorConfig {
    // ========================================================================
    // Trend Tracking
    // ========================================================================
    
    /// Slow (long-horizon) EWMA rate
    double alphaLow{0.1};
    
    /// Fast (short-horizon) EWMA rate
    double alphaHigh{0.8};
    
    /// Hysteresis window, in challenges
    uint32_t trackingPeriod{10};
    
    // ========================================================================
    // Consensus Weights and Early Detection
    // ========================================================================
    
    /// Minimum fast/slow agreement for the fast weight tracker to be used
    double consensusWeightThreshold{0.8};
    
    /// Early-detection applies while challenge count is below this
    uint32_t newMinerThreshold{5};
    
    /// Observed success rate required for early detection
    double performanceThreshold{0.8};
    
    /// Relative weight boost for early-detected miners
    double bondAggressiveness{0.3};
    
    /// Score bonus for early-detected miners
    double earlyDetectionBonus{0.2};
    
    /// Weights of an epoch sum to this
    double weightTotal{1.0};
    
    // ========================================================================
    // Challenge Classes
    // ========================================================================
    
    /// Draw probabilities indexed by ChallengeClass
    using ClassWeights = std::array<double, protocol::NUM_CHALLENGE_CLASSES>;
    ClassWeights classWeights{{0.4, 0.2, 0.2, 0.2}};
    
    protocol::PowAlgorithm algorithm{protocol::PowAlgorithm::Scrypt};
    
    // ========================================================================
    // Difficulty
    // ========================================================================
    
    uint32_t baseDifficulty{0x0000ffff};
    /// Hardest allowed target
    uint32_t minDifficulty{0x000000ff};
    /// Easiest allowed target
    uint32_t maxDifficulty{0x00ffffff};
    double adjustmentFactor{1.1};
    /// Fast success rate above which the target tightens
    double highBand{0.8};
    /// Fast success rate below which the target loosens
    double lowBand{0.3};
    
    // ========================================================================
    // Verification and Scoring
    // ========================================================================
    
    int64_t graceMs{2000};
    int64_t speedThresholdMs{5000};
    double efficiencyTarget{0.5};
    double highPerformerThreshold{0.8};
    /// Elapsed-time variance bound for the consistency bonus (ms^2)
    double stabilityVariance{250000.0};
    /// Allowed |fast - slow| divergence for the consistency bonus
    double trendTolerance{0.25};
    double capTotal{2.5};
    
    double speedBonusMax{0.5};
    double efficiencyBonusMax{0.3};
    double highDifficultyBonus{0.5};
    double efficiencyTestBonusMax{0.1};
    double historicalBonus{0.2};
    double consistencyBonus{0.15};
    
    // ========================================================================
    // Orchestration
    // ========================================================================
    
    uint32_t epochRounds{10};
    int64_t checkpointIntervalSec{60};
    int64_t roundIntervalMs{1000};
    
    // ========================================================================
    // Helpers
    // ========================================================================
    
    /// Every problem with the current values; empty when usable
    std::vector<std::string> Validate() const;
    
    /// Rescale classWeights to sum to 1 (uniform if all zero or negative)
    void NormalizeClassWeights();
    
    double ClassWeight(protocol::ChallengeClass cls) const {
        return classWeights[static_cast<size_t>(cls)];
    }
    
    /// Read the [validator] section on top of the defaults
    static ValidatorConfig FromConfig(const util::ConfigManager& config);
};

} // namespace validator
} // namespace zeus

#endif // ZEUS_VALIDATOR_PARAMS_H
