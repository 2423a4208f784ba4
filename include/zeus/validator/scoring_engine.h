// ZEUS - Scoring Engine
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// Converts one challenge outcome into a bounded score. A score is a pure
// function of (outcome, MinerRecord snapshot, ValidatorConfig) so that any
// score can be replayed for audit.

#ifndef ZEUS_VALIDATOR_SCORING_ENGINE_H
#define ZEUS_VALIDATOR_SCORING_ENGINE_H

#include "zeus/validator/miner_record.h"
#include "zeus/validator/outcome.h"
#include "zeus/validator/params.h"

#include <string>
#include <vector>

namespace zeus {

namespace util {
class JSONValue;
}

namespace validator {

namespace BonusName {
    constexpr const char* SPEED = "speed";
    constexpr const char* EFFICIENCY = "efficiency";
    constexpr const char* HIGH_DIFFICULTY = "high_difficulty";
    constexpr const char* EFFICIENCY_TEST = "efficiency_test";
    constexpr const char* HISTORICAL = "historical";
    constexpr const char* CONSISTENCY = "consistency";
    constexpr const char* EARLY_DETECTION = "early_detection";
}

/// Score for one challenge outcome with its audit breakdown
struct Score {
    struct Bonus {
        std::string name;
        double value{0.0};
    };
    
    std::string challengeId;
    MinerId minerId;
    VerificationResult result{VerificationResult::Expired};
    double base{0.0};
    /// Bonuses that applied, in evaluation order
    std::vector<Bonus> bonuses;
    /// base + bonuses, clamped to [0, capTotal]
    double final{0.0};
    bool capped{false};
    
    /// Value of a named bonus; 0 if it did not apply
    double BonusValue(const std::string& name) const;
    bool HasBonus(const std::string& name) const;
    double BonusTotal() const;
    
    util::JSONValue ToJSON() const;
    std::string ToString() const;
};

/// challenge count in (0, newMinerThreshold) and observed success >= performanceThreshold
bool QualifiesForEarlyDetection(const MinerRecord& record, const ValidatorConfig& config);

class ScoringEngine {
public:
    explicit ScoringEngine(const ValidatorConfig& config) : config_(config) {}
    
    /**
     * Score an outcome.
     * @param outcome Verification result for the challenge
     * @param snapshot The miner's record before this outcome is folded in
     */
    Score Evaluate(const ChallengeOutcome& outcome, const MinerRecord& snapshot) const;
    
    const ValidatorConfig& Config() const { return config_; }

private:
    ValidatorConfig config_;
};

} // namespace validator
} // namespace zeus

#endif // ZEUS_VALIDATOR_SCORING_ENGINE_H
