// ZEUS - Scoring Engine Implementation
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include "zeus/validator/scoring_engine.h"
#include "zeus/util/json.h"
#include "zeus/util/logging.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace zeus {
namespace validator {

// ============================================================================
// Score
// ============================================================================

double Score::BonusValue(const std::string& name) const {
    for (const auto& b : bonuses) {
        if (b.name == name) return b.value;
    }
    return 0.0;
}

bool Score::HasBonus(const std::string& name) const {
    for (const auto& b : bonuses) {
        if (b.name == name) return true;
    }
    return false;
}

double Score::BonusTotal() const {
    double sum = 0.0;
    for (const auto& b : bonuses) {
        sum += b.value;
    }
    return sum;
}

util::JSONValue Score::ToJSON() const {
    util::JSONValue obj;
    obj["challenge_id"] = challengeId;
    obj["miner_id"] = minerId;
    obj["result"] = VerificationResultToString(result);
    obj["base"] = base;
    util::JSONValue breakdown{util::JSONValue::Object{}};
    for (const auto& b : bonuses) {
        breakdown[b.name] = b.value;
    }
    obj["bonuses"] = std::move(breakdown);
    obj["final"] = final;
    obj["capped"] = capped;
    return obj;
}

std::string Score::ToString() const {
    std::ostringstream ss;
    ss << "Score(" << minerId << ", " << VerificationResultToString(result)
       << ", base=" << base;
    for (const auto& b : bonuses) {
        ss << ", " << b.name << "=" << b.value;
    }
    ss << ", final=" << final << (capped ? " capped" : "") << ")";
    return ss.str();
}

// ============================================================================
// Scoring
// ============================================================================

bool QualifiesForEarlyDetection(const MinerRecord& record, const ValidatorConfig& config) {
    return record.challengeCount > 0 &&
           record.challengeCount < config.newMinerThreshold &&
           record.ObservedSuccessRate() >= config.performanceThreshold;
}

Score ScoringEngine::Evaluate(const ChallengeOutcome& outcome,
                              const MinerRecord& snapshot) const {
    Score score;
    score.challengeId = outcome.challengeId;
    score.minerId = outcome.minerId;
    score.result = outcome.result;
    
    if (!outcome.IsAccepted()) {
        return score;
    }
    
    score.base = 1.0;
    auto add = [&score](const char* name, double value) {
        if (value > 0.0) {
            score.bonuses.push_back({name, value});
        }
    };
    
    const double elapsed = static_cast<double>(std::max<int64_t>(outcome.elapsedMs, 0));
    
    // Linear from speedBonusMax at 0ms down to 0 at the threshold
    const double threshold = static_cast<double>(config_.speedThresholdMs);
    if (elapsed < threshold) {
        add(BonusName::SPEED, config_.speedBonusMax * (threshold - elapsed) / threshold);
    }
    
    const double ratio = snapshot.acceptRate;
    if (snapshot.submittedCount > 0 && ratio > config_.efficiencyTarget) {
        add(BonusName::EFFICIENCY, config_.efficiencyBonusMax *
            (ratio - config_.efficiencyTarget) / (1.0 - config_.efficiencyTarget));
    }
    
    if (outcome.challengeClass == protocol::ChallengeClass::HighDifficulty) {
        add(BonusName::HIGH_DIFFICULTY, config_.highDifficultyBonus);
    }
    
    if (outcome.challengeClass == protocol::ChallengeClass::EfficiencyTest) {
        double factor = elapsed > 0.0 ? std::min(1000.0 / elapsed, 10.0) : 10.0;
        add(BonusName::EFFICIENCY_TEST, config_.efficiencyTestBonusMax * factor / 10.0);
    }
    
    if (snapshot.challengeCount >= config_.trackingPeriod &&
        snapshot.successRate.Slow() > config_.highPerformerThreshold) {
        add(BonusName::HISTORICAL, config_.historicalBonus);
    }
    
    if (snapshot.responseSamples >= 2 &&
        snapshot.responseVarianceMs2 < config_.stabilityVariance &&
        snapshot.successRate.Divergence() <= config_.trendTolerance) {
        add(BonusName::CONSISTENCY, config_.consistencyBonus);
    }
    
    if (QualifiesForEarlyDetection(snapshot, config_)) {
        add(BonusName::EARLY_DETECTION, config_.earlyDetectionBonus);
    }
    
    double total = score.base + score.BonusTotal();
    score.final = std::clamp(total, 0.0, config_.capTotal);
    score.capped = score.final < total;
    
    LOG_TRACE(util::LogCategory::SCORE) << score.ToString();
    return score;
}

} // namespace validator
} // namespace zeus
