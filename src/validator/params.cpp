// ZEUS - Validator Parameters Implementation
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include "zeus/validator/params.h"
#include "zeus/util/config.h"
#include "zeus/util/logging.h"

#include <cmath>

namespace zeus {
namespace validator {

std::vector<std::string> ValidatorConfig::Validate() const {
    std::vector<std::string> problems;
    
    if (!(alphaLow > 0.0 && alphaLow < alphaHigh && alphaHigh < 1.0)) {
        problems.push_back("require 0 < alphalow < alphahigh < 1");
    }
    if (trackingPeriod < 1) {
        problems.push_back("trackingperiod must be at least 1");
    }
    if (consensusWeightThreshold < 0.0 || consensusWeightThreshold > 1.0) {
        problems.push_back("consensusweightthreshold must lie in [0, 1]");
    }
    if (performanceThreshold < 0.0 || performanceThreshold > 1.0) {
        problems.push_back("performancethreshold must lie in [0, 1]");
    }
    if (bondAggressiveness < 0.0) {
        problems.push_back("bondaggressiveness must not be negative");
    }
    
    double sum = 0.0;
    for (double w : classWeights) {
        if (w < 0.0 || !std::isfinite(w)) {
            problems.push_back("class weights must be finite and non-negative");
            break;
        }
        sum += w;
    }
    if (sum <= 0.0) {
        problems.push_back("at least one class weight must be positive");
    }
    
    if (minDifficulty == 0 || minDifficulty > maxDifficulty) {
        problems.push_back("require 0 < mindifficulty <= maxdifficulty");
    } else if (baseDifficulty < minDifficulty || baseDifficulty > maxDifficulty) {
        problems.push_back("basedifficulty must lie in [mindifficulty, maxdifficulty]");
    }
    if (!(adjustmentFactor > 1.0)) {
        problems.push_back("adjustmentfactor must be greater than 1");
    }
    if (!(lowBand >= 0.0 && lowBand < highBand && highBand <= 1.0)) {
        problems.push_back("require 0 <= lowband < highband <= 1");
    }
    
    if (graceMs < 0) {
        problems.push_back("gracems must not be negative");
    }
    if (speedThresholdMs <= 0) {
        problems.push_back("speedthresholdms must be positive");
    }
    if (!(efficiencyTarget >= 0.0 && efficiencyTarget < 1.0)) {
        problems.push_back("efficiencytarget must lie in [0, 1)");
    }
    if (capTotal <= 0.0) {
        problems.push_back("captotal must be positive");
    }
    if (weightTotal <= 0.0) {
        problems.push_back("weighttotal must be positive");
    }
    if (epochRounds < 1) {
        problems.push_back("epochrounds must be at least 1");
    }
    
    return problems;
}

void ValidatorConfig::NormalizeClassWeights() {
    double sum = 0.0;
    for (double& w : classWeights) {
        if (w < 0.0 || !std::isfinite(w)) w = 0.0;
        sum += w;
    }
    if (sum <= 0.0) {
        classWeights.fill(1.0 / protocol::NUM_CHALLENGE_CLASSES);
        return;
    }
    if (std::fabs(sum - 1.0) > 1e-9) {
        LOG_WARN(util::LogCategory::CHALLENGE) << "Class weights sum to " << sum << "; renormalizing";
    }
    for (double& w : classWeights) {
        w /= sum;
    }
}

ValidatorConfig ValidatorConfig::FromConfig(const util::ConfigManager& config) {
    using namespace util;
    const std::string section = ConfigSection::VALIDATOR;
    ValidatorConfig c;
    
    c.alphaLow = config.GetDouble(ConfigKeys::ALPHALOW, c.alphaLow, section);
    c.alphaHigh = config.GetDouble(ConfigKeys::ALPHAHIGH, c.alphaHigh, section);
    c.trackingPeriod = static_cast<uint32_t>(
        config.GetUInt(ConfigKeys::TRACKINGPERIOD, c.trackingPeriod, section));
    
    c.consensusWeightThreshold = config.GetDouble(ConfigKeys::CONSENSUSWEIGHTTHRESHOLD,
                                                  c.consensusWeightThreshold, section);
    c.newMinerThreshold = static_cast<uint32_t>(
        config.GetUInt(ConfigKeys::NEWMINERTHRESHOLD, c.newMinerThreshold, section));
    c.performanceThreshold = config.GetDouble(ConfigKeys::PERFORMANCETHRESHOLD,
                                              c.performanceThreshold, section);
    c.bondAggressiveness = config.GetDouble(ConfigKeys::BONDAGGRESSIVENESS,
                                            c.bondAggressiveness, section);
    c.earlyDetectionBonus = config.GetDouble(ConfigKeys::EARLYDETECTIONBONUS,
                                             c.earlyDetectionBonus, section);
    c.weightTotal = config.GetDouble(ConfigKeys::WEIGHTTOTAL, c.weightTotal, section);
    
    c.classWeights[0] = config.GetDouble(ConfigKeys::WEIGHTSTANDARD, c.classWeights[0], section);
    c.classWeights[1] = config.GetDouble(ConfigKeys::WEIGHTHIGH, c.classWeights[1], section);
    c.classWeights[2] = config.GetDouble(ConfigKeys::WEIGHTTIMEPRESSURE, c.classWeights[2], section);
    c.classWeights[3] = config.GetDouble(ConfigKeys::WEIGHTEFFICIENCY, c.classWeights[3], section);
    
    std::string algo = config.GetString(ConfigKeys::POWALGORITHM, "scrypt", section);
    if (auto parsed = protocol::PowAlgorithmFromString(algo)) {
        c.algorithm = *parsed;
    } else {
        LOG_WARN(LogCategory::DEFAULT) << "Unknown powalgorithm '" << algo << "', using scrypt";
    }
    
    c.baseDifficulty = static_cast<uint32_t>(
        config.GetUInt(ConfigKeys::BASEDIFFICULTY, c.baseDifficulty, section));
    c.minDifficulty = static_cast<uint32_t>(
        config.GetUInt(ConfigKeys::MINDIFFICULTY, c.minDifficulty, section));
    c.maxDifficulty = static_cast<uint32_t>(
        config.GetUInt(ConfigKeys::MAXDIFFICULTY, c.maxDifficulty, section));
    c.adjustmentFactor = config.GetDouble(ConfigKeys::ADJUSTMENTFACTOR, c.adjustmentFactor, section);
    c.highBand = config.GetDouble(ConfigKeys::HIGHBAND, c.highBand, section);
    c.lowBand = config.GetDouble(ConfigKeys::LOWBAND, c.lowBand, section);
    
    c.graceMs = config.GetInt(ConfigKeys::GRACEMS, c.graceMs, section);
    c.speedThresholdMs = config.GetInt(ConfigKeys::SPEEDTHRESHOLDMS, c.speedThresholdMs, section);
    c.efficiencyTarget = config.GetDouble(ConfigKeys::EFFICIENCYTARGET, c.efficiencyTarget, section);
    c.highPerformerThreshold = config.GetDouble(ConfigKeys::HIGHPERFORMER,
                                                c.highPerformerThreshold, section);
    c.stabilityVariance = config.GetDouble(ConfigKeys::STABILITYVARIANCE,
                                           c.stabilityVariance, section);
    c.trendTolerance = config.GetDouble(ConfigKeys::TRENDTOLERANCE, c.trendTolerance, section);
    c.capTotal = config.GetDouble(ConfigKeys::CAPTOTAL, c.capTotal, section);
    
    c.epochRounds = static_cast<uint32_t>(
        config.GetUInt(ConfigKeys::EPOCHROUNDS, c.epochRounds, section));
    c.checkpointIntervalSec = config.GetInt(ConfigKeys::CHECKPOINTINTERVAL,
                                            c.checkpointIntervalSec, section);
    c.roundIntervalMs = config.GetInt(ConfigKeys::ROUNDINTERVAL, c.roundIntervalMs, section);
    
    c.NormalizeClassWeights();
    return c;
}

} // namespace validator
} // namespace zeus
