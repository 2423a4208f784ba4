// ZEUS - Challenge Generator Implementation
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include "zeus/validator/challenge_generator.h"
#include "zeus/protocol/pow.h"
#include "zeus/util/logging.h"

namespace zeus {
namespace validator {

using protocol::Challenge;
using protocol::ChallengeClass;

ChallengeGenerator::ChallengeGenerator(const ValidatorConfig& config, RandomSource& rng)
    : rng_(rng)
    , minDifficulty_(config.minDifficulty)
    , maxDifficulty_(config.maxDifficulty)
    , algorithm_(config.algorithm) {
    RebuildTable(config.classWeights);
}

void ChallengeGenerator::SetClassWeights(const ValidatorConfig::ClassWeights& weights) {
    RebuildTable(weights);
}

void ChallengeGenerator::RebuildTable(const ValidatorConfig::ClassWeights& weights) {
    ValidatorConfig normalized;
    normalized.classWeights = weights;
    normalized.NormalizeClassWeights();
    
    DrawTable table{};
    double running = 0.0;
    for (size_t i = 0; i < table.size(); ++i) {
        running += normalized.classWeights[i];
        table[i] = running;
    }
    table.back() = 1.0;
    
    std::lock_guard<std::mutex> lock(mutex_);
    cumulative_ = table;
}

ChallengeGenerator::DrawTable ChallengeGenerator::GetDrawTable() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cumulative_;
}

ChallengeClass ChallengeGenerator::DrawClass() {
    DrawTable table = GetDrawTable();
    double u = rng_.NextDouble();
    for (size_t i = 0; i < table.size(); ++i) {
        if (u < table[i]) {
            return protocol::ALL_CHALLENGE_CLASSES[i];
        }
    }
    return protocol::ALL_CHALLENGE_CLASSES[table.size() - 1];
}

Challenge ChallengeGenerator::Generate(uint32_t minerTarget, TimestampMs now) {
    return Generate(DrawClass(), minerTarget, now);
}

Challenge ChallengeGenerator::Generate(ChallengeClass cls, uint32_t minerTarget,
                                       TimestampMs now) {
    const protocol::ClassProfile& profile = protocol::GetClassProfile(cls);
    
    Challenge c;
    c.challengeClass = cls;
    c.difficultyTarget = protocol::ApplyClassModifier(minerTarget, cls,
                                                      minDifficulty_, maxDifficulty_);
    c.timeoutSec = profile.timeoutSec;
    c.issuedAt = now;
    c.algorithm = algorithm_;
    c.payload = protocol::BuildHeaderTemplate(c.difficultyTarget, now / 1000, rng_);
    c.id = protocol::ComputeChallengeId(c.payload, c.difficultyTarget, c.issuedAt);
    
    LOG_TRACE(util::LogCategory::CHALLENGE) << "Generated " << protocol::ChallengeClassToString(cls)
                                            << " challenge " << c.id.substr(0, 16)
                                            << " target=0x" << std::hex << c.difficultyTarget;
    return c;
}

} // namespace validator
} // namespace zeus
