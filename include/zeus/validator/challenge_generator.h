// ZEUS - Challenge Generator
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// Draws a challenge class from the configured distribution and builds a
// fresh, single-use challenge for one miner.

#ifndef ZEUS_VALIDATOR_CHALLENGE_GENERATOR_H
#define ZEUS_VALIDATOR_CHALLENGE_GENERATOR_H

#include "zeus/core/random.h"
#include "zeus/protocol/challenge.h"
#include "zeus/validator/params.h"

#include <array>
#include <mutex>

namespace zeus {
namespace validator {

/**
 * Challenge factory.
 *
 * The class distribution is held as a cumulative draw table that is rebuilt
 * whenever the weights change. All randomness comes from the RandomSource
 * passed at construction, which must outlive the generator.
 */
class ChallengeGenerator {
public:
    using DrawTable = std::array<double, protocol::NUM_CHALLENGE_CLASSES>;
    
    ChallengeGenerator(const ValidatorConfig& config, RandomSource& rng);
    
    /// Replace the class distribution (renormalized)
    void SetClassWeights(const ValidatorConfig::ClassWeights& weights);
    
    /// Cumulative probabilities; last entry is 1
    DrawTable GetDrawTable() const;
    
    /// Weighted class draw
    protocol::ChallengeClass DrawClass();
    
    /// Draw a class and build a challenge for a miner currently at minerTarget
    protocol::Challenge Generate(uint32_t minerTarget, TimestampMs now);
    
    /// Build a challenge of the given class
    protocol::Challenge Generate(protocol::ChallengeClass cls, uint32_t minerTarget,
                                 TimestampMs now);

private:
    void RebuildTable(const ValidatorConfig::ClassWeights& weights);
    
    RandomSource& rng_;
    uint32_t minDifficulty_;
    uint32_t maxDifficulty_;
    protocol::PowAlgorithm algorithm_;
    
    mutable std::mutex mutex_;
    DrawTable cumulative_{};
};

} // namespace validator
} // namespace zeus

#endif // ZEUS_VALIDATOR_CHALLENGE_GENERATOR_H
