// ZEUS - Validator
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// Round and epoch orchestration: challenge every registered miner, verify
// and score the replies, aggregate weights once per epoch, sweep expired
// challenges and checkpoint miner records.

#ifndef ZEUS_VALIDATOR_VALIDATOR_H
#define ZEUS_VALIDATOR_VALIDATOR_H

#include "zeus/core/random.h"
#include "zeus/util/threadpool.h"
#include "zeus/validator/challenge_generator.h"
#include "zeus/validator/checkpoint.h"
#include "zeus/validator/difficulty_controller.h"
#include "zeus/validator/miner_registry.h"
#include "zeus/validator/proof_verifier.h"
#include "zeus/validator/scoring_engine.h"
#include "zeus/validator/transport.h"
#include "zeus/validator/weight_aggregator.h"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace zeus {
namespace validator {

/// Counters for one round
struct RoundStats {
    uint64_t round{0};
    size_t dispatched{0};
    size_t accepted{0};
    size_t rejected{0};
    size_t expired{0};
};

class Validator {
public:
    /// Called with every score once it has been recorded
    using ScoreObserver = std::function<void(const Score&)>;
    
    /**
     * @param transport   Challenge delivery; must outlive the validator
     * @param pool        Runs round tasks, miner queues and the scheduler
     * @param rng         Source for challenge payloads and class draws
     * @param checkpoints Optional record persistence (may be nullptr)
     * @param dataDir     Directory for weights.json (empty disables export)
     */
    Validator(const ValidatorConfig& config, IMinerTransport& transport,
              util::ThreadPool& pool, RandomSource& rng,
              CheckpointStore* checkpoints, std::string dataDir);
    ~Validator();
    
    Validator(const Validator&) = delete;
    Validator& operator=(const Validator&) = delete;
    
    bool AddMiner(const MinerEndpoint& endpoint);
    
    /// Load checkpointed records and the epoch counter; number of records
    size_t Restore();
    
    /// Challenge every miner once; runs the epoch pass every epochRounds rounds
    RoundStats RunRound();
    
    /// Single-writer aggregation, weight export and checkpoint
    WeightVector RunEpoch();
    
    /// Expire overdue challenges and record them as failures
    size_t SweepExpired(TimestampMs now);
    
    /// Persist all records now
    bool Checkpoint();
    
    /// Start periodic sweeps and checkpoints
    void Start();
    void Stop();
    
    void SetScoreObserver(ScoreObserver observer);
    
    uint64_t Round() const { return round_.load(); }
    uint64_t Epoch() const { return epoch_.load(); }
    std::optional<WeightVector> LastWeights() const;
    
    MinerRegistry& Registry() { return registry_; }
    const ChallengeLedger& Ledger() const { return ledger_; }
    const ValidatorConfig& Config() const { return config_; }

private:
    /// Issue, dispatch, verify; returns the verdict for our challenge
    VerificationResult ProcessMiner(const MinerEndpoint& endpoint);
    
    /// Score and fold the outcome on the miner's queue
    void RecordOutcome(const ChallengeOutcome& outcome);
    
    ValidatorConfig config_;
    IMinerTransport& transport_;
    util::ThreadPool& pool_;
    CheckpointStore* checkpoints_;
    std::string dataDir_;
    
    ChallengeGenerator generator_;
    DifficultyController controller_;
    ChallengeLedger ledger_;
    ProofVerifier verifier_;
    ScoringEngine scoring_;
    WeightAggregator aggregator_;
    MinerRegistry registry_;
    util::Scheduler scheduler_;
    
    std::atomic<uint64_t> round_{0};
    std::atomic<uint64_t> epoch_{0};
    
    mutable std::mutex mutex_;
    std::optional<WeightVector> lastWeights_;
    ScoreObserver observer_;
};

} // namespace validator
} // namespace zeus

#endif // ZEUS_VALIDATOR_VALIDATOR_H
