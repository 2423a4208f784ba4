// ZEUS - Validator Implementation
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include "zeus/validator/validator.h"
#include "zeus/util/logging.h"

#include <filesystem>

namespace zeus {
namespace validator {

Validator::Validator(const ValidatorConfig& config, IMinerTransport& transport,
                     util::ThreadPool& pool, RandomSource& rng,
                     CheckpointStore* checkpoints, std::string dataDir)
    : config_(config)
    , transport_(transport)
    , pool_(pool)
    , checkpoints_(checkpoints)
    , dataDir_(std::move(dataDir))
    , generator_(config_, rng)
    , controller_(config_)
    , ledger_(config_.graceMs)
    , verifier_(ledger_, config_)
    , scoring_(config_)
    , aggregator_(config_)
    , registry_(pool_, controller_)
    , scheduler_(pool_) {}

Validator::~Validator() {
    Stop();
}

bool Validator::AddMiner(const MinerEndpoint& endpoint) {
    return registry_.Add(endpoint, GetTimeMillis());
}

size_t Validator::Restore() {
    if (!checkpoints_) {
        return 0;
    }
    std::vector<MinerRecord> records;
    if (!checkpoints_->Load(records).ok()) {
        return 0;
    }
    registry_.Restore(records);
    epoch_ = checkpoints_->LoadEpoch();
    return records.size();
}

void Validator::SetScoreObserver(ScoreObserver observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observer_ = std::move(observer);
}

std::optional<WeightVector> Validator::LastWeights() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastWeights_;
}

// ============================================================================
// Outcomes
// ============================================================================

void Validator::RecordOutcome(const ChallengeOutcome& outcome) {
    registry_.Post(outcome.minerId, [this, outcome](MinerRecord& record) {
        Score score = scoring_.Evaluate(outcome, record);
        controller_.RecordOutcome(record, outcome);
        if (outcome.CountsAsChallenge()) {
            record.epochScoreSum += score.final;
            ++record.epochScoreCount;
        }
        
        LOG_DEBUG(util::LogCategory::SCORE) << score.ToString();
        
        ScoreObserver observer;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            observer = observer_;
        }
        if (observer) {
            observer(score);
        }
    });
}

VerificationResult Validator::ProcessMiner(const MinerEndpoint& endpoint) {
    auto snapshot = registry_.Snapshot(endpoint.id);
    if (!snapshot) {
        return VerificationResult::Stale;
    }
    
    protocol::Challenge challenge = generator_.Generate(snapshot->difficulty.target, GetTimeMillis());
    if (!ledger_.Issue(challenge, endpoint.id)) {
        LOG_ERROR(util::LogCategory::CHALLENGE) << "Challenge id collision for " << endpoint.id;
        return VerificationResult::Stale;
    }
    ledger_.MarkDispatched(challenge.id);
    LOG_DEBUG(util::LogCategory::CHALLENGE) << "Dispatching "
                                            << protocol::ChallengeClassToString(challenge.challengeClass)
                                            << " challenge " << challenge.id.substr(0, 16)
                                            << " to " << endpoint.id;
    
    TransportResult tr = transport_.Exchange(endpoint, challenge);
    VerificationResult ours = VerificationResult::Expired;
    
    if (tr.HasReply() && tr.reply.kind == protocol::MinerReply::Kind::Proof) {
        protocol::Proof proof = tr.reply.proof;
        proof.submittedAt = tr.receivedAt;
        VerificationDetails details = verifier_.Verify(proof, endpoint.id);
        
        ChallengeOutcome outcome;
        if (details.entry) {
            outcome = details.entry->ToOutcome(details.result, details.elapsedMs, proof.submittedAt);
        } else {
            outcome.challengeId = proof.challengeId;
            outcome.minerId = endpoint.id;
            outcome.result = details.result;
            outcome.at = proof.submittedAt;
        }
        RecordOutcome(outcome);
        if (proof.challengeId == challenge.id) {
            ours = details.result;
        }
    } else if (tr.HasReply()) {
        LOG_DEBUG(util::LogCategory::CHALLENGE) << endpoint.id << " reported no solution for "
                                                << challenge.id.substr(0, 16);
    } else {
        LOG_DEBUG(util::LogCategory::NET) << endpoint.id << ": " << TransportStatusToString(tr.status)
                                          << (tr.error.empty() ? "" : " (" + tr.error + ")");
    }
    
    // Anything still live for this attempt is finished: no retries
    TimestampMs now = GetTimeMillis();
    if (auto entry = ledger_.Expire(challenge.id, now)) {
        RecordOutcome(entry->ToOutcome(VerificationResult::Expired, 0, now));
        ours = VerificationResult::Expired;
    }
    return ours;
}

// ============================================================================
// Rounds and Epochs
// ============================================================================

RoundStats Validator::RunRound() {
    RoundStats stats;
    std::vector<MinerEndpoint> endpoints = registry_.Endpoints();
    std::vector<VerificationResult> results(endpoints.size(), VerificationResult::Expired);
    
    util::TaskGroup group(pool_);
    for (size_t i = 0; i < endpoints.size(); ++i) {
        group.Add([this, &endpoints, &results, i]() {
            results[i] = ProcessMiner(endpoints[i]);
        });
    }
    try {
        group.Wait();
    } catch (const std::exception& e) {
        LOG_ERROR(util::LogCategory::DEFAULT) << "Round task failed: " << e.what();
    }
    
    stats.round = ++round_;
    stats.dispatched = endpoints.size();
    for (VerificationResult r : results) {
        if (r == VerificationResult::Accepted) ++stats.accepted;
        else if (r == VerificationResult::Expired) ++stats.expired;
        else ++stats.rejected;
    }
    
    LOG_INFO(util::LogCategory::CHALLENGE) << "Round " << stats.round << ": " << stats.accepted
                                           << "/" << stats.dispatched << " accepted, "
                                           << stats.rejected << " rejected, "
                                           << stats.expired << " expired";
    
    if (config_.epochRounds > 0 && stats.round % config_.epochRounds == 0) {
        RunEpoch();
    }
    return stats;
}

WeightVector Validator::RunEpoch() {
    const uint64_t epoch = ++epoch_;
    WeightVector weights;
    ZEUS_LOG_TIMER(util::LogCategory::WEIGHTS, "epoch " + std::to_string(epoch));
    registry_.WithAllRecords([&](std::vector<MinerRecord*>& records) {
        weights = aggregator_.Aggregate(records, epoch);
    });
    
    if (!dataDir_.empty()) {
        std::string path = (std::filesystem::path(dataDir_) / "weights.json").string();
        std::string error;
        if (weights.WriteFile(path, error)) {
            LOG_INFO(util::LogCategory::WEIGHTS) << "Exported epoch " << epoch << " weights to " << path;
        } else {
            LOG_ERROR(util::LogCategory::WEIGHTS) << "Weight export failed: " << error;
        }
    }
    if (checkpoints_) {
        db::Status s = checkpoints_->SaveWeights(weights);
        if (!s.ok()) {
            LOG_WARN(util::LogCategory::DB) << "Could not store weights: " << s.ToString();
        }
    }
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        lastWeights_ = weights;
    }
    Checkpoint();
    return weights;
}

size_t Validator::SweepExpired(TimestampMs now) {
    std::vector<LedgerEntry> expired = ledger_.ExpireDue(now);
    for (const LedgerEntry& entry : expired) {
        RecordOutcome(entry.ToOutcome(VerificationResult::Expired, 0, now));
    }
    size_t pruned = ledger_.Prune(now);
    if (!expired.empty() || pruned > 0) {
        LOG_DEBUG(util::LogCategory::VERIFY) << "Sweep: " << expired.size() << " expired, "
                                             << pruned << " pruned";
    }
    return expired.size();
}

bool Validator::Checkpoint() {
    if (!checkpoints_) {
        return false;
    }
    return checkpoints_->Save(registry_.SnapshotAll(), epoch_.load()).ok();
}

// ============================================================================
// Background Tasks
// ============================================================================

void Validator::Start() {
    if (scheduler_.IsRunning()) {
        return;
    }
    scheduler_.Start();
    // Expiry runs ahead of queued miner work so deadlines are not held up by it
    scheduler_.SchedulePeriodic(std::chrono::milliseconds(1000), std::chrono::milliseconds(1000),
                                [this]() { SweepExpired(GetTimeMillis()); },
                                util::TaskPriority::High);
    if (checkpoints_ && config_.checkpointIntervalSec > 0) {
        auto interval = std::chrono::milliseconds(config_.checkpointIntervalSec * 1000);
        scheduler_.SchedulePeriodic(interval, interval, [this]() { Checkpoint(); },
                                    util::TaskPriority::Low);
    }
    LOG_INFO(util::LogCategory::DEFAULT) << "Validator started with " << registry_.Size() << " miners";
}

void Validator::Stop() {
    if (scheduler_.IsRunning()) {
        scheduler_.CancelAll();
        scheduler_.Stop();
    }
    registry_.DrainAll();
}

} // namespace validator
} // namespace zeus
