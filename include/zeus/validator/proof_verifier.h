// ZEUS - Proof Verification
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// The challenge ledger tracks every issued challenge through its state
// machine; the verifier checks a submitted proof against it.

#ifndef ZEUS_VALIDATOR_PROOF_VERIFIER_H
#define ZEUS_VALIDATOR_PROOF_VERIFIER_H

#include "zeus/protocol/challenge.h"
#include "zeus/validator/outcome.h"
#include "zeus/validator/params.h"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace zeus {
namespace validator {

// ============================================================================
// Challenge Ledger
// ============================================================================

struct LedgerEntry {
    protocol::Challenge challenge;
    MinerId minerId;
    ChallengeState state{ChallengeState::Issued};
    TimestampMs resolvedAt{0};
    
    /// Outcome record for this entry
    ChallengeOutcome ToOutcome(VerificationResult result, int64_t elapsedMs,
                               TimestampMs at) const;
};

/**
 * Thread-safe registry of live challenges.
 *
 * Entries in a terminal state are kept for retentionMs past deadline + grace
 * so that replays can be told apart from unknown ids, then pruned.
 */
class ChallengeLedger {
public:
    explicit ChallengeLedger(int64_t graceMs, int64_t retentionMs = 60000)
        : graceMs_(graceMs), retentionMs_(retentionMs) {}
    
    /// Register a new challenge for a miner. False if the id is already known.
    bool Issue(const protocol::Challenge& challenge, const MinerId& minerId);
    
    /// Issued -> AwaitingProof
    bool MarkDispatched(const std::string& challengeId);
    
    std::optional<LedgerEntry> Get(const std::string& challengeId) const;
    
    /**
     * Move a live entry to a terminal state.
     * @return The state before the call (nullopt if unknown). The transition
     *         happened only if that state was Issued or AwaitingProof.
     */
    std::optional<ChallengeState> Resolve(const std::string& challengeId,
                                          ChallengeState newState, TimestampMs now);
    
    /// Expire one live entry now (miner reported no solution or was unreachable)
    std::optional<LedgerEntry> Expire(const std::string& challengeId, TimestampMs now);
    
    /// Expire every live entry whose deadline + grace has passed
    std::vector<LedgerEntry> ExpireDue(TimestampMs now);
    
    /// Drop terminal entries older than deadline + grace + retention
    size_t Prune(TimestampMs now);
    
    size_t Size() const;
    size_t CountInState(ChallengeState state) const;
    int64_t GraceMs() const { return graceMs_; }

private:
    int64_t graceMs_;
    int64_t retentionMs_;
    
    mutable std::mutex mutex_;
    std::map<std::string, LedgerEntry> entries_;
};

// ============================================================================
// Verification Details
// ============================================================================

/// Verdict plus the named checks that produced it
class VerificationDetails {
public:
    struct Check {
        std::string name;
        bool passed{false};
        std::string detail;
    };
    
    VerificationResult result{VerificationResult::Stale};
    std::string reason;
    int64_t elapsedMs{0};
    /// Filled when the challenge was found
    std::optional<LedgerEntry> entry;
    std::vector<Check> checks;
    
    bool IsAccepted() const { return result == VerificationResult::Accepted; }
    
    /// Record a check; returns passed
    bool AddCheck(const std::string& name, bool passed, const std::string& detail = "");
    
    /// Set the verdict; returns IsAccepted()
    bool Finish(VerificationResult verdict, const std::string& why = "");
    
    std::string ToString() const;
};

// ============================================================================
// Proof Verifier
// ============================================================================

/**
 * Checks, in order:
 *  1. challenge known, owned by the submitting miner and still live (Stale)
 *  2. not already accepted for this miner (Duplicate)
 *  3. submittedAt <= issuedAt + timeout + grace (Late)
 *  4. hash(payload, nonce) <= difficulty_target (Invalid)
 * The matching ledger transition is applied atomically with the verdict.
 */
class ProofVerifier {
public:
    ProofVerifier(ChallengeLedger& ledger, const ValidatorConfig& config)
        : ledger_(ledger), graceMs_(config.graceMs) {}
    
    VerificationDetails Verify(const protocol::Proof& proof, const MinerId& minerId);

private:
    /// Commit the state change; downgrades to Duplicate/Stale if another proof won
    void Commit(VerificationDetails& details, const protocol::Proof& proof,
                VerificationResult verdict, const std::string& why);
    
    ChallengeLedger& ledger_;
    int64_t graceMs_;
};

} // namespace validator
} // namespace zeus

#endif // ZEUS_VALIDATOR_PROOF_VERIFIER_H
