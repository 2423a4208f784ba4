// ZEUS - Challenge Outcomes
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// Lifecycle states of an issued challenge and the outcome record that flows
// from the verifier into scoring and the per-miner statistics.

#ifndef ZEUS_VALIDATOR_OUTCOME_H
#define ZEUS_VALIDATOR_OUTCOME_H

#include "zeus/protocol/challenge.h"

#include <string>

namespace zeus {
namespace validator {

// ============================================================================
// Challenge State Machine
// ============================================================================

/**
 * Issued -> AwaitingProof -> {Accepted | Rejected* } on a proof, or
 * Issued -> AwaitingProof -> Expired once deadline + grace passes.
 * Every state after AwaitingProof is terminal.
 */
enum class ChallengeState {
    Issued,
    AwaitingProof,
    Accepted,
    RejectedInvalid,
    RejectedLate,
    RejectedStale,
    RejectedDuplicate,
    Expired
};

const char* ChallengeStateToString(ChallengeState state);

inline bool IsTerminal(ChallengeState state) {
    return state != ChallengeState::Issued && state != ChallengeState::AwaitingProof;
}

// ============================================================================
// Verification Result
// ============================================================================

enum class VerificationResult {
    Accepted,
    Invalid,
    Late,
    Stale,
    Duplicate,
    /// No proof before deadline + grace (or the miner gave up)
    Expired
};

const char* VerificationResultToString(VerificationResult result);

// ============================================================================
// Challenge Outcome
// ============================================================================

/// Everything the statistics and scoring need to know about one attempt
struct ChallengeOutcome {
    std::string challengeId;
    MinerId minerId;
    protocol::ChallengeClass challengeClass{protocol::ChallengeClass::Standard};
    uint32_t difficultyTarget{0};
    VerificationResult result{VerificationResult::Expired};
    /// submitted_at - issued_at; 0 when nothing was submitted
    int64_t elapsedMs{0};
    TimestampMs at{0};
    
    bool IsAccepted() const { return result == VerificationResult::Accepted; }
    
    /// A proof message was received for this attempt
    bool WasSubmitted() const { return result != VerificationResult::Expired; }
    
    /// Stale and duplicate proofs do not belong to a live challenge; they count
    /// against the error rate but not as a challenge attempt
    bool CountsAsChallenge() const {
        return result != VerificationResult::Stale && result != VerificationResult::Duplicate;
    }
};

} // namespace validator
} // namespace zeus

#endif // ZEUS_VALIDATOR_OUTCOME_H
