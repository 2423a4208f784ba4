// ZEUS - Proof Verification Implementation
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include "zeus/validator/proof_verifier.h"
#include "zeus/protocol/pow.h"
#include "zeus/util/logging.h"

#include <sstream>

namespace zeus {
namespace validator {

using protocol::Challenge;
using protocol::Proof;

// ============================================================================
// Names
// ============================================================================

const char* ChallengeStateToString(ChallengeState state) {
    switch (state) {
        case ChallengeState::Issued:            return "issued";
        case ChallengeState::AwaitingProof:     return "awaiting-proof";
        case ChallengeState::Accepted:          return "accepted";
        case ChallengeState::RejectedInvalid:   return "rejected-invalid";
        case ChallengeState::RejectedLate:      return "rejected-late";
        case ChallengeState::RejectedStale:     return "rejected-stale";
        case ChallengeState::RejectedDuplicate: return "rejected-duplicate";
        case ChallengeState::Expired:           return "expired";
    }
    return "unknown";
}

const char* VerificationResultToString(VerificationResult result) {
    switch (result) {
        case VerificationResult::Accepted:  return "accepted";
        case VerificationResult::Invalid:   return "invalid";
        case VerificationResult::Late:      return "late";
        case VerificationResult::Stale:     return "stale";
        case VerificationResult::Duplicate: return "duplicate";
        case VerificationResult::Expired:   return "expired";
    }
    return "unknown";
}

// ============================================================================
// Challenge Ledger
// ============================================================================

ChallengeOutcome LedgerEntry::ToOutcome(VerificationResult result, int64_t elapsedMs,
                                        TimestampMs at) const {
    ChallengeOutcome o;
    o.challengeId = challenge.id;
    o.minerId = minerId;
    o.challengeClass = challenge.challengeClass;
    o.difficultyTarget = challenge.difficultyTarget;
    o.result = result;
    o.elapsedMs = elapsedMs;
    o.at = at;
    return o;
}

bool ChallengeLedger::Issue(const Challenge& challenge, const MinerId& minerId) {
    std::lock_guard<std::mutex> lock(mutex_);
    LedgerEntry entry;
    entry.challenge = challenge;
    entry.minerId = minerId;
    return entries_.emplace(challenge.id, std::move(entry)).second;
}

bool ChallengeLedger::MarkDispatched(const std::string& challengeId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(challengeId);
    if (it == entries_.end() || it->second.state != ChallengeState::Issued) {
        return false;
    }
    it->second.state = ChallengeState::AwaitingProof;
    return true;
}

std::optional<LedgerEntry> ChallengeLedger::Get(const std::string& challengeId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(challengeId);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<ChallengeState> ChallengeLedger::Resolve(const std::string& challengeId,
                                                       ChallengeState newState,
                                                       TimestampMs now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(challengeId);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    ChallengeState prior = it->second.state;
    if (!IsTerminal(prior)) {
        it->second.state = newState;
        it->second.resolvedAt = now;
    }
    return prior;
}

std::optional<LedgerEntry> ChallengeLedger::Expire(const std::string& challengeId,
                                                   TimestampMs now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(challengeId);
    if (it == entries_.end() || IsTerminal(it->second.state)) {
        return std::nullopt;
    }
    it->second.state = ChallengeState::Expired;
    it->second.resolvedAt = now;
    return it->second;
}

std::vector<LedgerEntry> ChallengeLedger::ExpireDue(TimestampMs now) {
    std::vector<LedgerEntry> expired;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, entry] : entries_) {
        if (!IsTerminal(entry.state) && now > entry.challenge.Deadline() + graceMs_) {
            entry.state = ChallengeState::Expired;
            entry.resolvedAt = now;
            expired.push_back(entry);
        }
    }
    return expired;
}

size_t ChallengeLedger::Prune(TimestampMs now) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        const LedgerEntry& e = it->second;
        if (IsTerminal(e.state) && now > e.challenge.Deadline() + graceMs_ + retentionMs_) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t ChallengeLedger::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t ChallengeLedger::CountInState(ChallengeState state) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& [id, entry] : entries_) {
        if (entry.state == state) ++n;
    }
    return n;
}

// ============================================================================
// Verification Details
// ============================================================================

bool VerificationDetails::AddCheck(const std::string& name, bool passed,
                                   const std::string& detail) {
    checks.push_back({name, passed, detail});
    return passed;
}

bool VerificationDetails::Finish(VerificationResult verdict, const std::string& why) {
    result = verdict;
    reason = why;
    return IsAccepted();
}

std::string VerificationDetails::ToString() const {
    std::ostringstream ss;
    ss << VerificationResultToString(result);
    if (!reason.empty()) {
        ss << " (" << reason << ")";
    }
    ss << " [";
    for (size_t i = 0; i < checks.size(); ++i) {
        if (i) ss << ", ";
        ss << checks[i].name << "=" << (checks[i].passed ? "ok" : "fail");
    }
    ss << "]";
    return ss.str();
}

// ============================================================================
// Proof Verifier
// ============================================================================

namespace {

ChallengeState StateFor(VerificationResult verdict) {
    switch (verdict) {
        case VerificationResult::Accepted: return ChallengeState::Accepted;
        case VerificationResult::Invalid:  return ChallengeState::RejectedInvalid;
        case VerificationResult::Late:     return ChallengeState::RejectedLate;
        default:                           return ChallengeState::Expired;
    }
}

} // namespace

VerificationDetails ProofVerifier::Verify(const Proof& proof, const MinerId& minerId) {
    VerificationDetails details;
    
    details.entry = ledger_.Get(proof.challengeId);
    const bool known = details.entry && details.entry->minerId == minerId;
    if (!details.AddCheck("known", known)) {
        details.entry.reset();
        details.Finish(VerificationResult::Stale, "unknown challenge");
        LOG_DEBUG(util::LogCategory::VERIFY) << minerId << ": " << details.ToString();
        return details;
    }
    
    const LedgerEntry& entry = *details.entry;
    const Challenge& c = entry.challenge;
    details.elapsedMs = proof.submittedAt - c.issuedAt;
    
    if (!details.AddCheck("unique", entry.state != ChallengeState::Accepted)) {
        details.Finish(VerificationResult::Duplicate, "already accepted");
        LOG_DEBUG(util::LogCategory::VERIFY) << minerId << ": " << details.ToString();
        return details;
    }
    
    if (!details.AddCheck("live", !IsTerminal(entry.state), ChallengeStateToString(entry.state))) {
        details.Finish(VerificationResult::Stale,
                       std::string("challenge ") + ChallengeStateToString(entry.state));
        LOG_DEBUG(util::LogCategory::VERIFY) << minerId << ": " << details.ToString();
        return details;
    }
    
    const TimestampMs cutoff = c.Deadline() + graceMs_;
    if (!details.AddCheck("timely", proof.submittedAt <= cutoff)) {
        Commit(details, proof, VerificationResult::Late,
               "submitted " + std::to_string(proof.submittedAt - cutoff) + "ms after cutoff");
        return details;
    }
    
    Hash256 hash = protocol::ComputePowHash(c.payload, proof.nonce, c.algorithm);
    if (!details.AddCheck("pow", protocol::MeetsTarget(hash, c.difficultyTarget))) {
        Commit(details, proof, VerificationResult::Invalid, "hash above target");
        return details;
    }
    
    Commit(details, proof, VerificationResult::Accepted, "");
    return details;
}

void ProofVerifier::Commit(VerificationDetails& details, const Proof& proof,
                           VerificationResult verdict, const std::string& why) {
    auto prior = ledger_.Resolve(proof.challengeId, StateFor(verdict), proof.submittedAt);
    
    if (!prior) {
        details.Finish(VerificationResult::Stale, "challenge pruned");
    } else if (*prior == ChallengeState::Accepted) {
        details.Finish(VerificationResult::Duplicate, "already accepted");
    } else if (IsTerminal(*prior)) {
        details.Finish(VerificationResult::Stale,
                       std::string("challenge ") + ChallengeStateToString(*prior));
    } else {
        details.Finish(verdict, why);
        if (details.entry) {
            details.entry->state = StateFor(verdict);
            details.entry->resolvedAt = proof.submittedAt;
        }
    }
    
    if (details.IsAccepted()) {
        LOG_DEBUG(util::LogCategory::VERIFY) << "Accepted proof for " << proof.challengeId.substr(0, 16)
                                             << " in " << details.elapsedMs << "ms";
    } else {
        LOG_DEBUG(util::LogCategory::VERIFY) << "Rejected proof for " << proof.challengeId.substr(0, 16)
                                             << ": " << details.ToString();
    }
}

} // namespace validator
} // namespace zeus
