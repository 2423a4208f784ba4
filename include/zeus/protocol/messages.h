// ZEUS - Wire Messages
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// Line-delimited JSON encoding of the validator <-> miner messages:
//   challenge   {"type":"challenge","challenge_id",...,"payload":"<hex>"}
//   proof       {"type":"proof","challenge_id","nonce","elapsed_ms","device_id"}
//   no_solution {"type":"no_solution","challenge_id","status":"no_solution"}
//
// Decoding never throws; malformed input yields a ProtocolError.

#ifndef ZEUS_PROTOCOL_MESSAGES_H
#define ZEUS_PROTOCOL_MESSAGES_H

#include "zeus/protocol/challenge.h"

#include <optional>
#include <string>
#include <utility>

namespace zeus {
namespace protocol {

// ============================================================================
// Protocol Errors
// ============================================================================

enum class ProtocolErrorCode {
    MalformedJson,
    MissingField,
    InvalidField,
    UnexpectedType
};

const char* ProtocolErrorCodeToString(ProtocolErrorCode code);

struct ProtocolError {
    ProtocolErrorCode code{ProtocolErrorCode::MalformedJson};
    std::string message;
    
    std::string ToString() const;
};

/// Decoded value or the reason decoding failed
template<typename T>
class DecodeResult {
public:
    static DecodeResult Success(T value) {
        DecodeResult r;
        r.value_ = std::move(value);
        return r;
    }
    
    static DecodeResult Failure(ProtocolErrorCode code, std::string message) {
        DecodeResult r;
        r.error_.code = code;
        r.error_.message = std::move(message);
        return r;
    }
    
    bool IsOk() const { return value_.has_value(); }
    explicit operator bool() const { return IsOk(); }
    
    const T& Value() const { return *value_; }
    T& Value() { return *value_; }
    const ProtocolError& Error() const { return error_; }

private:
    std::optional<T> value_;
    ProtocolError error_;
};

// ============================================================================
// Message Types
// ============================================================================

namespace MessageType {
    constexpr const char* CHALLENGE = "challenge";
    constexpr const char* PROOF = "proof";
    constexpr const char* NO_SOLUTION = "no_solution";
}

/// What a miner sends back for a challenge
struct MinerReply {
    enum class Kind { Proof, NoSolution };
    
    Kind kind{Kind::NoSolution};
    std::string challengeId;
    /// Meaningful only for Kind::Proof
    Proof proof;
    
    static MinerReply FromProof(Proof p) {
        MinerReply r;
        r.kind = Kind::Proof;
        r.challengeId = p.challengeId;
        r.proof = std::move(p);
        return r;
    }
    
    static MinerReply NoSolution(std::string challengeId) {
        MinerReply r;
        r.kind = Kind::NoSolution;
        r.challengeId = std::move(challengeId);
        return r;
    }
};

// ============================================================================
// Encoding / Decoding
// ============================================================================

/// Single-line JSON, no trailing newline
std::string EncodeChallenge(const Challenge& challenge);
DecodeResult<Challenge> DecodeChallenge(const std::string& line);

/// submittedAt is not transmitted; the receiver stamps it
std::string EncodeProof(const Proof& proof);
std::string EncodeNoSolution(const std::string& challengeId);
std::string EncodeMinerReply(const MinerReply& reply);
DecodeResult<MinerReply> DecodeMinerReply(const std::string& line);

} // namespace protocol
} // namespace zeus

#endif // ZEUS_PROTOCOL_MESSAGES_H
