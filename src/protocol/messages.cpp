// ZEUS - Wire Messages Implementation
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include "zeus/protocol/messages.h"
#include "zeus/core/hex.h"
#include "zeus/util/json.h"

#include <limits>

namespace zeus {
namespace protocol {

using util::JSONValue;

const char* ProtocolErrorCodeToString(ProtocolErrorCode code) {
    switch (code) {
        case ProtocolErrorCode::MalformedJson:  return "malformed-json";
        case ProtocolErrorCode::MissingField:   return "missing-field";
        case ProtocolErrorCode::InvalidField:   return "invalid-field";
        case ProtocolErrorCode::UnexpectedType: return "unexpected-type";
    }
    return "unknown";
}

std::string ProtocolError::ToString() const {
    return std::string(ProtocolErrorCodeToString(code)) + ": " + message;
}

namespace {

/// Field extraction that records the first failure
class FieldReader {
public:
    explicit FieldReader(const JSONValue& obj) : obj_(obj) {}
    
    bool Ok() const { return ok_; }
    ProtocolErrorCode Code() const { return code_; }
    const std::string& Message() const { return message_; }
    
    const JSONValue* Require(const char* name) {
        if (!ok_) return nullptr;
        const JSONValue* v = obj_.Find(name);
        if (!v || v->IsNull()) {
            Fail(ProtocolErrorCode::MissingField, std::string("missing '") + name + "'");
            return nullptr;
        }
        return v;
    }
    
    std::string String(const char* name, bool allowEmpty = false) {
        const JSONValue* v = Require(name);
        if (!v) return {};
        if (!v->IsString() || (!allowEmpty && v->GetString().empty())) {
            Fail(ProtocolErrorCode::InvalidField, std::string("'") + name + "' must be a non-empty string");
            return {};
        }
        return v->GetString();
    }
    
    int64_t Int(const char* name, int64_t minValue, int64_t maxValue) {
        const JSONValue* v = Require(name);
        if (!v) return 0;
        if (!v->IsInt() || v->GetInt() < minValue || v->GetInt() > maxValue) {
            Fail(ProtocolErrorCode::InvalidField,
                 std::string("'") + name + "' out of range [" + std::to_string(minValue) +
                 ", " + std::to_string(maxValue) + "]");
            return 0;
        }
        return v->GetInt();
    }
    
    void Fail(ProtocolErrorCode code, std::string message) {
        if (ok_) {
            ok_ = false;
            code_ = code;
            message_ = std::move(message);
        }
    }

private:
    const JSONValue& obj_;
    bool ok_{true};
    ProtocolErrorCode code_{ProtocolErrorCode::MalformedJson};
    std::string message_;
};

std::optional<JSONValue> ParseObject(const std::string& line, ProtocolError& error) {
    auto parsed = JSONValue::TryParse(line);
    if (!parsed || !parsed->IsObject()) {
        error.code = ProtocolErrorCode::MalformedJson;
        error.message = "not a JSON object";
        return std::nullopt;
    }
    return parsed;
}

constexpr int64_t MAX_U32 = std::numeric_limits<uint32_t>::max();

} // namespace

// ============================================================================
// Challenge
// ============================================================================

std::string EncodeChallenge(const Challenge& challenge) {
    JSONValue obj;
    obj["type"] = MessageType::CHALLENGE;
    obj["challenge_id"] = challenge.id;
    obj["class"] = ChallengeClassToString(challenge.challengeClass);
    obj["difficulty_target"] = challenge.difficultyTarget;
    obj["timeout"] = challenge.timeoutSec;
    obj["issued_at"] = challenge.issuedAt;
    obj["payload"] = BytesToHex(challenge.payload);
    obj["algorithm"] = PowAlgorithmToString(challenge.algorithm);
    return obj.ToJSON();
}

DecodeResult<Challenge> DecodeChallenge(const std::string& line) {
    ProtocolError error;
    auto obj = ParseObject(line, error);
    if (!obj) {
        return DecodeResult<Challenge>::Failure(error.code, error.message);
    }
    
    FieldReader r(*obj);
    std::string type = r.String("type");
    if (r.Ok() && type != MessageType::CHALLENGE) {
        r.Fail(ProtocolErrorCode::UnexpectedType, "expected challenge, got " + type);
    }
    
    Challenge c;
    c.id = r.String("challenge_id");
    std::string cls = r.String("class");
    c.difficultyTarget = static_cast<uint32_t>(r.Int("difficulty_target", 1, MAX_U32));
    c.timeoutSec = static_cast<uint32_t>(r.Int("timeout", 1, 3600));
    c.issuedAt = r.Int("issued_at", 0, std::numeric_limits<int64_t>::max());
    std::string payloadHex = r.String("payload");
    std::string algo = r.String("algorithm");
    
    if (r.Ok()) {
        auto parsedClass = ChallengeClassFromString(cls);
        if (!parsedClass) {
            r.Fail(ProtocolErrorCode::InvalidField, "unknown class '" + cls + "'");
        } else {
            c.challengeClass = *parsedClass;
        }
    }
    if (r.Ok()) {
        auto parsedAlgo = PowAlgorithmFromString(algo);
        if (!parsedAlgo) {
            r.Fail(ProtocolErrorCode::InvalidField, "unknown algorithm '" + algo + "'");
        } else {
            c.algorithm = *parsedAlgo;
        }
    }
    if (r.Ok()) {
        if (!IsValidHex(payloadHex)) {
            r.Fail(ProtocolErrorCode::InvalidField, "payload is not hex");
        } else {
            c.payload = HexToBytes(payloadHex);
        }
    }
    if (r.Ok() && !c.IsWellFormed()) {
        r.Fail(ProtocolErrorCode::InvalidField, "challenge_id does not match content");
    }
    
    if (!r.Ok()) {
        return DecodeResult<Challenge>::Failure(r.Code(), r.Message());
    }
    return DecodeResult<Challenge>::Success(std::move(c));
}

// ============================================================================
// Miner Replies
// ============================================================================

std::string EncodeProof(const Proof& proof) {
    JSONValue obj;
    obj["type"] = MessageType::PROOF;
    obj["challenge_id"] = proof.challengeId;
    obj["nonce"] = proof.nonce;
    obj["elapsed_ms"] = proof.elapsedMs;
    obj["device_id"] = proof.deviceId;
    return obj.ToJSON();
}

std::string EncodeNoSolution(const std::string& challengeId) {
    JSONValue obj;
    obj["type"] = MessageType::NO_SOLUTION;
    obj["challenge_id"] = challengeId;
    obj["status"] = "no_solution";
    return obj.ToJSON();
}

std::string EncodeMinerReply(const MinerReply& reply) {
    if (reply.kind == MinerReply::Kind::Proof) {
        return EncodeProof(reply.proof);
    }
    return EncodeNoSolution(reply.challengeId);
}

DecodeResult<MinerReply> DecodeMinerReply(const std::string& line) {
    ProtocolError error;
    auto obj = ParseObject(line, error);
    if (!obj) {
        return DecodeResult<MinerReply>::Failure(error.code, error.message);
    }
    
    FieldReader r(*obj);
    std::string type = r.String("type");
    std::string challengeId = r.String("challenge_id");
    if (!r.Ok()) {
        return DecodeResult<MinerReply>::Failure(r.Code(), r.Message());
    }
    
    if (type == MessageType::NO_SOLUTION) {
        return DecodeResult<MinerReply>::Success(MinerReply::NoSolution(challengeId));
    }
    if (type != MessageType::PROOF) {
        return DecodeResult<MinerReply>::Failure(ProtocolErrorCode::UnexpectedType,
                                                 "unexpected message type " + type);
    }
    
    Proof proof;
    proof.challengeId = challengeId;
    proof.nonce = static_cast<uint32_t>(r.Int("nonce", 0, MAX_U32));
    proof.elapsedMs = r.Int("elapsed_ms", 0, std::numeric_limits<int64_t>::max());
    proof.deviceId = r.String("device_id");
    if (!r.Ok()) {
        return DecodeResult<MinerReply>::Failure(r.Code(), r.Message());
    }
    return DecodeResult<MinerReply>::Success(MinerReply::FromProof(std::move(proof)));
}

} // namespace protocol
} // namespace zeus
