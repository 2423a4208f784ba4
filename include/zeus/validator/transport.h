// ZEUS - Miner Transport
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// Delivers a challenge to a miner and collects its single reply.

#ifndef ZEUS_VALIDATOR_TRANSPORT_H
#define ZEUS_VALIDATOR_TRANSPORT_H

#include "zeus/protocol/messages.h"
#include "zeus/validator/miner_registry.h"

#include <string>

namespace zeus {
namespace validator {

struct TransportResult {
    enum class Status {
        Reply,              ///< reply holds a proof or a no-solution
        Timeout,            ///< nothing received in time
        ConnectionFailed,
        ProtocolError       ///< reply could not be decoded
    };
    
    Status status{Status::Timeout};
    protocol::MinerReply reply;
    std::string error;
    /// Validator clock when the reply line arrived
    TimestampMs receivedAt{0};
    
    bool HasReply() const { return status == Status::Reply; }
};

const char* TransportStatusToString(TransportResult::Status status);

/// Abstract challenge/reply exchange
class IMinerTransport {
public:
    virtual ~IMinerTransport() = default;
    
    /// Blocks until the reply arrives or the challenge deadline + grace passes
    virtual TransportResult Exchange(const MinerEndpoint& endpoint,
                                     const protocol::Challenge& challenge) = 0;
};

/**
 * Line-delimited JSON over TCP. One connection per challenge: connect, send
 * the challenge line, read one reply line.
 */
class TcpMinerTransport : public IMinerTransport {
public:
    explicit TcpMinerTransport(int64_t graceMs, int64_t connectTimeoutMs = 3000)
        : graceMs_(graceMs), connectTimeoutMs_(connectTimeoutMs) {}
    
    TransportResult Exchange(const MinerEndpoint& endpoint,
                             const protocol::Challenge& challenge) override;

private:
    int64_t graceMs_;
    int64_t connectTimeoutMs_;
};

} // namespace validator
} // namespace zeus

#endif // ZEUS_VALIDATOR_TRANSPORT_H
