// ZEUS - Miner Transport Implementation
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include "zeus/validator/transport.h"
#include "zeus/util/logging.h"
#include "zeus/util/socket.h"

#include <algorithm>

namespace zeus {
namespace validator {

const char* TransportStatusToString(TransportResult::Status status) {
    switch (status) {
        case TransportResult::Status::Reply:            return "reply";
        case TransportResult::Status::Timeout:          return "timeout";
        case TransportResult::Status::ConnectionFailed: return "connection-failed";
        case TransportResult::Status::ProtocolError:    return "protocol-error";
    }
    return "unknown";
}

TransportResult TcpMinerTransport::Exchange(const MinerEndpoint& endpoint,
                                            const protocol::Challenge& challenge) {
    TransportResult result;
    
    util::TcpStream stream = util::TcpStream::Connect(endpoint.host, endpoint.port,
                                                      connectTimeoutMs_, result.error);
    if (!stream.IsOpen()) {
        result.status = TransportResult::Status::ConnectionFailed;
        LOG_DEBUG(util::LogCategory::NET) << "Cannot reach " << endpoint.ToString()
                                          << ": " << result.error;
        return result;
    }
    
    if (!stream.SendAll(protocol::EncodeChallenge(challenge) + "\n")) {
        result.status = TransportResult::Status::ConnectionFailed;
        result.error = "send failed";
        return result;
    }
    
    const TimestampMs cutoff = challenge.Deadline() + graceMs_;
    if (!stream.SetTimeout(std::max<int64_t>(cutoff - GetTimeMillis(), 1))) {
        result.status = TransportResult::Status::ConnectionFailed;
        result.error = "cannot set socket timeout";
        return result;
    }
    
    std::string line;
    if (!stream.ReadLine(line)) {
        result.status = TransportResult::Status::Timeout;
        result.error = "no reply";
        return result;
    }
    result.receivedAt = GetTimeMillis();
    
    auto decoded = protocol::DecodeMinerReply(line);
    if (!decoded) {
        result.status = TransportResult::Status::ProtocolError;
        result.error = decoded.Error().ToString();
        LOG_WARN(util::LogCategory::NET) << "Malformed reply from " << endpoint.ToString()
                                         << ": " << result.error;
        return result;
    }
    
    result.status = TransportResult::Status::Reply;
    result.reply = std::move(decoded.Value());
    return result;
}

} // namespace validator
} // namespace zeus
