// ZEUS - Miner Server Implementation
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include "zeus/miner/server.h"
#include "zeus/protocol/messages.h"
#include "zeus/util/logging.h"
#include "zeus/util/threadpool.h"

namespace zeus {
namespace miner {

MinerServer::MinerServer(MinerResponder& responder, ProofOutbox& outbox, util::ThreadPool& pool)
    : responder_(responder), outbox_(outbox), pool_(pool) {
}

MinerServer::~MinerServer() {
    Stop();
}

bool MinerServer::Start(const std::string& bindAddress, uint16_t port, std::string& error) {
    if (running_.load()) {
        return true;
    }
    if (!listener_.Listen(bindAddress, port, 16, error)) {
        LOG_ERROR(util::LogCategory::NET) << "Cannot listen on " << bindAddress << ":" << port
                                          << ": " << error;
        return false;
    }
    running_ = true;
    acceptThread_ = std::thread(&MinerServer::AcceptLoop, this);
    LOG_INFO(util::LogCategory::NET) << "Listening for validators on " << bindAddress << ":"
                                     << listener_.Port();
    return true;
}

void MinerServer::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    listener_.Close();
    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }
}

void MinerServer::AcceptLoop() {
    while (running_.load()) {
        util::TcpStream stream = listener_.Accept();
        if (!stream.IsOpen()) {
            if (!running_.load()) {
                break;
            }
            continue;
        }
        auto shared = std::make_shared<util::TcpStream>(std::move(stream));
        if (!pool_.TrySubmit([this, shared]() { HandleConnection(shared); })) {
            LOG_WARN(util::LogCategory::NET) << "Worker pool busy, dropping connection from "
                                             << shared->PeerAddress();
        }
    }
}

void MinerServer::HandleConnection(std::shared_ptr<util::TcpStream> stream) {
    const std::string peer = stream->PeerAddress();
    if (!stream->SetTimeout(READ_TIMEOUT_MS)) {
        LOG_WARN(util::LogCategory::NET) << "Cannot set timeout on connection from " << peer;
        return;
    }
    
    std::string line;
    if (!stream->ReadLine(line)) {
        LOG_DEBUG(util::LogCategory::NET) << "No challenge received from " << peer;
        return;
    }
    const TimestampMs receivedAt = GetTimeMillis();
    
    auto decoded = protocol::DecodeChallenge(line);
    if (!decoded) {
        malformed_++;
        LOG_WARN(util::LogCategory::NET) << "Malformed challenge from " << peer << ": "
                                         << decoded.Error().ToString();
        return;
    }
    const protocol::Challenge& challenge = decoded.Value();
    LOG_DEBUG(util::LogCategory::RESPONDER) << "Challenge " << challenge.id << " ("
                                            << protocol::ChallengeClassToString(challenge.challengeClass)
                                            << ") from " << peer;
    
    protocol::MinerReply reply = responder_.Respond(challenge, receivedAt);
    answered_++;
    
    bool queued = outbox_.Enqueue(challenge.id, protocol::EncodeMinerReply(reply),
                                  [stream](const std::string& encoded) {
                                      return stream->SendAll(encoded + "\n");
                                  });
    if (!queued) {
        LOG_DEBUG(util::LogCategory::NET) << "Closing " << peer << " without a reply";
    }
}

} // namespace miner
} // namespace zeus
