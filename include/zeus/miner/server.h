// ZEUS - Miner Server
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// Line-JSON listener for validator connections: one Challenge per
// connection, answered with a Proof or NoSolution line.

#ifndef ZEUS_MINER_SERVER_H
#define ZEUS_MINER_SERVER_H

#include "zeus/miner/proof_outbox.h"
#include "zeus/miner/responder.h"
#include "zeus/util/socket.h"

#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace zeus {

namespace util {
class ThreadPool;
}

namespace miner {

constexpr uint16_t DEFAULT_MINER_PORT = 8091;

class MinerServer {
public:
    /// Time allowed for the validator to deliver its Challenge line
    static constexpr int64_t READ_TIMEOUT_MS = 10000;
    
    MinerServer(MinerResponder& responder, ProofOutbox& outbox, util::ThreadPool& pool);
    ~MinerServer();
    
    MinerServer(const MinerServer&) = delete;
    MinerServer& operator=(const MinerServer&) = delete;
    
    /// Bind and start accepting; port 0 picks an ephemeral port
    bool Start(const std::string& bindAddress, uint16_t port, std::string& error);
    void Stop();
    
    bool IsRunning() const { return running_.load(); }
    uint16_t Port() const { return listener_.Port(); }
    
    uint64_t Answered() const { return answered_.load(); }
    uint64_t Malformed() const { return malformed_.load(); }

private:
    void AcceptLoop();
    void HandleConnection(std::shared_ptr<util::TcpStream> stream);
    
    MinerResponder& responder_;
    ProofOutbox& outbox_;
    util::ThreadPool& pool_;
    
    util::TcpListener listener_;
    std::thread acceptThread_;
    std::atomic<bool> running_{false};
    
    std::atomic<uint64_t> answered_{0};
    std::atomic<uint64_t> malformed_{0};
};

} // namespace miner
} // namespace zeus

#endif // ZEUS_MINER_SERVER_H
