// ZEUS - Proof Outbox
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// Bounded send queue between the responder and the validator connections.
// A single sender thread performs the blocking writes so solving never
// waits on the network.

#ifndef ZEUS_MINER_PROOF_OUTBOX_H
#define ZEUS_MINER_PROOF_OUTBOX_H

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace zeus {
namespace miner {

/**
 * Outbound replies.
 * 
 * Enqueue never blocks: when the queue is full the reply is dropped and
 * counted. A failed send is logged and dropped; there are no retries.
 */
class ProofOutbox {
public:
    /// Writes one encoded line; false on failure
    using SendFunction = std::function<bool(const std::string& line)>;
    
    static constexpr size_t DEFAULT_CAPACITY = 64;
    
    explicit ProofOutbox(size_t capacity = DEFAULT_CAPACITY);
    ~ProofOutbox();
    
    ProofOutbox(const ProofOutbox&) = delete;
    ProofOutbox& operator=(const ProofOutbox&) = delete;
    
    void Start();
    
    /// Stop the sender; replies still queued are sent first
    void Stop();
    
    bool IsRunning() const { return running_.load(); }
    
    /// Queue a reply; false when full or stopped
    bool Enqueue(std::string challengeId, std::string line, SendFunction send);
    
    /// Block until the queue is empty and no send is in flight
    void Flush();
    
    size_t Pending() const;
    uint64_t Sent() const { return sent_.load(); }
    uint64_t Failed() const { return failed_.load(); }
    uint64_t Dropped() const { return dropped_.load(); }

private:
    struct Item {
        std::string challengeId;
        std::string line;
        SendFunction send;
    };
    
    void SenderLoop();
    
    const size_t capacity_;
    
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idleCv_;
    std::deque<Item> queue_;
    bool sending_{false};
    bool stopping_{false};
    
    std::thread sender_;
    std::atomic<bool> running_{false};
    
    std::atomic<uint64_t> sent_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> dropped_{0};
};

} // namespace miner
} // namespace zeus

#endif // ZEUS_MINER_PROOF_OUTBOX_H
