// ZEUS - Miner Responder
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// Answers a Challenge by arbitrating between hardware units and the
// software solver under the challenge deadline. Every candidate is
// re-verified locally before it leaves the miner.

#ifndef ZEUS_MINER_RESPONDER_H
#define ZEUS_MINER_RESPONDER_H

#include "zeus/miner/device_link.h"
#include "zeus/miner/software_solver.h"
#include "zeus/protocol/challenge.h"
#include "zeus/protocol/messages.h"

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace zeus {

namespace util {
class ConfigManager;
}

namespace miner {

/// Device id reported in a Proof found by the software path
constexpr const char* SOFTWARE_DEVICE_ID = "software";

// ============================================================================
// Configuration
// ============================================================================

struct ResponderConfig {
    /// Reserved for transmitting the reply before the deadline
    int64_t safetyMarginMs{1500};
    int64_t pollIntervalMs{50};
    int64_t reprobeIntervalMs{30000};
    HealthPolicy health;
    unsigned softwareThreads{1};
    
    static ResponderConfig FromConfig(const util::ConfigManager& config);
};

// ============================================================================
// Statistics
// ============================================================================

struct ResponderStats {
    std::atomic<uint64_t> challenges{0};
    std::atomic<uint64_t> proofs{0};
    std::atomic<uint64_t> noSolutions{0};
    std::atomic<uint64_t> deviceProofs{0};
    std::atomic<uint64_t> softwareProofs{0};
    /// Candidates that failed local re-verification
    std::atomic<uint64_t> rejectedCandidates{0};
    std::atomic<uint64_t> hardwareFaults{0};
    std::atomic<uint64_t> recoveries{0};
};

// ============================================================================
// Miner Responder
// ============================================================================

/**
 * Challenge responder.
 * 
 * The nonce space is split across the healthy, non-degraded units (sorted
 * by id). A unit that faults, overheats or reports a candidate that fails
 * re-verification is marked degraded and its range is handed to the
 * software solver, so the remaining units keep being polled. With no
 * usable unit the whole space goes to software. When the deadline (receipt
 * time + timeout - safety margin) passes without a verified candidate the
 * reply is NoSolution.
 * 
 * Degraded units are excluded from assignment until ReprobeDegraded()
 * finds them healthy again.
 */
class MinerResponder {
public:
    MinerResponder(IDeviceLink& link, ResponderConfig config);
    
    MinerResponder(const MinerResponder&) = delete;
    MinerResponder& operator=(const MinerResponder&) = delete;
    
    /// Solve a challenge received at receivedAt; never throws on device failures
    protocol::MinerReply Respond(const protocol::Challenge& challenge, TimestampMs receivedAt);
    
    protocol::MinerReply Respond(const protocol::Challenge& challenge) {
        return Respond(challenge, GetTimeMillis());
    }
    
    /// Local wall-clock cutoff for a challenge received at receivedAt
    TimestampMs SolveDeadline(const protocol::Challenge& challenge, TimestampMs receivedAt) const;
    
    /**
     * Probe every degraded unit whose re-probe interval has elapsed at now.
     * @return Number of units restored
     */
    size_t ReprobeDegraded(TimestampMs now);
    
    bool IsDegraded(const std::string& deviceId) const;
    std::vector<std::string> DegradedDevices() const;
    
    const ResponderStats& Stats() const { return stats_; }
    const ResponderConfig& Config() const { return config_; }

private:
    struct Degraded {
        std::string reason;
        TimestampMs since{0};
        TimestampMs lastProbe{0};
    };
    
    struct Assignment;
    struct SoftwareTask;
    
    /// Healthy, non-degraded units sorted by id
    std::vector<DeviceInfo> UsableDevices(TimestampMs now);
    
    void MarkDegraded(const std::string& deviceId, const std::string& reason, TimestampMs now);
    
    protocol::MinerReply MakeProof(const protocol::Challenge& challenge, uint32_t nonce,
                                   const std::string& deviceId, TimestampMs receivedAt);
    
    IDeviceLink& link_;
    const ResponderConfig config_;
    const SoftwareSolver solver_;
    
    /// Units run one job at a time
    std::mutex respondMutex_;
    
    mutable std::mutex degradedMutex_;
    std::map<std::string, Degraded> degraded_;
    
    ResponderStats stats_;
};

} // namespace miner
} // namespace zeus

#endif // ZEUS_MINER_RESPONDER_H
