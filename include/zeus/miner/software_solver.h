// ZEUS - Software Solver
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// In-process nonce search used when no hardware unit is usable.

#ifndef ZEUS_MINER_SOFTWARE_SOLVER_H
#define ZEUS_MINER_SOFTWARE_SOLVER_H

#include "zeus/miner/device_link.h"

#include <atomic>
#include <cstdint>

namespace zeus {
namespace miner {

struct SolveResult {
    enum class Status {
        Found,
        Exhausted,
        DeadlineReached,
        Cancelled
    };
    
    Status status{Status::Exhausted};
    uint32_t nonce{0};
    uint64_t hashes{0};
    
    bool IsFound() const { return status == Status::Found; }
};

const char* SolveStatusToString(SolveResult::Status status);

/**
 * Linear nonce search. The deadline and the cancel flag are checked every
 * CHECK_INTERVAL hashes, so a search stops within one interval of either.
 */
class SoftwareSolver {
public:
    static constexpr uint32_t CHECK_INTERVAL = 256;
    
    explicit SoftwareSolver(unsigned threads = 1) : threads_(threads == 0 ? 1 : threads) {}
    
    /**
     * Search range for a nonce whose hash meets target.
     * @param deadline Wall-clock cutoff in ms (GetTimeMillis)
     * @param cancel   Raised by the caller to stop early
     */
    SolveResult Search(const Bytes& payload, uint32_t target, protocol::PowAlgorithm algo,
                       const NonceRange& range, TimestampMs deadline,
                       const std::atomic<bool>& cancel) const;
    
    unsigned Threads() const { return threads_; }

private:
    /// Single-threaded search; stops when stop is raised by a sibling
    static SolveResult SearchRange(const Bytes& payload, uint32_t target,
                                   protocol::PowAlgorithm algo, const NonceRange& range,
                                   TimestampMs deadline, const std::atomic<bool>& cancel,
                                   const std::atomic<bool>& stop);
    
    unsigned threads_;
};

} // namespace miner
} // namespace zeus

#endif // ZEUS_MINER_SOFTWARE_SOLVER_H
