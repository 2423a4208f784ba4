// ZEUS - Software Solver Implementation
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include "zeus/miner/software_solver.h"

#include <mutex>
#include <thread>
#include <vector>

namespace zeus {
namespace miner {

const char* SolveStatusToString(SolveResult::Status status) {
    switch (status) {
        case SolveResult::Status::Found:           return "found";
        case SolveResult::Status::Exhausted:       return "exhausted";
        case SolveResult::Status::DeadlineReached: return "deadline";
        case SolveResult::Status::Cancelled:       return "cancelled";
    }
    return "unknown";
}

SolveResult SoftwareSolver::SearchRange(const Bytes& payload, uint32_t target,
                                        protocol::PowAlgorithm algo, const NonceRange& range,
                                        TimestampMs deadline, const std::atomic<bool>& cancel,
                                        const std::atomic<bool>& stop) {
    SolveResult result;
    Bytes header = protocol::BuildHeader(payload, range.first);
    Byte* noncePtr = header.data() + payload.size();
    
    uint64_t nonce = range.first;
    while (nonce <= range.last) {
        if (result.hashes % CHECK_INTERVAL == 0) {
            if (cancel.load(std::memory_order_relaxed) || stop.load(std::memory_order_relaxed)) {
                result.status = SolveResult::Status::Cancelled;
                return result;
            }
            if (GetTimeMillis() >= deadline) {
                result.status = SolveResult::Status::DeadlineReached;
                return result;
            }
        }
        
        WriteLE32(noncePtr, static_cast<uint32_t>(nonce));
        Hash256 hash = protocol::HashHeader(header.data(), header.size(), algo);
        ++result.hashes;
        if (protocol::MeetsTarget(hash, target)) {
            result.status = SolveResult::Status::Found;
            result.nonce = static_cast<uint32_t>(nonce);
            return result;
        }
        ++nonce;
    }
    
    result.status = SolveResult::Status::Exhausted;
    return result;
}

SolveResult SoftwareSolver::Search(const Bytes& payload, uint32_t target,
                                   protocol::PowAlgorithm algo, const NonceRange& range,
                                   TimestampMs deadline, const std::atomic<bool>& cancel) const {
    std::atomic<bool> stop{false};
    if (threads_ == 1 || range.Size() < threads_ * CHECK_INTERVAL) {
        return SearchRange(payload, target, algo, range, deadline, cancel, stop);
    }
    
    std::vector<NonceRange> parts = range.Split(threads_);
    std::vector<SolveResult> results(parts.size());
    std::vector<std::thread> workers;
    workers.reserve(parts.size());
    
    for (size_t i = 0; i < parts.size(); ++i) {
        workers.emplace_back([&, i]() {
            results[i] = SearchRange(payload, target, algo, parts[i], deadline, cancel, stop);
            if (results[i].IsFound()) {
                stop = true;
            }
        });
    }
    for (auto& t : workers) {
        t.join();
    }
    
    SolveResult combined;
    combined.status = SolveResult::Status::Exhausted;
    for (const SolveResult& r : results) {
        combined.hashes += r.hashes;
    }
    for (const SolveResult& r : results) {
        if (r.IsFound()) {
            combined.status = SolveResult::Status::Found;
            combined.nonce = r.nonce;
            return combined;
        }
    }
    // No find: deadline takes precedence over cancel over exhaustion
    for (const SolveResult& r : results) {
        if (r.status == SolveResult::Status::DeadlineReached) {
            combined.status = SolveResult::Status::DeadlineReached;
        } else if (r.status == SolveResult::Status::Cancelled &&
                   combined.status == SolveResult::Status::Exhausted) {
            combined.status = SolveResult::Status::Cancelled;
        }
    }
    return combined;
}

} // namespace miner
} // namespace zeus
