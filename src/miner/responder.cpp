// ZEUS - Miner Responder Implementation
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include "zeus/miner/responder.h"
#include "zeus/util/config.h"
#include "zeus/util/logging.h"

#include <algorithm>
#include <chrono>
#include <future>
#include <optional>
#include <thread>

namespace zeus {
namespace miner {

using protocol::MinerReply;

// ============================================================================
// Configuration
// ============================================================================

ResponderConfig ResponderConfig::FromConfig(const util::ConfigManager& config) {
    using namespace util;
    const std::string section = ConfigSection::MINER;
    ResponderConfig c;
    c.safetyMarginMs = config.GetInt(ConfigKeys::SAFETYMARGINMS, c.safetyMarginMs, section);
    c.pollIntervalMs = std::max<int64_t>(
        1, config.GetInt(ConfigKeys::POLLINTERVALMS, c.pollIntervalMs, section));
    c.reprobeIntervalMs = config.GetInt(ConfigKeys::REPROBEINTERVALMS, c.reprobeIntervalMs, section);
    c.health.thermalLimitC = config.GetDouble(ConfigKeys::THERMALLIMIT, c.health.thermalLimitC, section);
    c.health.maxHardwareErrorRate = config.GetDouble(ConfigKeys::MAXHWERRORRATE,
                                                     c.health.maxHardwareErrorRate, section);
    c.softwareThreads = static_cast<unsigned>(
        config.GetUInt(ConfigKeys::SOFTWARETHREADS, c.softwareThreads, section));
    return c;
}

// ============================================================================
// Per-challenge work items
// ============================================================================

struct MinerResponder::Assignment {
    std::string deviceId;
    NonceRange range;
    std::string jobId;
    bool active{false};
};

struct MinerResponder::SoftwareTask {
    NonceRange range;
    /// Unit whose range this covers; empty for the whole space
    std::string origin;
    std::future<SolveResult> result;
    bool done{false};
};

// ============================================================================
// MinerResponder
// ============================================================================

MinerResponder::MinerResponder(IDeviceLink& link, ResponderConfig config)
    : link_(link), config_(std::move(config)), solver_(config_.softwareThreads) {
}

TimestampMs MinerResponder::SolveDeadline(const protocol::Challenge& challenge,
                                          TimestampMs receivedAt) const {
    return receivedAt + static_cast<TimestampMs>(challenge.timeoutSec) * 1000 -
           config_.safetyMarginMs;
}

std::vector<DeviceInfo> MinerResponder::UsableDevices(TimestampMs now) {
    std::vector<DeviceInfo> usable;
    for (DeviceInfo& device : link_.ListDevices()) {
        if (IsDegraded(device.id)) {
            continue;
        }
        HealthReport health = EvaluateHealth(device, config_.health);
        if (!health.healthy) {
            MarkDegraded(device.id, health.reason, now);
            continue;
        }
        usable.push_back(std::move(device));
    }
    std::sort(usable.begin(), usable.end(),
              [](const DeviceInfo& a, const DeviceInfo& b) { return a.id < b.id; });
    return usable;
}

void MinerResponder::MarkDegraded(const std::string& deviceId, const std::string& reason,
                                  TimestampMs now) {
    {
        std::lock_guard<std::mutex> lock(degradedMutex_);
        Degraded& entry = degraded_[deviceId];
        entry.reason = reason;
        entry.since = now;
        entry.lastProbe = now;
    }
    stats_.hardwareFaults++;
    LOG_WARN(util::LogCategory::DEVICE) << "Device " << deviceId << " fault: " << reason
                                        << ", excluded from assignment";
}

bool MinerResponder::IsDegraded(const std::string& deviceId) const {
    std::lock_guard<std::mutex> lock(degradedMutex_);
    return degraded_.count(deviceId) > 0;
}

std::vector<std::string> MinerResponder::DegradedDevices() const {
    std::lock_guard<std::mutex> lock(degradedMutex_);
    std::vector<std::string> ids;
    for (const auto& [id, entry] : degraded_) {
        ids.push_back(id);
    }
    return ids;
}

size_t MinerResponder::ReprobeDegraded(TimestampMs now) {
    std::vector<std::string> due;
    {
        std::lock_guard<std::mutex> lock(degradedMutex_);
        for (auto& [id, entry] : degraded_) {
            if (now - entry.lastProbe >= config_.reprobeIntervalMs) {
                entry.lastProbe = now;
                due.push_back(id);
            }
        }
    }
    
    size_t restored = 0;
    for (const std::string& id : due) {
        std::optional<DeviceInfo> info = link_.Probe(id);
        if (!info) {
            LOG_DEBUG(util::LogCategory::DEVICE) << "Device " << id << " unreachable on re-probe";
            continue;
        }
        HealthReport health = EvaluateHealth(*info, config_.health);
        if (!health.healthy) {
            LOG_DEBUG(util::LogCategory::DEVICE) << "Device " << id << " still degraded: "
                                                 << health.reason;
            continue;
        }
        {
            std::lock_guard<std::mutex> lock(degradedMutex_);
            degraded_.erase(id);
        }
        ++restored;
        stats_.recoveries++;
        LOG_INFO(util::LogCategory::DEVICE) << "Device " << id << " recovered";
    }
    return restored;
}

MinerReply MinerResponder::MakeProof(const protocol::Challenge& challenge, uint32_t nonce,
                                     const std::string& deviceId, TimestampMs receivedAt) {
    protocol::Proof proof;
    proof.challengeId = challenge.id;
    proof.nonce = nonce;
    proof.submittedAt = GetTimeMillis();
    proof.elapsedMs = std::max<int64_t>(0, proof.submittedAt - receivedAt);
    proof.deviceId = deviceId;
    LOG_DEBUG(util::LogCategory::RESPONDER) << "Solved " << challenge.id << " on " << deviceId
                                            << " in " << proof.elapsedMs << "ms";
    return MinerReply::FromProof(std::move(proof));
}

MinerReply MinerResponder::Respond(const protocol::Challenge& challenge, TimestampMs receivedAt) {
    std::lock_guard<std::mutex> respondLock(respondMutex_);
    stats_.challenges++;
    
    const TimestampMs deadline = SolveDeadline(challenge, receivedAt);
    if (GetTimeMillis() >= deadline) {
        stats_.noSolutions++;
        LOG_DEBUG(util::LogCategory::RESPONDER) << "No time left for " << challenge.id;
        return MinerReply::NoSolution(challenge.id);
    }
    
    std::atomic<bool> cancel{false};
    std::vector<Assignment> assignments;
    std::vector<SoftwareTask> software;
    
    auto startSoftware = [&](const NonceRange& range, const std::string& origin) {
        SoftwareTask task;
        task.range = range;
        task.origin = origin;
        task.result = std::async(std::launch::async, [this, &challenge, &cancel, range, deadline]() {
            return solver_.Search(challenge.payload, challenge.difficultyTarget,
                                  challenge.algorithm, range, deadline, cancel);
        });
        software.push_back(std::move(task));
    };
    
    // Dispatch
    std::vector<DeviceInfo> devices = UsableDevices(GetTimeMillis());
    if (devices.empty()) {
        LOG_DEBUG(util::LogCategory::RESPONDER) << "No usable unit, software search for "
                                                << challenge.id;
        startSoftware(NonceRange::Full(), "");
    } else {
        DeviceJob job;
        job.payload = challenge.payload;
        job.target = challenge.difficultyTarget;
        job.algorithm = challenge.algorithm;
        
        std::vector<NonceRange> ranges = NonceRange::Full().Split(devices.size());
        for (size_t i = 0; i < devices.size(); ++i) {
            job.range = ranges[i];
            std::optional<std::string> jobId = link_.Submit(devices[i].id, job);
            if (jobId) {
                assignments.push_back(Assignment{devices[i].id, ranges[i], *jobId, true});
            } else {
                MarkDegraded(devices[i].id, "job submission refused", GetTimeMillis());
                startSoftware(ranges[i], devices[i].id);
            }
        }
    }
    
    // Poll
    std::optional<MinerReply> reply;
    for (;;) {
        const TimestampMs now = GetTimeMillis();
        if (now >= deadline) {
            break;
        }
        bool pending = false;
        
        for (Assignment& a : assignments) {
            if (!a.active) {
                continue;
            }
            PollResult poll = link_.Poll(a.jobId);
            std::string fault;
            
            switch (poll.status) {
                case PollStatus::Found:
                    if (a.range.Contains(poll.nonce) &&
                        protocol::CheckProofOfWork(challenge.payload, poll.nonce,
                                                   challenge.difficultyTarget, challenge.algorithm)) {
                        reply = MakeProof(challenge, poll.nonce, a.deviceId, receivedAt);
                        stats_.deviceProofs++;
                    } else {
                        stats_.rejectedCandidates++;
                        fault = "reported invalid nonce " + std::to_string(poll.nonce);
                    }
                    break;
                case PollStatus::Exhausted:
                    a.active = false;
                    link_.Cancel(a.jobId);
                    break;
                case PollStatus::Fault:
                    fault = poll.detail.empty() ? "fault" : poll.detail;
                    break;
                case PollStatus::Pending: {
                    HealthReport health = EvaluateTelemetry(poll.telemetry, config_.health);
                    if (health.healthy) {
                        pending = true;
                    } else {
                        fault = health.reason;
                    }
                    break;
                }
            }
            if (reply) {
                break;
            }
            if (!fault.empty()) {
                link_.Cancel(a.jobId);
                a.active = false;
                MarkDegraded(a.deviceId, fault, now);
                startSoftware(a.range, a.deviceId);
                pending = true;
            }
        }
        if (reply) {
            break;
        }
        
        for (SoftwareTask& task : software) {
            if (task.done) {
                continue;
            }
            if (task.result.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
                pending = true;
                continue;
            }
            task.done = true;
            SolveResult r;
            try {
                r = task.result.get();
            } catch (const std::exception& e) {
                LOG_ERROR(util::LogCategory::RESPONDER) << "Software search failed: " << e.what();
                continue;
            }
            if (!r.IsFound()) {
                continue;
            }
            if (protocol::CheckProofOfWork(challenge.payload, r.nonce, challenge.difficultyTarget,
                                           challenge.algorithm)) {
                reply = MakeProof(challenge, r.nonce, SOFTWARE_DEVICE_ID, receivedAt);
                stats_.softwareProofs++;
                break;
            }
            stats_.rejectedCandidates++;
            LOG_ERROR(util::LogCategory::RESPONDER) << "Software candidate " << r.nonce
                                                    << " failed re-verification";
        }
        if (reply || !pending) {
            break;
        }
        
        const int64_t wait = std::min<int64_t>(config_.pollIntervalMs, deadline - GetTimeMillis());
        if (wait > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(wait));
        }
    }
    
    // Stop everything still running
    cancel = true;
    for (Assignment& a : assignments) {
        if (a.active) {
            link_.Cancel(a.jobId);
            a.active = false;
        }
    }
    for (SoftwareTask& task : software) {
        if (task.result.valid()) {
            task.result.wait();
        }
    }
    
    if (reply) {
        stats_.proofs++;
        return *reply;
    }
    stats_.noSolutions++;
    LOG_DEBUG(util::LogCategory::RESPONDER) << "No solution for " << challenge.id
                                            << " before the deadline";
    return MinerReply::NoSolution(challenge.id);
}

} // namespace miner
} // namespace zeus
