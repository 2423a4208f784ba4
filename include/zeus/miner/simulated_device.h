// ZEUS - Simulated Devices
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// In-process IDeviceLink: every unit solves its jobs on a worker thread with
// the software hasher. Faults can be injected per unit.

#ifndef ZEUS_MINER_SIMULATED_DEVICE_H
#define ZEUS_MINER_SIMULATED_DEVICE_H

#include "zeus/miner/device_link.h"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace zeus {
namespace miner {

class SimulatedDeviceLink : public IDeviceLink {
public:
    /// Units named "sim0", "sim1", ...
    explicit SimulatedDeviceLink(size_t count);
    ~SimulatedDeviceLink() override;
    
    SimulatedDeviceLink(const SimulatedDeviceLink&) = delete;
    SimulatedDeviceLink& operator=(const SimulatedDeviceLink&) = delete;
    
    std::vector<DeviceInfo> ListDevices() override;
    std::optional<DeviceInfo> Probe(const std::string& deviceId) override;
    std::optional<std::string> Submit(const std::string& deviceId, const DeviceJob& job) override;
    PollResult Poll(const std::string& jobId) override;
    void Cancel(const std::string& jobId) override;
    
    // ========================================================================
    // Fault Injection
    // ========================================================================
    
    /// Every poll of this unit's jobs reports Fault until Recover()
    void InjectFault(const std::string& deviceId, const std::string& reason = "bus error");
    
    /// The unit reports a nonce that does not meet the target
    void InjectInvalidNonce(const std::string& deviceId);
    
    /// Reported temperature
    void SetTemperature(const std::string& deviceId, double celsius);
    
    /// The unit keeps working but never finds anything
    void SetStalled(const std::string& deviceId, bool stalled);
    
    /// Clear injected faults and restore normal temperature
    void Recover(const std::string& deviceId);
    
    size_t SubmitCount(const std::string& deviceId) const;
    size_t ActiveJobs() const;

private:
    struct Unit {
        DeviceInfo info;
        bool faulted{false};
        std::string faultReason;
        bool invalidNonce{false};
        bool stalled{false};
        size_t submits{0};
    };
    
    struct Job {
        std::string deviceId;
        DeviceJob work;
        std::atomic<bool> cancel{false};
        std::atomic<bool> done{false};
        std::atomic<bool> found{false};
        std::atomic<uint32_t> nonce{0};
        std::thread worker;
    };
    
    static void RunJob(Job& job, bool stalled, bool invalidNonce);
    void StopJob(Job& job);
    
    mutable std::mutex mutex_;
    std::map<std::string, Unit> units_;
    std::map<std::string, std::unique_ptr<Job>> jobs_;
    uint64_t nextJobId_{1};
};

} // namespace miner
} // namespace zeus

#endif // ZEUS_MINER_SIMULATED_DEVICE_H
