// ZEUS - Device Link
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// Narrow interface to hardware solving units: list units with telemetry,
// submit a nonce-range job, poll it, cancel it.

#ifndef ZEUS_MINER_DEVICE_LINK_H
#define ZEUS_MINER_DEVICE_LINK_H

#include "zeus/core/types.h"
#include "zeus/protocol/pow.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace zeus {
namespace miner {

// ============================================================================
// Nonce Ranges
// ============================================================================

/// Inclusive nonce interval [first, last]
struct NonceRange {
    uint32_t first{0};
    uint32_t last{0xffffffff};
    
    uint64_t Size() const { return static_cast<uint64_t>(last) - first + 1; }
    bool Contains(uint32_t nonce) const { return nonce >= first && nonce <= last; }
    
    /// The whole 32-bit space
    static NonceRange Full() { return NonceRange{}; }
    
    /// Split into count contiguous, non-overlapping pieces covering the range
    std::vector<NonceRange> Split(size_t count) const;
};

// ============================================================================
// Devices
// ============================================================================

struct DeviceTelemetry {
    double temperatureC{0.0};
    double hashrateKhs{0.0};
    uint64_t accepted{0};
    uint64_t rejected{0};
    uint64_t hardwareErrors{0};
    
    /// HW / (accepted + rejected + HW); 0 with no samples
    double HardwareErrorRate() const;
};

struct DeviceInfo {
    std::string id;
    std::string name;
    bool enabled{true};
    /// cgminer status string ("Alive", "Sick", "Dead", ...)
    std::string status{"Alive"};
    DeviceTelemetry telemetry;
};

struct HealthPolicy {
    double thermalLimitC{80.0};
    double maxHardwareErrorRate{0.02};
};

struct HealthReport {
    bool healthy{true};
    std::string reason;
};

/// Enabled, Alive, below the thermal limit, within the error rate limit
HealthReport EvaluateHealth(const DeviceInfo& device, const HealthPolicy& policy);

/// Telemetry-only part of the check (used while a job is running)
HealthReport EvaluateTelemetry(const DeviceTelemetry& telemetry, const HealthPolicy& policy);

// ============================================================================
// Jobs
// ============================================================================

struct DeviceJob {
    Bytes payload;
    uint32_t target{0};
    protocol::PowAlgorithm algorithm{protocol::PowAlgorithm::Scrypt};
    NonceRange range;
};

enum class PollStatus {
    Pending,
    Found,
    /// Whole range searched without a solution
    Exhausted,
    /// Over-temperature, bus error, unknown job... the unit cannot continue
    Fault
};

const char* PollStatusToString(PollStatus status);

struct PollResult {
    PollStatus status{PollStatus::Pending};
    /// Valid when status == Found (still to be re-verified by the caller)
    uint32_t nonce{0};
    DeviceTelemetry telemetry;
    std::string detail;
    
    static PollResult Fault(std::string why) {
        PollResult r;
        r.status = PollStatus::Fault;
        r.detail = std::move(why);
        return r;
    }
};

// ============================================================================
// IDeviceLink
// ============================================================================

/**
 * Hardware access. Implementations never throw across this interface:
 * communication failures surface as a Fault poll result or an empty
 * Submit result.
 */
class IDeviceLink {
public:
    virtual ~IDeviceLink() = default;
    
    /// All attached units with current telemetry (empty when unreachable)
    virtual std::vector<DeviceInfo> ListDevices() = 0;
    
    /// Fresh status of one unit; nullopt when it cannot be reached
    virtual std::optional<DeviceInfo> Probe(const std::string& deviceId) = 0;
    
    /// Start a job on a unit; the job id, or nullopt if the unit refused it
    virtual std::optional<std::string> Submit(const std::string& deviceId,
                                              const DeviceJob& job) = 0;
    
    virtual PollResult Poll(const std::string& jobId) = 0;
    
    virtual void Cancel(const std::string& jobId) = 0;
};

} // namespace miner
} // namespace zeus

#endif // ZEUS_MINER_DEVICE_LINK_H
