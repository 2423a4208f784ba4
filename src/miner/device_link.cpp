// ZEUS - Device Link Helpers
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include "zeus/miner/device_link.h"

#include <sstream>

namespace zeus {
namespace miner {

std::vector<NonceRange> NonceRange::Split(size_t count) const {
    std::vector<NonceRange> parts;
    if (count == 0) {
        return parts;
    }
    const uint64_t total = Size();
    if (count > total) {
        count = static_cast<size_t>(total);
    }
    const uint64_t base = total / count;
    const uint64_t extra = total % count;
    
    uint64_t start = first;
    for (size_t i = 0; i < count; ++i) {
        uint64_t len = base + (i < extra ? 1 : 0);
        NonceRange r;
        r.first = static_cast<uint32_t>(start);
        r.last = static_cast<uint32_t>(start + len - 1);
        parts.push_back(r);
        start += len;
    }
    return parts;
}

double DeviceTelemetry::HardwareErrorRate() const {
    uint64_t total = accepted + rejected + hardwareErrors;
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(hardwareErrors) / static_cast<double>(total);
}

HealthReport EvaluateTelemetry(const DeviceTelemetry& telemetry, const HealthPolicy& policy) {
    HealthReport report;
    if (telemetry.temperatureC >= policy.thermalLimitC) {
        std::ostringstream ss;
        ss << "over temperature (" << telemetry.temperatureC << "C)";
        report.healthy = false;
        report.reason = ss.str();
    } else if (telemetry.HardwareErrorRate() > policy.maxHardwareErrorRate) {
        std::ostringstream ss;
        ss << "hardware error rate " << telemetry.HardwareErrorRate();
        report.healthy = false;
        report.reason = ss.str();
    }
    return report;
}

HealthReport EvaluateHealth(const DeviceInfo& device, const HealthPolicy& policy) {
    if (!device.enabled) {
        return HealthReport{false, "disabled"};
    }
    if (device.status != "Alive") {
        return HealthReport{false, "status " + device.status};
    }
    return EvaluateTelemetry(device.telemetry, policy);
}

const char* PollStatusToString(PollStatus status) {
    switch (status) {
        case PollStatus::Pending: return "pending";
        case PollStatus::Found:   return "found";
        case PollStatus::Exhausted: return "exhausted";
        case PollStatus::Fault:   return "fault";
    }
    return "unknown";
}

} // namespace miner
} // namespace zeus
