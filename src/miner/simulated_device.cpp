// ZEUS - Simulated Devices Implementation
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include "zeus/miner/simulated_device.h"
#include "zeus/miner/software_solver.h"
#include "zeus/util/logging.h"

#include <chrono>
#include <limits>

namespace zeus {
namespace miner {

namespace {
constexpr double NORMAL_TEMPERATURE_C = 55.0;
constexpr TimestampMs NO_DEADLINE = std::numeric_limits<TimestampMs>::max();
}

SimulatedDeviceLink::SimulatedDeviceLink(size_t count) {
    for (size_t i = 0; i < count; ++i) {
        Unit unit;
        unit.info.id = "sim" + std::to_string(i);
        unit.info.name = "Simulated Zeus " + std::to_string(i);
        unit.info.telemetry.temperatureC = NORMAL_TEMPERATURE_C;
        unit.info.telemetry.hashrateKhs = 1.0;
        units_.emplace(unit.info.id, unit);
    }
}

SimulatedDeviceLink::~SimulatedDeviceLink() {
    std::map<std::string, std::unique_ptr<Job>> jobs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs.swap(jobs_);
    }
    for (auto& [id, job] : jobs) {
        StopJob(*job);
    }
}

std::vector<DeviceInfo> SimulatedDeviceLink::ListDevices() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeviceInfo> devices;
    for (const auto& [id, unit] : units_) {
        devices.push_back(unit.info);
        if (unit.faulted) {
            devices.back().status = "Sick";
        }
    }
    return devices;
}

std::optional<DeviceInfo> SimulatedDeviceLink::Probe(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = units_.find(deviceId);
    if (it == units_.end()) {
        return std::nullopt;
    }
    DeviceInfo info = it->second.info;
    if (it->second.faulted) {
        info.status = "Sick";
    }
    return info;
}

void SimulatedDeviceLink::RunJob(Job& job, bool stalled, bool invalidNonce) {
    const DeviceJob& w = job.work;
    if (stalled) {
        while (!job.cancel.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        job.done = true;
        return;
    }
    
    if (invalidNonce) {
        // Report the first nonce that misses the target
        for (uint64_t n = w.range.first; n <= w.range.last && !job.cancel.load(); ++n) {
            uint32_t nonce = static_cast<uint32_t>(n);
            if (!protocol::CheckProofOfWork(w.payload, nonce, w.target, w.algorithm)) {
                job.nonce = nonce;
                job.found = true;
                break;
            }
        }
        job.done = true;
        return;
    }
    
    SoftwareSolver solver(1);
    SolveResult r = solver.Search(w.payload, w.target, w.algorithm, w.range, NO_DEADLINE, job.cancel);
    if (r.IsFound()) {
        job.nonce = r.nonce;
        job.found = true;
    }
    job.done = true;
}

std::optional<std::string> SimulatedDeviceLink::Submit(const std::string& deviceId,
                                                       const DeviceJob& job) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = units_.find(deviceId);
    if (it == units_.end() || it->second.faulted) {
        return std::nullopt;
    }
    Unit& unit = it->second;
    ++unit.submits;
    
    std::string jobId = unit.info.id + "-" + std::to_string(nextJobId_++);
    auto j = std::make_unique<Job>();
    j->deviceId = deviceId;
    j->work = job;
    Job* raw = j.get();
    j->worker = std::thread(&SimulatedDeviceLink::RunJob, std::ref(*raw),
                            unit.stalled, unit.invalidNonce);
    jobs_.emplace(jobId, std::move(j));
    return jobId;
}

PollResult SimulatedDeviceLink::Poll(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(jobId);
    if (it == jobs_.end()) {
        return PollResult::Fault("unknown job " + jobId);
    }
    Job& job = *it->second;
    const Unit& unit = units_.at(job.deviceId);
    
    PollResult result;
    result.telemetry = unit.info.telemetry;
    if (unit.faulted) {
        result.status = PollStatus::Fault;
        result.detail = unit.faultReason;
        return result;
    }
    if (job.found.load()) {
        result.status = PollStatus::Found;
        result.nonce = job.nonce.load();
    } else if (job.done.load()) {
        result.status = PollStatus::Exhausted;
    }
    return result;
}

void SimulatedDeviceLink::Cancel(const std::string& jobId) {
    std::unique_ptr<Job> job;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(jobId);
        if (it == jobs_.end()) {
            return;
        }
        job = std::move(it->second);
        jobs_.erase(it);
    }
    StopJob(*job);
}

void SimulatedDeviceLink::StopJob(Job& job) {
    job.cancel = true;
    if (job.worker.joinable()) {
        job.worker.join();
    }
}

void SimulatedDeviceLink::InjectFault(const std::string& deviceId, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = units_.find(deviceId);
    if (it != units_.end()) {
        it->second.faulted = true;
        it->second.faultReason = reason;
    }
}

void SimulatedDeviceLink::InjectInvalidNonce(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = units_.find(deviceId);
    if (it != units_.end()) {
        it->second.invalidNonce = true;
    }
}

void SimulatedDeviceLink::SetTemperature(const std::string& deviceId, double celsius) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = units_.find(deviceId);
    if (it != units_.end()) {
        it->second.info.telemetry.temperatureC = celsius;
    }
}

void SimulatedDeviceLink::SetStalled(const std::string& deviceId, bool stalled) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = units_.find(deviceId);
    if (it != units_.end()) {
        it->second.stalled = stalled;
    }
}

void SimulatedDeviceLink::Recover(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = units_.find(deviceId);
    if (it != units_.end()) {
        Unit& unit = it->second;
        unit.faulted = false;
        unit.faultReason.clear();
        unit.invalidNonce = false;
        unit.stalled = false;
        unit.info.telemetry.temperatureC = NORMAL_TEMPERATURE_C;
        LOG_DEBUG(util::LogCategory::DEVICE) << "Simulated unit " << deviceId << " recovered";
    }
}

size_t SimulatedDeviceLink::SubmitCount(const std::string& deviceId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = units_.find(deviceId);
    return it == units_.end() ? 0 : it->second.submits;
}

size_t SimulatedDeviceLink::ActiveJobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

} // namespace miner
} // namespace zeus
