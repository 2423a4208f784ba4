// ZEUS - Device Link Tests
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include <gtest/gtest.h>

#include "zeus/miner/device_link.h"
#include "zeus/miner/simulated_device.h"
#include "zeus/core/random.h"

#include <chrono>
#include <thread>

namespace zeus {
namespace miner {
namespace test {

// ============================================================================
// Nonce Ranges
// ============================================================================

TEST(NonceRangeTest, FullRange) {
    NonceRange full = NonceRange::Full();
    EXPECT_EQ(full.first, 0u);
    EXPECT_EQ(full.last, 0xffffffffu);
    EXPECT_EQ(full.Size(), 0x100000000ULL);
    EXPECT_TRUE(full.Contains(0));
    EXPECT_TRUE(full.Contains(0xffffffff));
}

TEST(NonceRangeTest, SplitCoversWithoutOverlap) {
    std::vector<NonceRange> parts = NonceRange::Full().Split(3);
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0].first, 0u);
    EXPECT_EQ(parts.back().last, 0xffffffffu);

    uint64_t total = 0;
    for (size_t i = 0; i < parts.size(); ++i) {
        total += parts[i].Size();
        if (i > 0) {
            EXPECT_EQ(static_cast<uint64_t>(parts[i - 1].last) + 1, parts[i].first);
        }
    }
    EXPECT_EQ(total, 0x100000000ULL);
}

TEST(NonceRangeTest, SplitRemainderGoesToFirstParts) {
    NonceRange r{10, 19};
    std::vector<NonceRange> parts = r.Split(3);
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0].Size(), 4u);
    EXPECT_EQ(parts[1].Size(), 3u);
    EXPECT_EQ(parts[2].Size(), 3u);
    EXPECT_EQ(parts[0].first, 10u);
    EXPECT_EQ(parts[2].last, 19u);
}

TEST(NonceRangeTest, SplitEdgeCases) {
    NonceRange small{5, 6};
    EXPECT_TRUE(small.Split(0).empty());
    // Never more parts than nonces
    EXPECT_EQ(small.Split(8).size(), 2u);

    std::vector<NonceRange> one = small.Split(1);
    ASSERT_EQ(one.size(), 1u);
    EXPECT_EQ(one[0].first, 5u);
    EXPECT_EQ(one[0].last, 6u);
    EXPECT_FALSE(small.Contains(4));
    EXPECT_FALSE(small.Contains(7));
}

// ============================================================================
// Health
// ============================================================================

TEST(DeviceHealthTest, HardwareErrorRate) {
    DeviceTelemetry t;
    EXPECT_DOUBLE_EQ(t.HardwareErrorRate(), 0.0);
    t.accepted = 90;
    t.rejected = 5;
    t.hardwareErrors = 5;
    EXPECT_DOUBLE_EQ(t.HardwareErrorRate(), 0.05);
}

TEST(DeviceHealthTest, HealthyUnit) {
    DeviceInfo d;
    d.id = "0";
    d.telemetry.temperatureC = 60.0;
    d.telemetry.accepted = 1000;
    d.telemetry.hardwareErrors = 10;
    EXPECT_TRUE(EvaluateHealth(d, HealthPolicy{}).healthy);
}

TEST(DeviceHealthTest, ThermalLimitIsInclusive) {
    DeviceInfo d;
    d.telemetry.temperatureC = 80.0;
    HealthReport report = EvaluateHealth(d, HealthPolicy{});
    EXPECT_FALSE(report.healthy);
    EXPECT_NE(report.reason.find("over temperature"), std::string::npos);

    d.telemetry.temperatureC = 79.9;
    EXPECT_TRUE(EvaluateHealth(d, HealthPolicy{}).healthy);
}

TEST(DeviceHealthTest, ErrorRateOverLimit) {
    DeviceTelemetry t;
    t.accepted = 97;
    t.hardwareErrors = 3;
    HealthReport report = EvaluateTelemetry(t, HealthPolicy{});
    EXPECT_FALSE(report.healthy);
    EXPECT_NE(report.reason.find("hardware error rate"), std::string::npos);

    HealthPolicy lenient;
    lenient.maxHardwareErrorRate = 0.05;
    EXPECT_TRUE(EvaluateTelemetry(t, lenient).healthy);
}

TEST(DeviceHealthTest, DisabledAndNotAlive) {
    DeviceInfo d;
    d.enabled = false;
    EXPECT_EQ(EvaluateHealth(d, HealthPolicy{}).reason, "disabled");

    d.enabled = true;
    d.status = "Dead";
    EXPECT_EQ(EvaluateHealth(d, HealthPolicy{}).reason, "status Dead");
}

TEST(DeviceHealthTest, PollStatusNames) {
    EXPECT_STREQ(PollStatusToString(PollStatus::Pending), "pending");
    EXPECT_STREQ(PollStatusToString(PollStatus::Found), "found");
    EXPECT_STREQ(PollStatusToString(PollStatus::Exhausted), "exhausted");
    EXPECT_STREQ(PollStatusToString(PollStatus::Fault), "fault");
}

// ============================================================================
// Simulated Units
// ============================================================================

class SimulatedDeviceTest : public ::testing::Test {
protected:
    SimulatedDeviceTest() : link_(2) {
        SeededRandom rng(5);
        job_.payload = protocol::BuildHeaderTemplate(0x0fffffff, 1700000000, rng);
        job_.target = 0x0fffffff;
        job_.algorithm = protocol::PowAlgorithm::Sha256d;
    }

    PollResult WaitForResult(const std::string& jobId) {
        for (int i = 0; i < 400; ++i) {
            PollResult poll = link_.Poll(jobId);
            if (poll.status != PollStatus::Pending) {
                return poll;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return link_.Poll(jobId);
    }

    SimulatedDeviceLink link_;
    DeviceJob job_;
};

TEST_F(SimulatedDeviceTest, ListsUnits) {
    std::vector<DeviceInfo> devices = link_.ListDevices();
    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].id, "sim0");
    EXPECT_EQ(devices[1].id, "sim1");
    EXPECT_EQ(devices[0].status, "Alive");
    EXPECT_TRUE(EvaluateHealth(devices[0], HealthPolicy{}).healthy);

    EXPECT_TRUE(link_.Probe("sim1").has_value());
    EXPECT_FALSE(link_.Probe("sim9").has_value());
}

TEST_F(SimulatedDeviceTest, SolvesJob) {
    auto jobId = link_.Submit("sim0", job_);
    ASSERT_TRUE(jobId.has_value());
    EXPECT_EQ(link_.SubmitCount("sim0"), 1u);

    PollResult poll = WaitForResult(*jobId);
    ASSERT_EQ(poll.status, PollStatus::Found);
    EXPECT_TRUE(protocol::CheckProofOfWork(job_.payload, poll.nonce, job_.target, job_.algorithm));

    link_.Cancel(*jobId);
    EXPECT_EQ(link_.ActiveJobs(), 0u);
}

TEST_F(SimulatedDeviceTest, SmallRangeIsExhausted) {
    job_.target = 0;
    job_.range = NonceRange{0, 15};
    auto jobId = link_.Submit("sim1", job_);
    ASSERT_TRUE(jobId.has_value());
    EXPECT_EQ(WaitForResult(*jobId).status, PollStatus::Exhausted);
    link_.Cancel(*jobId);
}

TEST_F(SimulatedDeviceTest, InjectedFault) {
    link_.InjectFault("sim0", "bus error");
    EXPECT_EQ(link_.Probe("sim0")->status, "Sick");
    EXPECT_FALSE(link_.Submit("sim0", job_).has_value());

    link_.Recover("sim0");
    EXPECT_EQ(link_.Probe("sim0")->status, "Alive");
    EXPECT_TRUE(link_.Submit("sim0", job_).has_value());
}

TEST_F(SimulatedDeviceTest, FaultDuringJob) {
    link_.SetStalled("sim0", true);
    auto jobId = link_.Submit("sim0", job_);
    ASSERT_TRUE(jobId.has_value());
    EXPECT_EQ(link_.Poll(*jobId).status, PollStatus::Pending);

    link_.InjectFault("sim0", "chip timeout");
    PollResult poll = link_.Poll(*jobId);
    EXPECT_EQ(poll.status, PollStatus::Fault);
    EXPECT_EQ(poll.detail, "chip timeout");
    link_.Cancel(*jobId);
}

TEST_F(SimulatedDeviceTest, InvalidNonceMissesTarget) {
    link_.InjectInvalidNonce("sim1");
    auto jobId = link_.Submit("sim1", job_);
    ASSERT_TRUE(jobId.has_value());
    PollResult poll = WaitForResult(*jobId);
    ASSERT_EQ(poll.status, PollStatus::Found);
    EXPECT_FALSE(protocol::CheckProofOfWork(job_.payload, poll.nonce, job_.target, job_.algorithm));
    link_.Cancel(*jobId);
}

TEST_F(SimulatedDeviceTest, TemperatureIsReported) {
    link_.SetTemperature("sim1", 91.0);
    std::vector<DeviceInfo> devices = link_.ListDevices();
    EXPECT_DOUBLE_EQ(devices[1].telemetry.temperatureC, 91.0);
    EXPECT_FALSE(EvaluateHealth(devices[1], HealthPolicy{}).healthy);
}

TEST_F(SimulatedDeviceTest, UnknownJob) {
    EXPECT_EQ(link_.Poll("nope").status, PollStatus::Fault);
    link_.Cancel("nope");
}

} // namespace test
} // namespace miner
} // namespace zeus
