// ZEUS - cgminer Device Link Tests
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include <gtest/gtest.h>

#include "zeus/miner/cgminer_link.h"

namespace zeus {
namespace miner {
namespace test {

using util::JSONValue;

// ============================================================================
// Response Parsing
// ============================================================================

TEST(CgminerParseTest, PlainObject) {
    auto parsed = CgminerLink::ParseResponse(R"({"STATUS":[{"STATUS":"S","Msg":"ok"}]})");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->IsObject());
}

TEST(CgminerParseTest, TrailingNulIsDropped) {
    std::string raw = R"({"STATUS":[{"STATUS":"S"}]})";
    raw.push_back('\0');
    auto parsed = CgminerLink::ParseResponse(raw);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->IsObject());
}

TEST(CgminerParseTest, ConcatenatedObjectsBecomeArray) {
    std::string raw = R"({"STATUS":[{"STATUS":"S"}]}{"DEVS":[]}{"id":3})";
    raw.push_back('\0');
    auto parsed = CgminerLink::ParseResponse(raw);
    ASSERT_TRUE(parsed.has_value());
    ASSERT_TRUE(parsed->IsArray());
    EXPECT_EQ(parsed->Size(), 3u);

    const JSONValue* devs = CgminerLink::FindSection(*parsed, "DEVS");
    ASSERT_NE(devs, nullptr);
    EXPECT_TRUE(devs->IsArray());
    EXPECT_EQ(CgminerLink::FindSection(*parsed, "POLL"), nullptr);
}

TEST(CgminerParseTest, GarbageIsRejected) {
    EXPECT_FALSE(CgminerLink::ParseResponse("not json").has_value());
    EXPECT_FALSE(CgminerLink::ParseResponse("").has_value());
}

TEST(CgminerParseTest, StatusCodes) {
    std::string message;
    auto ok = CgminerLink::ParseResponse(R"({"STATUS":[{"STATUS":"S","Msg":"Job queued"}]})");
    ASSERT_TRUE(ok.has_value());
    EXPECT_TRUE(CgminerLink::IsSuccess(*ok, message));
    EXPECT_EQ(message, "Job queued");

    auto err = CgminerLink::ParseResponse(R"({"STATUS":[{"STATUS":"E","Msg":"Invalid device"}]})");
    ASSERT_TRUE(err.has_value());
    EXPECT_FALSE(CgminerLink::IsSuccess(*err, message));
    EXPECT_EQ(message, "Invalid device");

    auto fatal = CgminerLink::ParseResponse(R"({"STATUS":[{"STATUS":"F"}]})");
    ASSERT_TRUE(fatal.has_value());
    EXPECT_FALSE(CgminerLink::IsSuccess(*fatal, message));

    // No STATUS section at all
    auto bare = CgminerLink::ParseResponse(R"({"DEVS":[]})");
    ASSERT_TRUE(bare.has_value());
    EXPECT_TRUE(CgminerLink::IsSuccess(*bare, message));
}

// ============================================================================
// Devices
// ============================================================================

TEST(CgminerParseTest, ParseDevicesFields) {
    auto response = CgminerLink::ParseResponse(R"({
        "DEVS":[
            {"ID":0,"Name":"Zeus","Enabled":"Y","Status":"Alive","Temperature":61.5,
             "KHS 5s":"320.5","Accepted":120,"Rejected":2,"Hardware Errors":"1"},
            {"ID":1,"Name":"GPU","Enabled":"Y","Status":"Alive"},
            {"ID":2,"Name":"ZEUS Blizzard","Enabled":"N","Status":"Sick","Temperature":"85"}
        ]})");
    ASSERT_TRUE(response.has_value());

    std::vector<DeviceInfo> devices = CgminerLink::ParseDevices(*response);
    ASSERT_EQ(devices.size(), 2u);

    EXPECT_EQ(devices[0].id, "0");
    EXPECT_EQ(devices[0].name, "Zeus");
    EXPECT_TRUE(devices[0].enabled);
    EXPECT_DOUBLE_EQ(devices[0].telemetry.temperatureC, 61.5);
    EXPECT_DOUBLE_EQ(devices[0].telemetry.hashrateKhs, 320.5);
    EXPECT_EQ(devices[0].telemetry.accepted, 120u);
    EXPECT_EQ(devices[0].telemetry.rejected, 2u);
    EXPECT_EQ(devices[0].telemetry.hardwareErrors, 1u);

    EXPECT_EQ(devices[1].id, "2");
    EXPECT_FALSE(devices[1].enabled);
    EXPECT_EQ(devices[1].status, "Sick");
    EXPECT_DOUBLE_EQ(devices[1].telemetry.temperatureC, 85.0);
    EXPECT_FALSE(EvaluateHealth(devices[1], HealthPolicy{}).healthy);
}

TEST(CgminerParseTest, ParseDevicesWithoutSection) {
    auto response = CgminerLink::ParseResponse(R"({"STATUS":[{"STATUS":"S"}]})");
    ASSERT_TRUE(response.has_value());
    EXPECT_TRUE(CgminerLink::ParseDevices(*response).empty());
}

// ============================================================================
// Poll
// ============================================================================

namespace {

PollResult ParsePollText(const std::string& text) {
    auto response = CgminerLink::ParseResponse(text);
    EXPECT_TRUE(response.has_value());
    return response ? CgminerLink::ParsePoll(*response) : PollResult::Fault("parse");
}

} // namespace

TEST(CgminerPollTest, Pending) {
    PollResult r = ParsePollText(R"({"POLL":[{"Status":"Pending","Temperature":58}]})");
    EXPECT_EQ(r.status, PollStatus::Pending);
    EXPECT_DOUBLE_EQ(r.telemetry.temperatureC, 58.0);
}

TEST(CgminerPollTest, Found) {
    PollResult r = ParsePollText(R"({"POLL":[{"Status":"found","Nonce":4294967295}]})");
    EXPECT_EQ(r.status, PollStatus::Found);
    EXPECT_EQ(r.nonce, 0xffffffffu);

    r = ParsePollText(R"({"POLL":[{"Status":"Found","Nonce":"1234"}]})");
    EXPECT_EQ(r.status, PollStatus::Found);
    EXPECT_EQ(r.nonce, 1234u);
}

TEST(CgminerPollTest, NonceOutOfRangeIsFault) {
    PollResult r = ParsePollText(R"({"POLL":[{"Status":"Found","Nonce":4294967296}]})");
    EXPECT_EQ(r.status, PollStatus::Fault);
    r = ParsePollText(R"({"POLL":[{"Status":"Found","Nonce":-1}]})");
    EXPECT_EQ(r.status, PollStatus::Fault);
}

TEST(CgminerPollTest, Exhausted) {
    EXPECT_EQ(ParsePollText(R"({"POLL":[{"Status":"Exhausted"}]})").status, PollStatus::Exhausted);
}

TEST(CgminerPollTest, FaultCarriesReason) {
    PollResult r = ParsePollText(R"({"POLL":[{"Status":"Fault","Reason":"chip 3 timeout"}]})");
    EXPECT_EQ(r.status, PollStatus::Fault);
    EXPECT_EQ(r.detail, "chip 3 timeout");

    r = ParsePollText(R"({"POLL":[{"Status":"overheat"}]})");
    EXPECT_EQ(r.status, PollStatus::Fault);
    EXPECT_EQ(r.detail, "overheat");
}

TEST(CgminerPollTest, MalformedPoll) {
    EXPECT_EQ(ParsePollText(R"({"POLL":[]})").status, PollStatus::Fault);
    EXPECT_EQ(ParsePollText(R"({"STATUS":[{"STATUS":"S"}]})").status, PollStatus::Fault);
}

// ============================================================================
// Unreachable API
// ============================================================================

TEST(CgminerLinkTest, UnreachableApiDegradesGracefully) {
    // Nothing listens on port 1
    CgminerLink link("127.0.0.1", 1, 200);
    EXPECT_TRUE(link.ListDevices().empty());
    EXPECT_FALSE(link.Probe("0").has_value());

    DeviceJob job;
    job.payload = Bytes(76, 0);
    job.target = 0xffff;
    EXPECT_FALSE(link.Submit("0", job).has_value());
    EXPECT_EQ(link.Poll("job-1").status, PollStatus::Fault);
    link.Cancel("job-1");
}

} // namespace test
} // namespace miner
} // namespace zeus
