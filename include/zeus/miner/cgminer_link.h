// ZEUS - cgminer Device Link
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// IDeviceLink over the cgminer JSON API (default 127.0.0.1:4028) with the
// zeusjob / zeuspoll / zeuscancel extensions of the Zeus ASIC driver.

#ifndef ZEUS_MINER_CGMINER_LINK_H
#define ZEUS_MINER_CGMINER_LINK_H

#include "zeus/miner/device_link.h"
#include "zeus/util/json.h"

#include <optional>
#include <string>

namespace zeus {
namespace miner {

class CgminerLink : public IDeviceLink {
public:
    static constexpr uint16_t DEFAULT_PORT = 4028;
    
    CgminerLink(std::string host, uint16_t port, int64_t timeoutMs = 2000)
        : host_(std::move(host)), port_(port), timeoutMs_(timeoutMs) {}
    
    std::vector<DeviceInfo> ListDevices() override;
    std::optional<DeviceInfo> Probe(const std::string& deviceId) override;
    std::optional<std::string> Submit(const std::string& deviceId, const DeviceJob& job) override;
    PollResult Poll(const std::string& jobId) override;
    void Cancel(const std::string& jobId) override;
    
    /// Send one command; nullopt (with error set) on I/O or parse failure
    std::optional<util::JSONValue> Command(const std::string& command,
                                           const std::string& parameter,
                                           std::string& error);
    
    // ========================================================================
    // Response Parsing
    // ========================================================================
    
    /**
     * Parse a raw API response: trailing NUL bytes are dropped and
     * concatenated objects ("}{") are repaired into an array.
     */
    static std::optional<util::JSONValue> ParseResponse(const std::string& raw);
    
    /// First member named key in an object, or in any object of an array
    static const util::JSONValue* FindSection(const util::JSONValue& response,
                                              const std::string& key);
    
    /// True unless STATUS reports "E" or "F"
    static bool IsSuccess(const util::JSONValue& response, std::string& message);
    
    /// Zeus units from a devs response
    static std::vector<DeviceInfo> ParseDevices(const util::JSONValue& response);
    
    static PollResult ParsePoll(const util::JSONValue& response);

private:
    std::string host_;
    uint16_t port_;
    int64_t timeoutMs_;
};

} // namespace miner
} // namespace zeus

#endif // ZEUS_MINER_CGMINER_LINK_H
