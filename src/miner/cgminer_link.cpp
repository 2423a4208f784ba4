// ZEUS - cgminer Device Link Implementation
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include "zeus/miner/cgminer_link.h"
#include "zeus/core/hex.h"
#include "zeus/util/logging.h"
#include "zeus/util/socket.h"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace zeus {
namespace miner {

using util::JSONValue;

namespace {

/// cgminer reports numbers either as JSON numbers or as strings
double NumberField(const JSONValue& obj, const char* key) {
    const JSONValue* v = obj.Find(key);
    if (!v) return 0.0;
    if (v->IsNumber()) return v->GetDouble();
    if (v->IsString()) {
        try {
            return std::stod(v->GetString());
        } catch (const std::exception&) {
            return 0.0;
        }
    }
    return 0.0;
}

std::string StringField(const JSONValue& obj, const char* key) {
    const JSONValue* v = obj.Find(key);
    if (!v) return {};
    if (v->IsString()) return v->GetString();
    if (v->IsInt()) return std::to_string(v->GetInt());
    return {};
}

DeviceTelemetry ParseTelemetry(const JSONValue& obj) {
    DeviceTelemetry t;
    t.temperatureC = NumberField(obj, "Temperature");
    t.hashrateKhs = NumberField(obj, "KHS 5s");
    t.accepted = static_cast<uint64_t>(std::max(0.0, NumberField(obj, "Accepted")));
    t.rejected = static_cast<uint64_t>(std::max(0.0, NumberField(obj, "Rejected")));
    t.hardwareErrors = static_cast<uint64_t>(std::max(0.0, NumberField(obj, "Hardware Errors")));
    return t;
}

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

// ============================================================================
// Response Parsing
// ============================================================================

std::optional<JSONValue> CgminerLink::ParseResponse(const std::string& raw) {
    std::string data = raw;
    data.erase(std::remove(data.begin(), data.end(), '\0'), data.end());
    
    size_t pos = data.find("}{");
    if (pos != std::string::npos) {
        std::string repaired = "[";
        size_t start = 0;
        while (pos != std::string::npos) {
            repaired.append(data, start, pos + 1 - start);
            repaired += ",";
            start = pos + 1;
            pos = data.find("}{", start);
        }
        repaired.append(data, start, std::string::npos);
        repaired += "]";
        data.swap(repaired);
    }
    return JSONValue::TryParse(data);
}

const JSONValue* CgminerLink::FindSection(const JSONValue& response, const std::string& key) {
    if (response.IsObject()) {
        return response.Find(key);
    }
    if (response.IsArray()) {
        for (const JSONValue& element : response.GetArray()) {
            if (const JSONValue* found = element.Find(key)) {
                return found;
            }
        }
    }
    return nullptr;
}

bool CgminerLink::IsSuccess(const JSONValue& response, std::string& message) {
    const JSONValue* status = FindSection(response, "STATUS");
    if (!status || !status->IsArray() || status->Size() == 0) {
        return true;
    }
    const JSONValue& first = (*status)[size_t{0}];
    std::string code = StringField(first, "STATUS");
    message = StringField(first, "Msg");
    return code != "E" && code != "F";
}

std::vector<DeviceInfo> CgminerLink::ParseDevices(const JSONValue& response) {
    std::vector<DeviceInfo> devices;
    const JSONValue* devs = FindSection(response, "DEVS");
    if (!devs || !devs->IsArray()) {
        return devices;
    }
    for (const JSONValue& dev : devs->GetArray()) {
        DeviceInfo info;
        info.name = StringField(dev, "Name");
        if (Lower(info.name).find("zeus") == std::string::npos) {
            continue;
        }
        info.id = StringField(dev, "ID");
        info.enabled = StringField(dev, "Enabled") == "Y";
        info.status = StringField(dev, "Status");
        info.telemetry = ParseTelemetry(dev);
        devices.push_back(std::move(info));
    }
    return devices;
}

PollResult CgminerLink::ParsePoll(const JSONValue& response) {
    const JSONValue* poll = FindSection(response, "POLL");
    if (!poll || !poll->IsArray() || poll->Size() == 0) {
        return PollResult::Fault("malformed poll response");
    }
    const JSONValue& entry = (*poll)[size_t{0}];
    
    PollResult result;
    result.telemetry = ParseTelemetry(entry);
    std::string status = Lower(StringField(entry, "Status"));
    if (status == "pending") {
        result.status = PollStatus::Pending;
    } else if (status == "found") {
        double nonce = NumberField(entry, "Nonce");
        if (nonce < 0 || nonce > 4294967295.0) {
            return PollResult::Fault("nonce out of range");
        }
        result.status = PollStatus::Found;
        result.nonce = static_cast<uint32_t>(nonce);
    } else if (status == "exhausted") {
        result.status = PollStatus::Exhausted;
    } else {
        result.status = PollStatus::Fault;
        result.detail = StringField(entry, "Reason");
        if (result.detail.empty()) {
            result.detail = status.empty() ? "no status" : status;
        }
    }
    return result;
}

// ============================================================================
// Commands
// ============================================================================

std::optional<JSONValue> CgminerLink::Command(const std::string& command,
                                              const std::string& parameter,
                                              std::string& error) {
    util::TcpStream stream = util::TcpStream::Connect(host_, port_, timeoutMs_, error);
    if (!stream.IsOpen()) {
        return std::nullopt;
    }
    
    JSONValue request;
    request["command"] = command;
    if (!parameter.empty()) {
        request["parameter"] = parameter;
    }
    if (!stream.SendAll(request.ToJSON() + "\n")) {
        error = "send failed";
        return std::nullopt;
    }
    
    std::string raw;
    if (!stream.ReadUntilClose(raw) || raw.empty()) {
        error = "empty response";
        return std::nullopt;
    }
    
    auto parsed = ParseResponse(raw);
    if (!parsed) {
        error = "invalid JSON response";
    }
    return parsed;
}

std::vector<DeviceInfo> CgminerLink::ListDevices() {
    std::string error;
    auto response = Command("devs", "", error);
    if (!response) {
        LOG_WARN(util::LogCategory::DEVICE) << "cgminer devs failed: " << error;
        return {};
    }
    return ParseDevices(*response);
}

std::optional<DeviceInfo> CgminerLink::Probe(const std::string& deviceId) {
    for (DeviceInfo& info : ListDevices()) {
        if (info.id == deviceId) {
            return std::move(info);
        }
    }
    return std::nullopt;
}

std::optional<std::string> CgminerLink::Submit(const std::string& deviceId, const DeviceJob& job) {
    char targetHex[9];
    std::snprintf(targetHex, sizeof(targetHex), "%08x", job.target);
    std::string parameter = deviceId + "," + BytesToHex(job.payload) + "," + targetHex + "," +
                            std::to_string(job.range.first) + "," + std::to_string(job.range.last) +
                            "," + protocol::PowAlgorithmToString(job.algorithm);
    
    std::string error;
    auto response = Command("zeusjob", parameter, error);
    if (!response) {
        LOG_WARN(util::LogCategory::DEVICE) << "zeusjob on " << deviceId << " failed: " << error;
        return std::nullopt;
    }
    if (!IsSuccess(*response, error)) {
        LOG_WARN(util::LogCategory::DEVICE) << "zeusjob on " << deviceId << " refused: " << error;
        return std::nullopt;
    }
    const JSONValue* jobSection = FindSection(*response, "JOB");
    if (!jobSection || !jobSection->IsArray() || jobSection->Size() == 0) {
        LOG_WARN(util::LogCategory::DEVICE) << "zeusjob on " << deviceId << " returned no job id";
        return std::nullopt;
    }
    std::string jobId = StringField((*jobSection)[size_t{0}], "JobID");
    if (jobId.empty()) {
        return std::nullopt;
    }
    return jobId;
}

PollResult CgminerLink::Poll(const std::string& jobId) {
    std::string error;
    auto response = Command("zeuspoll", jobId, error);
    if (!response) {
        return PollResult::Fault("zeuspoll: " + error);
    }
    if (!IsSuccess(*response, error)) {
        return PollResult::Fault("zeuspoll: " + error);
    }
    return ParsePoll(*response);
}

void CgminerLink::Cancel(const std::string& jobId) {
    std::string error;
    auto response = Command("zeuscancel", jobId, error);
    if (!response) {
        LOG_DEBUG(util::LogCategory::DEVICE) << "zeuscancel " << jobId << " failed: " << error;
    }
}

} // namespace miner
} // namespace zeus
