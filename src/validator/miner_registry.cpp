// ZEUS - Miner Registry Implementation
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include "zeus/validator/miner_registry.h"
#include "zeus/util/logging.h"
#include "zeus/util/socket.h"

namespace zeus {
namespace validator {

// ============================================================================
// MinerEndpoint
// ============================================================================

std::optional<MinerEndpoint> MinerEndpoint::Parse(const std::string& entry) {
    size_t at = entry.find('@');
    if (at == std::string::npos || at == 0) {
        return std::nullopt;
    }
    MinerEndpoint ep;
    ep.id = entry.substr(0, at);
    if (!util::SplitHostPort(entry.substr(at + 1), ep.host, ep.port) || ep.port == 0) {
        return std::nullopt;
    }
    return ep;
}

std::string MinerEndpoint::ToString() const {
    return id + "@" + host + ":" + std::to_string(port);
}

// ============================================================================
// MinerRegistry
// ============================================================================

MinerRegistry::MinerRegistry(util::ThreadPool& pool, const DifficultyController& controller)
    : pool_(pool), controller_(controller) {}

MinerRegistry::~MinerRegistry() {
    DrainAll();
}

bool MinerRegistry::Add(const MinerEndpoint& endpoint, TimestampMs now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.count(endpoint.id)) {
        return false;
    }
    
    auto entry = std::make_unique<Entry>();
    entry->endpoint = endpoint;
    auto restored = restored_.find(endpoint.id);
    if (restored != restored_.end()) {
        entry->record = restored->second;
        restored_.erase(restored);
        LOG_INFO(util::LogCategory::DEFAULT) << "Registered " << endpoint.ToString()
                                             << " with restored record ("
                                             << entry->record.challengeCount << " challenges)";
    } else {
        entry->record = controller_.NewRecord(endpoint.id, now);
        LOG_INFO(util::LogCategory::DEFAULT) << "Registered " << endpoint.ToString();
    }
    entry->queue = std::make_unique<util::SerialQueue>(pool_, "miner-" + endpoint.id);
    entries_.emplace(endpoint.id, std::move(entry));
    return true;
}

void MinerRegistry::Restore(const std::vector<MinerRecord>& records) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (MinerRecord r : records) {
        uint32_t target = controller_.Clamp(r.difficulty.target);
        if (target != r.difficulty.target) {
            LOG_WARN(util::LogCategory::DIFFICULTY) << "Restored target 0x" << std::hex
                << r.difficulty.target << " for " << r.minerId << " clamped to 0x"
                << target << std::dec;
            r.difficulty.target = target;
        }
        auto it = entries_.find(r.minerId);
        if (it != entries_.end()) {
            std::lock_guard<std::mutex> recordLock(it->second->mutex);
            it->second->record = r;
        } else {
            restored_[r.minerId] = r;
        }
    }
}

MinerRegistry::Entry* MinerRegistry::Find(const MinerId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : it->second.get();
}

std::vector<MinerRegistry::Entry*> MinerRegistry::AllEntries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Entry*> all;
    all.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        all.push_back(entry.get());
    }
    return all;
}

bool MinerRegistry::Contains(const MinerId& id) const {
    return Find(id) != nullptr;
}

size_t MinerRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::vector<MinerEndpoint> MinerRegistry::Endpoints() const {
    std::vector<MinerEndpoint> result;
    for (Entry* e : AllEntries()) {
        result.push_back(e->endpoint);
    }
    return result;
}

bool MinerRegistry::Post(const MinerId& id, RecordUpdate update) {
    Entry* entry = Find(id);
    if (!entry) {
        return false;
    }
    entry->queue->Post([entry, update = std::move(update)]() {
        std::lock_guard<std::mutex> lock(entry->mutex);
        update(entry->record);
    });
    return true;
}

std::optional<MinerRecord> MinerRegistry::Snapshot(const MinerId& id) const {
    Entry* entry = Find(id);
    if (!entry) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->record;
}

std::vector<MinerRecord> MinerRegistry::SnapshotAll() const {
    std::vector<MinerRecord> result;
    for (Entry* e : AllEntries()) {
        std::lock_guard<std::mutex> lock(e->mutex);
        result.push_back(e->record);
    }
    return result;
}

void MinerRegistry::DrainAll() {
    for (Entry* e : AllEntries()) {
        e->queue->Drain();
    }
}

void MinerRegistry::WithAllRecords(const std::function<void(std::vector<MinerRecord*>&)>& fn) {
    DrainAll();
    
    std::vector<Entry*> all = AllEntries();
    std::vector<std::unique_lock<std::mutex>> locks;
    std::vector<MinerRecord*> records;
    locks.reserve(all.size());
    records.reserve(all.size());
    for (Entry* e : all) {
        locks.emplace_back(e->mutex);
        records.push_back(&e->record);
    }
    fn(records);
}

} // namespace validator
} // namespace zeus
