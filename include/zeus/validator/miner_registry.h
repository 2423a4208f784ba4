// ZEUS - Miner Registry
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// Registered miners, their endpoints and their records. Each record has
// exactly one owner: a SerialQueue that applies posted updates in order.

#ifndef ZEUS_VALIDATOR_MINER_REGISTRY_H
#define ZEUS_VALIDATOR_MINER_REGISTRY_H

#include "zeus/util/threadpool.h"
#include "zeus/validator/difficulty_controller.h"
#include "zeus/validator/miner_record.h"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace zeus {
namespace validator {

/// Where a miner daemon listens
struct MinerEndpoint {
    MinerId id;
    std::string host;
    uint16_t port{0};
    
    /// Parse "id@host:port"
    static std::optional<MinerEndpoint> Parse(const std::string& entry);
    std::string ToString() const;
};

class MinerRegistry {
public:
    using RecordUpdate = std::function<void(MinerRecord&)>;
    
    MinerRegistry(util::ThreadPool& pool, const DifficultyController& controller);
    
    /// Drains every queue
    ~MinerRegistry();
    
    MinerRegistry(const MinerRegistry&) = delete;
    MinerRegistry& operator=(const MinerRegistry&) = delete;
    
    /// Register a miner; a restored record is reused if one exists
    bool Add(const MinerEndpoint& endpoint, TimestampMs now);
    
    /// Records loaded from a checkpoint; applied to miners as they are added.
    /// Targets outside the configured difficulty range are clamped.
    void Restore(const std::vector<MinerRecord>& records);
    
    bool Contains(const MinerId& id) const;
    size_t Size() const;
    std::vector<MinerEndpoint> Endpoints() const;
    
    /// Queue an update on the miner's serial queue. False if unknown.
    bool Post(const MinerId& id, RecordUpdate update);
    
    /// Consistent copy of one record
    std::optional<MinerRecord> Snapshot(const MinerId& id) const;
    std::vector<MinerRecord> SnapshotAll() const;
    
    /// Wait until every queued update has been applied
    void DrainAll();
    
    /**
     * Drain, then run fn with exclusive access to every record.
     * Updates posted concurrently wait until fn returns.
     */
    void WithAllRecords(const std::function<void(std::vector<MinerRecord*>&)>& fn);

private:
    struct Entry {
        MinerEndpoint endpoint;
        mutable std::mutex mutex;
        MinerRecord record;
        std::unique_ptr<util::SerialQueue> queue;
    };
    
    Entry* Find(const MinerId& id) const;
    std::vector<Entry*> AllEntries() const;
    
    util::ThreadPool& pool_;
    const DifficultyController& controller_;
    
    mutable std::mutex mutex_;
    std::map<MinerId, std::unique_ptr<Entry>> entries_;
    std::map<MinerId, MinerRecord> restored_;
};

} // namespace validator
} // namespace zeus

#endif // ZEUS_VALIDATOR_MINER_REGISTRY_H
