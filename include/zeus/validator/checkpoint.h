// ZEUS - Validator Checkpoints
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// Persists miner records so that a restarted validator keeps the trend
// state it had built up.

#ifndef ZEUS_VALIDATOR_CHECKPOINT_H
#define ZEUS_VALIDATOR_CHECKPOINT_H

#include "zeus/db/database.h"
#include "zeus/validator/miner_record.h"
#include "zeus/validator/weight_aggregator.h"

#include <vector>

namespace zeus {
namespace validator {

class CheckpointStore {
public:
    /// db must outlive the store
    explicit CheckpointStore(db::Database& db) : db_(db) {}
    
    /// Write every record and the epoch counter in one atomic batch
    db::Status Save(const std::vector<MinerRecord>& records, uint64_t epoch);
    
    /// Read back all records; undecodable entries are skipped with a warning
    db::Status Load(std::vector<MinerRecord>& records);
    
    /// Epoch counter from the last Save (0 if none)
    uint64_t LoadEpoch();
    
    /// Keep the last exported weight vector next to the records
    db::Status SaveWeights(const WeightVector& weights);

private:
    db::Database& db_;
};

} // namespace validator
} // namespace zeus

#endif // ZEUS_VALIDATOR_CHECKPOINT_H
