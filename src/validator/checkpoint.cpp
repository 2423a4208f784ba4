// ZEUS - Validator Checkpoints Implementation
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include "zeus/validator/checkpoint.h"
#include "zeus/util/json.h"
#include "zeus/util/logging.h"

namespace zeus {
namespace validator {

namespace {
const char* const EPOCH_KEY = "epoch";
}

db::Status CheckpointStore::Save(const std::vector<MinerRecord>& records, uint64_t epoch) {
    ZEUS_LOG_TIMER(util::LogCategory::DB, "checkpoint save");
    
    db::WriteBatch batch;
    for (const MinerRecord& r : records) {
        batch.Put(db::MakeKey(db::prefix::MINER_RECORD, r.minerId), db::SerializeToString(r));
    }
    batch.Put(db::MakeKey(db::prefix::META, EPOCH_KEY), db::SerializeToString(epoch));
    
    db::Status s = db_.Write(&batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Checkpoint failed: " << s.ToString();
        return s;
    }
    LOG_DEBUG(util::LogCategory::DB) << "Checkpointed " << records.size() << " miner records (epoch "
                                     << epoch << ", " << db_.Backend() << ")";
    return s;
}

db::Status CheckpointStore::Load(std::vector<MinerRecord>& records) {
    const std::string start = db::MakeKey(db::prefix::MINER_RECORD);
    std::unique_ptr<db::Iterator> it = db_.NewIterator();
    
    size_t skipped = 0;
    for (it->Seek(start); it->Valid() && it->key().starts_with(start); it->Next()) {
        MinerRecord record;
        if (!db::DeserializeFromString(it->value().ToString(), record)) {
            ++skipped;
            LOG_WARN(util::LogCategory::DB) << "Skipping undecodable record for '"
                                            << it->key().ToString().substr(1) << "'";
            continue;
        }
        records.push_back(std::move(record));
    }
    
    db::Status s = it->status();
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Checkpoint load failed: " << s.ToString();
        return s;
    }
    LOG_INFO(util::LogCategory::DB) << "Restored " << records.size() << " miner records"
                                    << (skipped ? " (" + std::to_string(skipped) + " skipped)" : "");
    return s;
}

uint64_t CheckpointStore::LoadEpoch() {
    std::string value;
    uint64_t epoch = 0;
    if (db_.Get(db::MakeKey(db::prefix::META, EPOCH_KEY), &value).ok()) {
        if (!db::DeserializeFromString(value, epoch)) {
            LOG_WARN(util::LogCategory::DB) << "Undecodable epoch counter; starting at 0";
            epoch = 0;
        }
    }
    return epoch;
}

db::Status CheckpointStore::SaveWeights(const WeightVector& weights) {
    return db_.Put(db::MakeKey(db::prefix::WEIGHTS), weights.ToJSON().ToJSON());
}

} // namespace validator
} // namespace zeus
