// ZEUS - Database Implementation
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include "zeus/db/database.h"
#include "zeus/db/leveldb.h"
#include "zeus/util/logging.h"

#include <system_error>

namespace zeus {
namespace db {

std::string Status::ToString() const {
    if (ok()) return "OK";
    std::string result;
    switch (code_) {
        case NOT_FOUND:        result = "NotFound: "; break;
        case CORRUPTION:       result = "Corruption: "; break;
        case NOT_SUPPORTED:    result = "NotSupported: "; break;
        case INVALID_ARGUMENT: result = "InvalidArgument: "; break;
        case IO_ERROR:         result = "IOError: "; break;
        default:               result = "Unknown: "; break;
    }
    return result + message_;
}

// ============================================================================
// MemoryDatabase
// ============================================================================

namespace {

class MemoryIterator : public Iterator {
public:
    explicit MemoryIterator(std::map<std::string, std::string> snapshot)
        : data_(std::move(snapshot)), iter_(data_.end()) {}
    
    bool Valid() const override { return iter_ != data_.end(); }
    void SeekToFirst() override { iter_ = data_.begin(); }
    void Seek(const Slice& target) override { iter_ = data_.lower_bound(target.ToString()); }
    void Next() override {
        if (iter_ != data_.end()) ++iter_;
    }
    Slice key() const override { return Slice(iter_->first); }
    Slice value() const override { return Slice(iter_->second); }
    Status status() const override { return Status::Ok(); }

private:
    std::map<std::string, std::string> data_;
    std::map<std::string, std::string>::const_iterator iter_;
};

} // namespace

Status MemoryDatabase::Get(const ReadOptions&, const Slice& key, std::string* value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key.ToString());
    if (it == data_.end()) {
        return Status::NotFound();
    }
    *value = it->second;
    return Status::Ok();
}

Status MemoryDatabase::Put(const WriteOptions&, const Slice& key, const Slice& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_[key.ToString()] = value.ToString();
    return Status::Ok();
}

Status MemoryDatabase::Delete(const WriteOptions&, const Slice& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.erase(key.ToString());
    return Status::Ok();
}

Status MemoryDatabase::Write(const WriteOptions&, WriteBatch* batch) {
    std::lock_guard<std::mutex> lock(mutex_);
    batch->Iterate([this](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            data_[key] = *value;
        } else {
            data_.erase(key);
        }
    });
    return Status::Ok();
}

std::unique_ptr<Iterator> MemoryDatabase::NewIterator(const ReadOptions&) {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::make_unique<MemoryIterator>(data_);
}

size_t MemoryDatabase::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

void MemoryDatabase::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.clear();
}

// ============================================================================
// LevelDB
// ============================================================================

#ifdef ZEUS_USE_LEVELDB

Status FromLevelDB(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    if (s.IsNotSupportedError()) return Status::NotSupported(s.ToString());
    if (s.IsInvalidArgument()) return Status::InvalidArgument(s.ToString());
    return Status::IOError(s.ToString());
}

Status LevelDBDatabase::Get(const ReadOptions& options, const Slice& key, std::string* value) {
    leveldb::ReadOptions lo;
    lo.verify_checksums = options.verify_checksums;
    lo.fill_cache = options.fill_cache;
    return FromLevelDB(db_->Get(lo, leveldb::Slice(key.data(), key.size()), value));
}

Status LevelDBDatabase::Put(const WriteOptions& options, const Slice& key, const Slice& value) {
    leveldb::WriteOptions lo;
    lo.sync = options.sync;
    return FromLevelDB(db_->Put(lo, leveldb::Slice(key.data(), key.size()),
                                leveldb::Slice(value.data(), value.size())));
}

Status LevelDBDatabase::Delete(const WriteOptions& options, const Slice& key) {
    leveldb::WriteOptions lo;
    lo.sync = options.sync;
    return FromLevelDB(db_->Delete(lo, leveldb::Slice(key.data(), key.size())));
}

Status LevelDBDatabase::Write(const WriteOptions& options, WriteBatch* batch) {
    leveldb::WriteBatch lb;
    batch->Iterate([&lb](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            lb.Put(key, *value);
        } else {
            lb.Delete(key);
        }
    });
    leveldb::WriteOptions lo;
    lo.sync = options.sync;
    return FromLevelDB(db_->Write(lo, &lb));
}

std::unique_ptr<Iterator> LevelDBDatabase::NewIterator(const ReadOptions& options) {
    leveldb::ReadOptions lo;
    lo.verify_checksums = options.verify_checksums;
    lo.fill_cache = options.fill_cache;
    return std::make_unique<LevelDBIterator>(db_->NewIterator(lo));
}

#endif // ZEUS_USE_LEVELDB

// ============================================================================
// Factory Functions
// ============================================================================

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options)
{
#ifdef ZEUS_USE_LEVELDB
    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
    lo.error_if_exists = options.error_if_exists;
    lo.paranoid_checks = options.paranoid_checks;
    lo.write_buffer_size = options.write_buffer_size;
    lo.max_open_files = options.max_open_files;
    lo.compression = options.compression ?
        leveldb::kSnappyCompression : leveldb::kNoCompression;
    
    leveldb::Cache* cache = nullptr;
    if (options.block_cache_size > 0) {
        cache = leveldb::NewLRUCache(options.block_cache_size);
        lo.block_cache = cache;
    }
    
    if (options.create_if_missing) {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
    }
    
    leveldb::DB* raw = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path.string(), &raw);
    if (!s.ok()) {
        delete cache;
        LOG_ERROR(util::LogCategory::DB) << "Failed to open " << path.string() << ": " << s.ToString();
        return {FromLevelDB(s), nullptr};
    }
    
    LOG_INFO(util::LogCategory::DB) << "Opened LevelDB store at " << path.string();
    return {Status::Ok(), std::make_unique<LevelDBDatabase>(raw, cache)};
#else
    if (options.create_if_missing) {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec) {
            return {Status::IOError(ec.message()), nullptr};
        }
    }
    LOG_WARN(util::LogCategory::DB) << "Built without LevelDB; checkpoints at "
                                    << path.string() << " are kept in memory only";
    return {Status::Ok(), std::make_unique<MemoryDatabase>()};
#endif
}

Status DestroyDatabase(const std::filesystem::path& path) {
#ifdef ZEUS_USE_LEVELDB
    return FromLevelDB(leveldb::DestroyDB(path.string(), leveldb::Options()));
#else
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
        return Status::IOError(ec.message());
    }
    return Status::Ok();
#endif
}

} // namespace db
} // namespace zeus
