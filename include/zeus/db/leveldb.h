// ZEUS - LevelDB Backend
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// LevelDB implementation of the Database interface. Only available when
// built with ZEUS_USE_LEVELDB.

#ifndef ZEUS_DB_LEVELDB_H
#define ZEUS_DB_LEVELDB_H

#include "zeus/db/database.h"

#ifdef ZEUS_USE_LEVELDB

#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/write_batch.h>

namespace zeus {
namespace db {

/// Map a leveldb::Status onto ours
Status FromLevelDB(const leveldb::Status& s);

class LevelDBIterator : public Iterator {
public:
    explicit LevelDBIterator(leveldb::Iterator* iter) : iter_(iter) {}
    
    bool Valid() const override { return iter_->Valid(); }
    void SeekToFirst() override { iter_->SeekToFirst(); }
    void Seek(const Slice& target) override {
        iter_->Seek(leveldb::Slice(target.data(), target.size()));
    }
    void Next() override { iter_->Next(); }
    
    Slice key() const override {
        leveldb::Slice k = iter_->key();
        return Slice(k.data(), k.size());
    }
    
    Slice value() const override {
        leveldb::Slice v = iter_->value();
        return Slice(v.data(), v.size());
    }
    
    Status status() const override { return FromLevelDB(iter_->status()); }

private:
    std::unique_ptr<leveldb::Iterator> iter_;
};

class LevelDBDatabase : public Database {
public:
    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;
    
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache)
        : db_(db), cache_(cache) {}
    
    ~LevelDBDatabase() override {
        // The DB references the cache; close it first
        db_.reset();
        cache_.reset();
    }
    
    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;
    
    const char* Backend() const override { return "leveldb"; }

private:
    std::unique_ptr<leveldb::DB> db_;
    std::unique_ptr<leveldb::Cache> cache_;
};

} // namespace db
} // namespace zeus

#endif // ZEUS_USE_LEVELDB

#endif // ZEUS_DB_LEVELDB_H
