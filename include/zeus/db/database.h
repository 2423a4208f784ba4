// ZEUS - Database Abstraction Layer
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// Key-value store interface used for validator checkpoints. The LevelDB
// backend is compiled in with ZEUS_USE_LEVELDB; otherwise OpenDatabase
// returns an in-memory store.

#ifndef ZEUS_DB_DATABASE_H
#define ZEUS_DB_DATABASE_H

#include "zeus/core/serialize.h"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <exception>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace zeus {
namespace db {

// ============================================================================
// Status
// ============================================================================

class Status {
public:
    enum Code {
        OK = 0,
        NOT_FOUND = 1,
        CORRUPTION = 2,
        NOT_SUPPORTED = 3,
        INVALID_ARGUMENT = 4,
        IO_ERROR = 5,
    };
    
    Status() : code_(OK) {}
    Status(Code code, std::string msg = "") : code_(code), message_(std::move(msg)) {}
    
    static Status Ok() { return Status(); }
    static Status NotFound(const std::string& msg = "") { return Status(NOT_FOUND, msg); }
    static Status Corruption(const std::string& msg = "") { return Status(CORRUPTION, msg); }
    static Status NotSupported(const std::string& msg = "") { return Status(NOT_SUPPORTED, msg); }
    static Status InvalidArgument(const std::string& msg = "") { return Status(INVALID_ARGUMENT, msg); }
    static Status IOError(const std::string& msg = "") { return Status(IO_ERROR, msg); }
    
    bool ok() const { return code_ == OK; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }
    bool IsCorruption() const { return code_ == CORRUPTION; }
    bool IsIOError() const { return code_ == IO_ERROR; }
    
    Code code() const { return code_; }
    const std::string& message() const { return message_; }
    
    std::string ToString() const;

private:
    Code code_;
    std::string message_;
};

// ============================================================================
// Slice
// ============================================================================

/// Non-owning view of a byte range
class Slice {
public:
    Slice() : data_(""), size_(0) {}
    Slice(const char* d, size_t n) : data_(d), size_(n) {}
    Slice(const std::string& s) : data_(s.data()), size_(s.size()) {}
    Slice(const std::vector<uint8_t>& v)
        : data_(reinterpret_cast<const char*>(v.data())), size_(v.size()) {}
    Slice(const char* s) : data_(s), size_(std::strlen(s)) {}
    
    const char* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    
    char operator[](size_t n) const { return data_[n]; }
    
    std::string ToString() const { return std::string(data_, size_); }
    
    bool starts_with(const Slice& prefix) const {
        return size_ >= prefix.size_ && std::memcmp(data_, prefix.data_, prefix.size_) == 0;
    }
    
    int compare(const Slice& b) const {
        size_t minLen = std::min(size_, b.size_);
        int r = minLen == 0 ? 0 : std::memcmp(data_, b.data_, minLen);
        if (r == 0) {
            if (size_ < b.size_) r = -1;
            else if (size_ > b.size_) r = +1;
        }
        return r;
    }
    
    bool operator==(const Slice& b) const { return compare(b) == 0; }
    bool operator!=(const Slice& b) const { return !(*this == b); }

private:
    const char* data_;
    size_t size_;
};

// ============================================================================
// Options
// ============================================================================

struct Options {
    bool create_if_missing = true;
    bool error_if_exists = false;
    bool paranoid_checks = false;
    size_t write_buffer_size = 4 * 1024 * 1024;
    int max_open_files = 256;
    size_t block_cache_size = 8 * 1024 * 1024;
    bool compression = true;
};

struct ReadOptions {
    bool verify_checksums = false;
    bool fill_cache = true;
};

struct WriteOptions {
    /// fsync before returning
    bool sync = false;
};

// ============================================================================
// WriteBatch
// ============================================================================

/// Puts and deletes applied atomically by Database::Write
class WriteBatch {
public:
    void Put(const Slice& key, const Slice& value) {
        operations_.emplace_back(key.ToString(), value.ToString());
    }
    
    void Delete(const Slice& key) {
        operations_.emplace_back(key.ToString(), std::nullopt);
    }
    
    void Clear() { operations_.clear(); }
    size_t Count() const { return operations_.size(); }
    bool Empty() const { return operations_.empty(); }
    
    template<typename Func>
    void Iterate(Func&& func) const {
        for (const auto& [key, value] : operations_) {
            func(key, value);
        }
    }

private:
    std::vector<std::pair<std::string, std::optional<std::string>>> operations_;
};

// ============================================================================
// Iterator
// ============================================================================

class Iterator {
public:
    virtual ~Iterator() = default;
    
    virtual bool Valid() const = 0;
    virtual void SeekToFirst() = 0;
    /// Position at the first key >= target
    virtual void Seek(const Slice& target) = 0;
    virtual void Next() = 0;
    virtual Slice key() const = 0;
    virtual Slice value() const = 0;
    virtual Status status() const = 0;
};

// ============================================================================
// Database
// ============================================================================

class Database {
public:
    virtual ~Database() = default;
    
    virtual Status Get(const ReadOptions& options, const Slice& key, std::string* value) = 0;
    virtual Status Put(const WriteOptions& options, const Slice& key, const Slice& value) = 0;
    virtual Status Delete(const WriteOptions& options, const Slice& key) = 0;
    virtual Status Write(const WriteOptions& options, WriteBatch* batch) = 0;
    virtual std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) = 0;
    
    Status Get(const Slice& key, std::string* value) { return Get(ReadOptions(), key, value); }
    Status Put(const Slice& key, const Slice& value) { return Put(WriteOptions(), key, value); }
    Status Delete(const Slice& key) { return Delete(WriteOptions(), key); }
    Status Write(WriteBatch* batch) { return Write(WriteOptions(), batch); }
    std::unique_ptr<Iterator> NewIterator() { return NewIterator(ReadOptions()); }
    
    virtual bool Exists(const Slice& key) {
        std::string value;
        return Get(key, &value).ok();
    }
    
    /// Backend name for log lines ("leveldb", "memory")
    virtual const char* Backend() const = 0;
};

// ============================================================================
// In-Memory Database
// ============================================================================

/// std::map store; used in tests and when LevelDB is not compiled in
class MemoryDatabase : public Database {
public:
    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;
    
    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    
    /// Iterates over a snapshot taken at creation
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;
    
    const char* Backend() const override { return "memory"; }
    
    size_t Size() const;
    void Clear();

private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Factory Functions
// ============================================================================

/// Open (or create) the store at path
std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options = Options());

/// Delete all data at path
Status DestroyDatabase(const std::filesystem::path& path);

// ============================================================================
// Serialization Helpers
// ============================================================================

template<typename T>
std::string SerializeToString(const T& obj) {
    DataStream ss;
    Serialize(ss, obj);
    return ss.str();
}

template<typename T>
bool DeserializeFromString(const std::string& data, T& obj) {
    try {
        DataStream ss(reinterpret_cast<const uint8_t*>(data.data()), data.size());
        Unserialize(ss, obj);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// ============================================================================
// Key Prefixes
// ============================================================================

namespace prefix {
    constexpr char MINER_RECORD = 'm';    // miner id -> MinerRecord
    constexpr char WEIGHTS = 'w';         // -> last published weight vector (json)
    constexpr char META = 'M';            // name -> counter
}

inline std::string MakeKey(char prefix, const Slice& key) {
    std::string result;
    result.reserve(1 + key.size());
    result.push_back(prefix);
    result.append(key.data(), key.size());
    return result;
}

inline std::string MakeKey(char prefix) {
    return std::string(1, prefix);
}

} // namespace db
} // namespace zeus

#endif // ZEUS_DB_DATABASE_H
