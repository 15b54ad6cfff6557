// RELIQUARY - Database Abstraction Layer
// Copyright (c) 2024 RELIQUARY Developers
// MIT License
//
// Abstract key-value store under the governance ledger. The LevelDB
// backend is used when built with RELIQUARY_USE_LEVELDB; otherwise an
// in-memory store stands in.

#ifndef RELIQUARY_DB_DATABASE_H
#define RELIQUARY_DB_DATABASE_H

#include "reliquary/core/serialize.h"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace reliquary {
namespace db {

// ============================================================================
// Database Status
// ============================================================================

/**
 * Status returned by database operations.
 */
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
    
private:
    Code code_;
    std::string message_;
    
public:
    Status() : code_(OK) {}
    Status(Code code, const std::string& msg = "") : code_(code), message_(msg) {}
    
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
};

// ============================================================================
// Slice
// ============================================================================

/**
 * Non-owning reference to a byte range. The underlying buffer must
 * outlive the Slice.
 */
class Slice {
private:
    const char* data_;
    size_t size_;
    
public:
    Slice() : data_(""), size_(0) {}
    Slice(const char* d, size_t n) : data_(d), size_(n) {}
    Slice(const std::string& s) : data_(s.data()), size_(s.size()) {}
    Slice(const char* s) : data_(s), size_(std::strlen(s)) {}
    
    const char* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    
    char operator[](size_t n) const { return data_[n]; }
    
    std::string ToString() const { return std::string(data_, size_); }
    
    bool starts_with(const Slice& prefix) const {
        return size_ >= prefix.size_ && std::memcmp(data_, prefix.data_, prefix.size_) == 0;
    }
    
    bool operator==(const Slice& b) const {
        return size_ == b.size_ && std::memcmp(data_, b.data_, size_) == 0;
    }
    
    bool operator!=(const Slice& b) const { return !(*this == b); }
};

// ============================================================================
// Options
// ============================================================================

struct Options {
    bool create_if_missing = true;
    bool error_if_exists = false;
    bool paranoid_checks = false;
    
    /// Write buffer size (default 4MB)
    size_t write_buffer_size = 4 * 1024 * 1024;
    
    int max_open_files = 1000;
    
    /// LRU block cache (default 8MB)
    size_t block_cache_size = 8 * 1024 * 1024;
};

struct ReadOptions {
    bool verify_checksums = false;
    bool fill_cache = true;
};

struct WriteOptions {
    /// Sync write to disk before returning
    bool sync = false;
};

// ============================================================================
// WriteBatch
// ============================================================================

/**
 * A batch of write operations applied atomically.
 */
class WriteBatch {
private:
    std::vector<std::pair<std::string, std::optional<std::string>>> operations_;
    
public:
    WriteBatch() = default;
    
    void Put(const Slice& key, const Slice& value) {
        operations_.emplace_back(key.ToString(), value.ToString());
    }
    
    void Delete(const Slice& key) {
        operations_.emplace_back(key.ToString(), std::nullopt);
    }
    
    void Clear() { operations_.clear(); }
    
    size_t Count() const { return operations_.size(); }
    
    bool Empty() const { return operations_.empty(); }
    
    /// Visit operations in insertion order; a nullopt value is a delete
    template<typename Func>
    void Iterate(Func&& func) const {
        for (const auto& [key, value] : operations_) {
            func(key, value);
        }
    }
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
    
    Status Get(const Slice& key, std::string* value) {
        return Get(ReadOptions(), key, value);
    }
    
    virtual Status Put(const WriteOptions& options, const Slice& key, const Slice& value) = 0;
    
    Status Put(const Slice& key, const Slice& value) {
        return Put(WriteOptions(), key, value);
    }
    
    virtual Status Delete(const WriteOptions& options, const Slice& key) = 0;
    
    Status Delete(const Slice& key) {
        return Delete(WriteOptions(), key);
    }
    
    /// Apply a batch of writes atomically
    virtual Status Write(const WriteOptions& options, WriteBatch* batch) = 0;
    
    Status Write(WriteBatch* batch) {
        return Write(WriteOptions(), batch);
    }
    
    virtual std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) = 0;
    
    std::unique_ptr<Iterator> NewIterator() {
        return NewIterator(ReadOptions());
    }
    
    virtual bool Exists(const Slice& key) {
        std::string value;
        return Get(key, &value).ok();
    }
    
    /// Human readable backend statistics (may be empty)
    virtual std::string GetStats() const { return ""; }
};

// ============================================================================
// Database Factory Functions
// ============================================================================

/**
 * Open a database at the specified path.
 * @return Pair of (status, database pointer); the pointer is null on error
 */
std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options = Options());

/**
 * Delete all data stored at path.
 */
Status DestroyDatabase(const std::filesystem::path& path);

/// Name of the compiled-in persistent backend ("leveldb" or "memory")
const char* BackendName();

// ============================================================================
// Serialization Helpers
// ============================================================================

template<typename T>
std::string SerializeToString(const T& obj) {
    DataStream ss;
    ss << obj;
    return ss.str();
}

/**
 * Decode obj from data. Fails on truncated input and on trailing bytes.
 */
template<typename T>
bool DeserializeFromString(const std::string& data, T& obj) {
    try {
        DataStream ss(data.data(), data.size());
        ss >> obj;
        return ss.empty();
    } catch (const std::ios_base::failure&) {
        return false;
    }
}

// ============================================================================
// Key Prefixes
// ============================================================================

namespace prefix {
    constexpr char AGENT = 'a';           // agent id -> agent record
    constexpr char PROPOSAL = 'p';        // proposal id -> proposal
    constexpr char VOTE = 'v';            // proposal id + agent id -> vote record
    constexpr char DECISION = 'd';        // request id -> consensus decision
    constexpr char META = 'm';            // name -> engine metadata
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
} // namespace reliquary

#endif // RELIQUARY_DB_DATABASE_H
