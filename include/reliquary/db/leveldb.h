// RELIQUARY - LevelDB Wrapper
// Copyright (c) 2024 RELIQUARY Developers
// MIT License
//
// LevelDB and in-memory implementations of the database interface.

#ifndef RELIQUARY_DB_LEVELDB_H
#define RELIQUARY_DB_LEVELDB_H

#include "reliquary/db/database.h"

#include <map>
#include <mutex>

#ifdef RELIQUARY_USE_LEVELDB
#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/write_batch.h>
#endif

namespace reliquary {
namespace db {

#ifdef RELIQUARY_USE_LEVELDB

// ============================================================================
// LevelDB Backend
// ============================================================================

/// Map a leveldb::Status onto db::Status
Status FromLevelDB(const leveldb::Status& s);

class LevelDBIterator : public Iterator {
private:
    std::unique_ptr<leveldb::Iterator> iter_;
    
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
};

class LevelDBDatabase : public Database {
private:
    // Declared before db_ so the DB is closed first
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<leveldb::DB> db_;
    
    static leveldb::ReadOptions ToLevelDB(const ReadOptions& opts) {
        leveldb::ReadOptions lo;
        lo.verify_checksums = opts.verify_checksums;
        lo.fill_cache = opts.fill_cache;
        return lo;
    }
    
    static leveldb::WriteOptions ToLevelDB(const WriteOptions& opts) {
        leveldb::WriteOptions lo;
        lo.sync = opts.sync;
        return lo;
    }
    
public:
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache)
        : cache_(cache), db_(db) {}
    
    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override {
        return FromLevelDB(db_->Get(ToLevelDB(options),
                                    leveldb::Slice(key.data(), key.size()), value));
    }
    
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override {
        return FromLevelDB(db_->Put(ToLevelDB(options),
                                    leveldb::Slice(key.data(), key.size()),
                                    leveldb::Slice(value.data(), value.size())));
    }
    
    Status Delete(const WriteOptions& options, const Slice& key) override {
        return FromLevelDB(db_->Delete(ToLevelDB(options),
                                       leveldb::Slice(key.data(), key.size())));
    }
    
    Status Write(const WriteOptions& options, WriteBatch* batch) override {
        leveldb::WriteBatch lb;
        batch->Iterate([&lb](const std::string& key, const std::optional<std::string>& value) {
            if (value) {
                lb.Put(key, *value);
            } else {
                lb.Delete(key);
            }
        });
        return FromLevelDB(db_->Write(ToLevelDB(options), &lb));
    }
    
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override {
        return std::make_unique<LevelDBIterator>(db_->NewIterator(ToLevelDB(options)));
    }
    
    std::string GetStats() const override {
        std::string stats;
        db_->GetProperty("leveldb.stats", &stats);
        return stats;
    }
};

#endif // RELIQUARY_USE_LEVELDB

// ============================================================================
// In-Memory Database
// ============================================================================

/**
 * Map-backed database for tests and for builds without LevelDB.
 * Iterators work on a snapshot taken at creation.
 */
class MemoryDatabase : public Database {
private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;
    
public:
    MemoryDatabase() = default;
    
    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;
    
    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;
    
    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_.size();
    }
    
    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        data_.clear();
    }
};

class MemoryIterator : public Iterator {
private:
    std::map<std::string, std::string> data_;
    std::map<std::string, std::string>::const_iterator iter_;
    
public:
    explicit MemoryIterator(std::map<std::string, std::string> snapshot)
        : data_(std::move(snapshot)), iter_(data_.end()) {}
    
    bool Valid() const override { return iter_ != data_.end(); }
    void SeekToFirst() override { iter_ = data_.begin(); }
    void Seek(const Slice& target) override { iter_ = data_.lower_bound(target.ToString()); }
    void Next() override {
        if (iter_ != data_.end()) {
            ++iter_;
        }
    }
    
    Slice key() const override { return Slice(iter_->first); }
    Slice value() const override { return Slice(iter_->second); }
    Status status() const override { return Status::Ok(); }
};

} // namespace db
} // namespace reliquary

#endif // RELIQUARY_DB_LEVELDB_H
