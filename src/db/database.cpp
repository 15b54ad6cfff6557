// RELIQUARY - Database Implementation
// Copyright (c) 2024 RELIQUARY Developers
// MIT License

#include "reliquary/db/database.h"
#include "reliquary/db/leveldb.h"
#include "reliquary/util/logging.h"

#include <system_error>

namespace reliquary {
namespace db {

// ============================================================================
// Status
// ============================================================================

std::string Status::ToString() const {
    if (ok()) return "OK";
    std::string result;
    switch (code_) {
        case NOT_FOUND: result = "NotFound: "; break;
        case CORRUPTION: result = "Corruption: "; break;
        case NOT_SUPPORTED: result = "NotSupported: "; break;
        case INVALID_ARGUMENT: result = "InvalidArgument: "; break;
        case IO_ERROR: result = "IOError: "; break;
        default: result = "Unknown: "; break;
    }
    return result + message_;
}

// ============================================================================
// MemoryDatabase
// ============================================================================

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

// ============================================================================
// LevelDB status mapping
// ============================================================================

#ifdef RELIQUARY_USE_LEVELDB
Status FromLevelDB(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    if (s.IsNotSupportedError()) return Status::NotSupported(s.ToString());
    if (s.IsInvalidArgument()) return Status::InvalidArgument(s.ToString());
    return Status::IOError(s.ToString());
}
#endif

// ============================================================================
// Database Factory Functions
// ============================================================================

const char* BackendName() {
#ifdef RELIQUARY_USE_LEVELDB
    return "leveldb";
#else
    return "memory";
#endif
}

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options)
{
#ifdef RELIQUARY_USE_LEVELDB
    if (options.create_if_missing) {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec) {
            return {Status::IOError("cannot create " + path.string() + ": " + ec.message()),
                    nullptr};
        }
    }
    
    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
    lo.error_if_exists = options.error_if_exists;
    lo.paranoid_checks = options.paranoid_checks;
    lo.write_buffer_size = options.write_buffer_size;
    lo.max_open_files = options.max_open_files;
    
    leveldb::Cache* cache = nullptr;
    if (options.block_cache_size > 0) {
        cache = leveldb::NewLRUCache(options.block_cache_size);
        lo.block_cache = cache;
    }
    
    leveldb::DB* raw = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path.string(), &raw);
    if (!s.ok()) {
        delete cache;
        LOG_ERROR(util::LogCategory::DB) << "Failed to open " << path.string()
                                         << ": " << s.ToString();
        return {FromLevelDB(s), nullptr};
    }
    
    LOG_DEBUG(util::LogCategory::DB) << "Opened LevelDB at " << path.string();
    return {Status::Ok(), std::make_unique<LevelDBDatabase>(raw, cache)};
#else
    LOG_WARN(util::LogCategory::DB) << "Built without LevelDB; ledger for "
                                    << path.string() << " is held in memory only";
    return {Status::Ok(), std::make_unique<MemoryDatabase>()};
#endif
}

Status DestroyDatabase(const std::filesystem::path& path) {
#ifdef RELIQUARY_USE_LEVELDB
    leveldb::Status s = leveldb::DestroyDB(path.string(), leveldb::Options());
    if (!s.ok()) {
        return FromLevelDB(s);
    }
    return Status::Ok();
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
} // namespace reliquary
